#include "session/confirmation_manager.hpp"

#include <algorithm>
#include <cctype>

namespace warden::session {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](const unsigned char c) {
        return std::isspace(c);
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](const unsigned char c) {
                          return std::isspace(c);
                      }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ConfirmationManager::ConfirmationManager()
    : destructive_verbs_{"delete", "remove", "rm",       "uninstall", "drop",   "destroy",
                         "format", "wipe",   "clean",    "purge",     "truncate",
                         "overwrite", "replace", "modify", "edit",    "update"} {}

bool ConfirmationManager::requires_confirmation(const std::string& operation,
                                                const std::string& target) const {
    if (!require_confirmation_.load()) {
        return false;
    }

    const std::string op = lowercase(operation);
    for (const auto& verb : destructive_verbs_) {
        if (op.find(verb) != std::string::npos) {
            return true;
        }
    }

    const std::string path = lowercase(target);
    for (const char* system_dir : {"/etc/", "/sys/", "/dev/", "/proc/"}) {
        if (path.find(system_dir) != std::string::npos) {
            return true;
        }
    }

    for (const char* extension : {".db", ".sql", ".key", ".pem", ".crt", ".conf", ".config"}) {
        if (ends_with(path, extension)) {
            return true;
        }
    }
    return false;
}

std::string ConfirmationManager::get_confirmation_prompt(const std::string& operation,
                                                         const std::string& target) const {
    return "WARNING: This operation may be destructive!\n\n"
           "Operation: " + operation + "\n"
           "Target: " + target + "\n\n"
           "Are you sure you want to proceed? (type 'yes' to confirm): ";
}

bool ConfirmationManager::validate_confirmation(const std::string& response) const {
    return lowercase(trim(response)) == "yes";
}

void ConfirmationManager::set_require_confirmation(const bool require) {
    require_confirmation_.store(require);
}

}  // namespace warden::session
