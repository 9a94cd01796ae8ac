#pragma once

#include <atomic>
#include <set>
#include <string>

namespace warden::session {

// Human-in-the-loop gate for destructive operations. Pure: it builds the
// prompt and checks the answer, asking is left to a ConfirmationPrompter.
class ConfirmationManager {
public:
    ConfirmationManager();

    bool requires_confirmation(const std::string& operation, const std::string& target) const;
    std::string get_confirmation_prompt(const std::string& operation,
                                        const std::string& target) const;
    // Only "yes", ignoring case and surrounding whitespace.
    bool validate_confirmation(const std::string& response) const;

    void set_require_confirmation(bool require);
    bool require_confirmation() const { return require_confirmation_.load(); }

private:
    std::set<std::string> destructive_verbs_;
    std::atomic_bool require_confirmation_{true};
};

}  // namespace warden::session
