#include "runtime/confirmation_prompter.hpp"

#include <istream>
#include <ostream>

namespace warden::runtime {

StreamConfirmationPrompter::StreamConfirmationPrompter(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::optional<std::string> StreamConfirmationPrompter::ask(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    return line;
}

}  // namespace warden::runtime
