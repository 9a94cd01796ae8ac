#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace warden::runtime {

// Asks a human. nullopt means no answer could be read.
class ConfirmationPrompter {
public:
    virtual ~ConfirmationPrompter() = default;
    virtual std::optional<std::string> ask(const std::string& prompt) = 0;
};

// Writes the prompt to out and reads one line from in.
class StreamConfirmationPrompter : public ConfirmationPrompter {
public:
    StreamConfirmationPrompter(std::istream& in, std::ostream& out);

    std::optional<std::string> ask(const std::string& prompt) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace warden::runtime
