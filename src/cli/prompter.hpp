#pragma once

#include <string>
#include <vector>
#include <iosfwd>
#include <core/types.hpp>

class Config;

// Interactive questions. Every call returns Cancelled if input ends.
class Prompter {
public:
    virtual ~Prompter() = default;

    // Index into options.
    virtual Result<size_t> select(const std::string& message,
                                  const std::vector<std::string>& options,
                                  size_t default_index = 0) = 0;

    virtual Result<std::string> input(const std::string& message,
                                      const std::string& default_value = "") = 0;

    // Input without echo.
    virtual Result<std::string> password(const std::string& message) = 0;

    virtual Result<bool> confirm(const std::string& message, bool default_value) = 0;
};

// Numbered-menu prompter over a pair of streams (stdin and stderr in the CLI).
class TerminalPrompter : public Prompter {
public:
    TerminalPrompter(std::istream& in, std::ostream& out, bool no_echo_password = true)
        : in_(in), out_(out), no_echo_(no_echo_password) {}

    Result<size_t> select(const std::string& message,
                          const std::vector<std::string>& options,
                          size_t default_index = 0) override;
    Result<std::string> input(const std::string& message,
                              const std::string& default_value = "") override;
    Result<std::string> password(const std::string& message) override;
    Result<bool> confirm(const std::string& message, bool default_value) override;

private:
    Result<std::string> read_line();

    std::istream& in_;
    std::ostream& out_;
    bool no_echo_;
};

// Prompting needs terminals on stdin and stdout, GH_PROMPT_DISABLED unset and
// the prompt setting not "disabled".
bool can_prompt(const Config& config, bool stdin_tty, bool stdout_tty);
