#include "prompter.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <istream>
#include <ostream>
#include <memory>
#include <fmt/format.h>

Result<std::string> TerminalPrompter::read_line() {
    std::string answer;
    if (!std::getline(in_, answer)) {
        return Result<std::string>::Err(ErrorKind::Cancelled, "input closed");
    }
    if (!answer.empty() && answer.back() == '\r') answer.pop_back();
    return Result<std::string>::Ok(answer);
}

Result<size_t> TerminalPrompter::select(const std::string& message,
                                        const std::vector<std::string>& options,
                                        size_t default_index) {
    if (options.empty()) {
        return Result<size_t>::Err(ErrorKind::Validation, "nothing to choose from");
    }
    if (default_index >= options.size()) default_index = 0;

    out_ << theme::bold("? " + message) << "\n";
    for (size_t i = 0; i < options.size(); i++) {
        out_ << fmt::format("  {}) {}\n", i + 1, options[i]);
    }

    for (;;) {
        out_ << fmt::format("  Choice [{}]: ", default_index + 1);
        out_.flush();

        auto line = read_line();
        if (line.is_err()) return Result<size_t>::From(line);

        std::string answer = trimmed(line.value);
        if (answer.empty()) return Result<size_t>::Ok(default_index);

        bool numeric = answer.find_first_not_of("0123456789") == std::string::npos;
        if (numeric && answer.size() < 9) {
            size_t n = std::stoul(answer);
            if (n >= 1 && n <= options.size()) return Result<size_t>::Ok(n - 1);
        }
        out_ << theme::warn(fmt::format("enter a number between 1 and {}", options.size()));
    }
}

Result<std::string> TerminalPrompter::input(const std::string& message,
                                            const std::string& default_value) {
    std::string suffix = default_value.empty() ? " " : " (" + default_value + ") ";
    out_ << theme::bold("? " + message) << suffix;
    out_.flush();

    auto line = read_line();
    if (line.is_err()) return line;

    std::string answer = trimmed(line.value);
    return Result<std::string>::Ok(answer.empty() ? default_value : answer);
}

Result<std::string> TerminalPrompter::password(const std::string& message) {
    out_ << theme::bold("? " + message) << " ";
    out_.flush();

    std::unique_ptr<platform::NoEchoGuard> guard;
    if (no_echo_) guard = std::make_unique<platform::NoEchoGuard>();

    auto line = read_line();
    guard.reset();
    out_ << "\n";
    if (line.is_err()) return line;
    return Result<std::string>::Ok(trimmed(line.value));
}

Result<bool> TerminalPrompter::confirm(const std::string& message, bool default_value) {
    for (;;) {
        out_ << theme::bold("? " + message) << (default_value ? " (Y/n) " : " (y/N) ");
        out_.flush();

        auto line = read_line();
        if (line.is_err()) return Result<bool>::From(line);

        std::string answer = to_lower(trimmed(line.value));
        if (answer.empty()) return Result<bool>::Ok(default_value);
        if (answer == "y" || answer == "yes") return Result<bool>::Ok(true);
        if (answer == "n" || answer == "no") return Result<bool>::Ok(false);
    }
}

bool can_prompt(const Config& config, bool stdin_tty, bool stdout_tty) {
    if (!stdin_tty || !stdout_tty) return false;
    if (config.env()("GH_PROMPT_DISABLED")) return false;
    return config.prompt_enabled();
}
