#include "desktop.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <sstream>
#include <vector>
#include <fmt/format.h>

Result<void> copy_to_clipboard(const std::string& text) {
    std::string os = platform::os_name();

    std::vector<std::pair<std::string, std::vector<std::string>>> tools;
    if (os == "macos") {
        tools = {{"pbcopy", {}}};
    } else if (os == "windows") {
        tools = {{"clip", {}}};
    } else {
        tools = {
            {"xclip", {"-selection", "clipboard"}},
            {"xsel", {"--clipboard", "--input"}},
        };
    }

    for (const auto& [program, args] : tools) {
        int rc = platform::run_with_input(program, args, text);
        ghx_logf("clipboard: {} exited {}", program, rc);
        if (rc == 0) return Result<void>::Ok();
    }
    return Result<void>::Err(fmt::format("failed to copy to clipboard ({} not available)",
                                         tools.front().first));
}

// "firefox --new-window" -> program + args
static std::vector<std::string> split_command(const std::string& cmd) {
    std::vector<std::string> words;
    std::istringstream in(cmd);
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

Result<void> open_in_browser(const std::string& url, const Config& config) {
    std::string launcher;
    if (auto v = config.env()("GH_BROWSER")) {
        launcher = *v;
    } else if (auto b = config.browser()) {
        launcher = *b;
    } else if (auto v = config.env()("BROWSER")) {
        launcher = *v;
    }

    std::string program;
    std::vector<std::string> args;
    if (!trimmed(launcher).empty()) {
        auto words = split_command(launcher);
        program = words.front();
        args.assign(words.begin() + 1, words.end());
    } else {
        std::string os = platform::os_name();
        if (os == "macos") {
            program = "open";
        } else if (os == "windows") {
            program = "cmd";
            args = {"/c", "start", ""};
        } else {
            program = "xdg-open";
        }
    }
    args.push_back(url);

    int rc = platform::run(program, args);
    ghx_logf("browser: {} exited {}", program, rc);
    if (rc != 0) {
        return Result<void>::Err(fmt::format("failed to open {} with {}", url, program));
    }
    return Result<void>::Ok();
}
