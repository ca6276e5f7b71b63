#pragma once

#include <string>
#include <core/types.hpp>

class Config;

// Copy text with the platform clipboard tool: pbcopy, xclip or xsel, clip.
Result<void> copy_to_clipboard(const std::string& text);

// Open a URL. GH_BROWSER, BROWSER and the browser setting name a launcher
// command; without one the platform opener is used.
Result<void> open_in_browser(const std::string& url, const Config& config);
