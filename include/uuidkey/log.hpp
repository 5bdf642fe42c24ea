#pragma once

#include <string>

namespace uuidkey::log {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// True when stderr is a TTY and UUIDKEY_NO_COLOR is not set, unless overridden.
bool ColorsEnabled();
void SetColorsEnabled(bool enabled);

// Debug output is off unless UUIDKEY_DEBUG is set, unless overridden.
bool DebugEnabled();
void SetDebugEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color);

void Warn(const std::string& message);
void Debug(const std::string& message);

}  // namespace uuidkey::log
