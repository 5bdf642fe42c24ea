#include "uuidkey/log.hpp"

#include "uuidkey/constants.hpp"
#include "uuidkey/env.hpp"

#include <atomic>
#include <cstdio>
#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace uuidkey::log {

namespace {

// -1 means not yet resolved from the environment.
std::atomic<int> g_colors_enabled{-1};
std::atomic<int> g_debug_enabled{-1};

bool Resolve(std::atomic<int>& flag, bool (*detect)()) {
    int state = flag.load(std::memory_order_relaxed);
    if (state < 0) {
        state = detect() ? 1 : 0;
        flag.store(state, std::memory_order_relaxed);
    }
    return state == 1;
}

bool DetectColors() {
    if (env::IsEnabled(constants::kEnvNoColor)) {
        return false;
    }
    return isatty(fileno(stderr)) != 0;
}

bool DetectDebug() {
    return env::IsEnabled(constants::kEnvDebug);
}

void Emit(const char* tag, const char* color, const std::string& message) {
    std::cerr << Colorize(tag, color) << " " << message << "\n";
}

}  // namespace

bool ColorsEnabled() {
    return Resolve(g_colors_enabled, DetectColors);
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

bool DebugEnabled() {
    return Resolve(g_debug_enabled, DetectDebug);
}

void SetDebugEnabled(bool enabled) {
    g_debug_enabled.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

std::string Colorize(const std::string& text, const char* color) {
    if (!ColorsEnabled()) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

void Warn(const std::string& message) {
    Emit("WARN:", color::YELLOW, message);
}

void Debug(const std::string& message) {
    if (!DebugEnabled()) {
        return;
    }
    Emit("DEBUG:", color::BRIGHT_BLACK, message);
}

}  // namespace uuidkey::log
