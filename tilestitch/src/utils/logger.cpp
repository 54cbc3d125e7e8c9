#include "utils/logger.hpp"

#include <atomic>
#include <iostream>

namespace logger {
namespace {
std::atomic<int> g_level{static_cast<int>(Level::Warn)};

void write(const char* tag, const std::string& message) {
    std::clog << tag << ' ' << message << "\n";
}
} // namespace

void set_level(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

bool enabled(Level level) {
    return g_level.load(std::memory_order_relaxed) >= static_cast<int>(level);
}

void debug(const std::string& message) {
    if (!enabled(Level::Debug)) {
        return;
    }
    write("[DEBUG]", message);
}

void info(const std::string& message) {
    if (!enabled(Level::Info)) {
        return;
    }
    write("[INFO]", message);
}

void warn(const std::string& message) {
    if (!enabled(Level::Warn)) {
        return;
    }
    write("[WARN]", message);
}

void error(const std::string& message) {
    write("[ERROR]", message);
}
} // namespace logger
