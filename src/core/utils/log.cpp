#include "log.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sfc {
namespace log {

namespace {

struct LoggerState {
    Level minLevel = Level::Info;
    bool color = true;
    std::ofstream file;
    std::mutex mutex;
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

std::tm localNow(std::chrono::system_clock::time_point now) {
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif
    return local;
}

// Console lines carry the time of day; file lines also carry the date
std::string timestamp(std::chrono::system_clock::time_point now, bool withDate) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local = localNow(now);

    std::ostringstream ss;
    ss << std::put_time(&local, withDate ? "%Y-%m-%d %H:%M:%S" : "%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* levelTag(Level level) {
    switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO ";
    case Level::Warning: return "WARN ";
    case Level::Error: return "ERROR";
    }
    return "?????";
}

const char* levelColor(Level level) {
    switch (level) {
    case Level::Debug: return "\033[36m";
    case Level::Info: return "\033[32m";
    case Level::Warning: return "\033[33m";
    case Level::Error: return "\033[31m";
    }
    return "\033[0m";
}

void write(Level level, std::string_view module, std::string_view message) {
    auto& s = state();
    if (level < s.minLevel) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(s.mutex);

    std::string prefix = "[" + timestamp(now, false) + "] [" + levelTag(level) + "] ";
    if (s.color) {
        std::cerr << levelColor(level) << prefix << "\033[0m";
    } else {
        std::cerr << prefix;
    }
    std::cerr << "[" << module << "] " << message << '\n';

    if (s.file.is_open()) {
        s.file << "[" << timestamp(now, true) << "] [" << levelTag(level) << "] [" << module << "] "
               << message << std::endl;
    }
}

} // namespace

void setLevel(Level level) {
    state().minLevel = level;
}

Level getLevel() {
    return state().minLevel;
}

Level levelFromInt(int value) {
    if (value <= 0) return Level::Debug;
    if (value == 1) return Level::Info;
    if (value == 2) return Level::Warning;
    return Level::Error;
}

void setColorEnabled(bool enabled) {
    state().color = enabled;
}

void debug(std::string_view module, std::string_view message) {
    write(Level::Debug, module, message);
}

void info(std::string_view module, std::string_view message) {
    write(Level::Info, module, message);
}

void warning(std::string_view module, std::string_view message) {
    write(Level::Warning, module, message);
}

void error(std::string_view module, std::string_view message) {
    write(Level::Error, module, message);
}

namespace detail {

void logAtLevel(Level level, std::string_view module, std::string_view message) {
    write(level, module, message);
}

} // namespace detail

bool setLogFile(const std::string& path) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) {
        s.file.close();
    }
    s.file.open(path, std::ios::app);
    return s.file.is_open();
}

void closeLogFile() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) {
        s.file.close();
    }
}

} // namespace log
} // namespace sfc
