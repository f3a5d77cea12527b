#include "log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

#include "utils/string_utils.hpp"

namespace {

using flatrig::log::Level;

struct LoggerState {
    std::mutex mutex;
    std::once_flag env_once;
    Level level = Level::Info;
    flatrig::log::Sink sink;
    std::unique_ptr<std::ofstream> file;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

bool env_flag_set(const char* v) {
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

std::unique_ptr<std::ofstream> open_stream(const std::string& path, bool append) {
    const std::ios_base::openmode mode = std::ios::out | (append ? std::ios::app : std::ios::trunc);
    auto ofs = std::make_unique<std::ofstream>(path, mode);
    if (!ofs->good()) {
        return nullptr;
    }
    return ofs;
}

// FLATRIG_LOG_LEVEL, FLATRIG_LOG_FILE and FLATRIG_LOG_APPEND are read once,
// before the first line or level change.
void init_from_env_once() {
    LoggerState& s = state();
    std::call_once(s.env_once, [&s]() {
        if (const char* v = std::getenv("FLATRIG_LOG_LEVEL")) {
            s.level = flatrig::log::parse_level(v);
        }
        const char* file = std::getenv("FLATRIG_LOG_FILE");
        if (file && *file) {
            s.file = open_stream(file, env_flag_set(std::getenv("FLATRIG_LOG_APPEND")));
            if (!s.file) {
                std::cerr << "[flatrig] could not open log file '" << file << "'\n";
            }
        }
    });
}

std::string format_line(Level level, double secs, const std::string& message) {
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%.3f", secs);
    return std::string("[") + flatrig::log::level_name(level) + "] +" + stamp + "s: " + message;
}

void write_line(Level level, const std::string& message) {
    init_from_env_once();
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (static_cast<int>(level) > static_cast<int>(s.level)) {
        return;
    }
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - s.origin).count();
    const std::string line = format_line(level, secs, message);
    if (s.sink) {
        s.sink(level, line);
    } else {
        std::cerr << line << '\n';
        std::cerr.flush();
    }
    if (s.file) {
        *s.file << line << '\n';
        s.file->flush();
    }
}

}

namespace flatrig::log {

Level parse_level(const std::string& text) {
    const std::string lower = strings::to_lower_copy(strings::trim_copy(text));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return Level::Info;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default:           return "INFO";
    }
}

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(state().mutex);
    state().level = level;
}

Level level() {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().level;
}

bool enabled(Level candidate) {
    return static_cast<int>(candidate) <= static_cast<int>(level());
}

void set_sink(Sink sink) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(state().mutex);
    state().sink = std::move(sink);
}

bool open_file(const std::string& path, bool append) {
    init_from_env_once();
    auto ofs = open_stream(path, append);
    if (!ofs) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state().mutex);
    state().file = std::move(ofs);
    return true;
}

void close_file() {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().file.reset();
}

void reset_time_origin() {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().origin = std::chrono::steady_clock::now();
}

void error(const std::string& message) { write_line(Level::Error, message); }
void warn (const std::string& message) { write_line(Level::Warn,  message); }
void info (const std::string& message) { write_line(Level::Info,  message); }
void debug(const std::string& message) { write_line(Level::Debug, message); }

}
