#pragma once

#include <functional>
#include <string>

namespace flatrig::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// Receives every line that passes the level filter, already formatted. Runs
// under the logger lock, so a sink must not log.
using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level level);
Level level();
bool enabled(Level level);

// Parses "error", "warn"/"warning", "info", "debug" (any case). Unknown text yields Info.
Level parse_level(const std::string& text);
const char* level_name(Level level);

// Replaces the console sink. An empty sink restores stderr output. The file
// sink, when open, keeps receiving lines either way.
void set_sink(Sink sink);

// Mirrors every line into `path`. Returns false when the file cannot be opened.
bool open_file(const std::string& path, bool append);
void close_file();

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

}
