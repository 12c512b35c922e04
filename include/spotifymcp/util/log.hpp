#pragma once
#include <functional>
#include <string>

namespace spotifymcp::util::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

using Sink = std::function<void(const std::string&)>;

/// "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (any case). Unknown names map to Info.
Level level_from_string(const std::string& name);
const char* to_string(Level level);

void set_level(Level level);
Level level();

/// Replace the output sink (default: stderr). Passing an empty Sink restores the default.
void set_sink(Sink sink);

bool enabled(Level level);
void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warning(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace spotifymcp::util::log
