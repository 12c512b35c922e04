#include "spotifymcp/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace spotifymcp::util::log
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::mutex g_sink_mutex;
Sink g_sink;
} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR")
        return Level::Error;
    return Level::Info;
}

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level.store(level);
}

Level level()
{
    return g_level.load();
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

bool enabled(Level lvl)
{
    return static_cast<int>(lvl) >= static_cast<int>(g_level.load());
}

void write(Level lvl, const std::string& message)
{
    if (!enabled(lvl))
        return;
    std::string line = std::string("[spotifymcp] ") + to_string(lvl) + " " + message;

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink)
    {
        g_sink(line);
        return;
    }
    // stdout belongs to the stdio transport
    std::cerr << line << std::endl;
}

} // namespace spotifymcp::util::log
