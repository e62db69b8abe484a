//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/log/log.cpp
// Purpose: Process-wide leveled logger used by the runtime, drivers and widgets.
// Key invariants: One mutex serialises level changes, sink changes and writes.
// Ownership/Lifetime: The sink is borrowed; std::cerr is used when none is set.
//
//===----------------------------------------------------------------------===//

#include "keydeck/log/log.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>

namespace keydeck::log
{

namespace
{
struct LoggerState
{
    std::mutex mu;
    Level threshold = Level::Info;
    std::ostream *sink = nullptr;
};

LoggerState &state()
{
    static LoggerState s;
    return s;
}

std::string timestamp()
{
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}
} // namespace

Level level()
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    return s.threshold;
}

void setLevel(Level level)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    s.threshold = level;
}

bool enabled(Level level)
{
    if (level == Level::Off)
        return false;
    return static_cast<int>(level) >= static_cast<int>(log::level());
}

std::optional<Level> parseLevel(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug")
        return Level::Debug;
    if (lower == "info")
        return Level::Info;
    if (lower == "warn" || lower == "warning")
        return Level::Warn;
    if (lower == "error")
        return Level::Error;
    if (lower == "off")
        return Level::Off;
    return std::nullopt;
}

const char *levelName(Level level)
{
    switch (level)
    {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
    }
    return "?";
}

void setSink(std::ostream *sink)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    s.sink = sink;
}

void write(Level level, std::string_view message)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    if (level == Level::Off || static_cast<int>(level) < static_cast<int>(s.threshold))
        return;
    std::ostream &os = s.sink ? *s.sink : std::cerr;
    os << '[' << levelName(level) << "] " << timestamp() << ' ' << message << '\n';
    os.flush();
}

} // namespace keydeck::log
