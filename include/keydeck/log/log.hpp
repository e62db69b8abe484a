// include/keydeck/log/log.hpp
// @brief Leveled logging to stderr for the key deck runtime.
// @invariant Lines are formatted as "[LEVEL] HH:MM:SS message" and never interleave.
// @ownership The sink stream is borrowed; callers keep it alive while installed.
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace keydeck::log
{

/// @brief Severity levels in increasing order; Off disables all output.
enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

/// @brief Current threshold; messages below it are dropped.
[[nodiscard]] Level level();

/// @brief Change the threshold for subsequent messages.
void setLevel(Level level);

/// @brief Whether a message at @p level would be written.
[[nodiscard]] bool enabled(Level level);

/// @brief Parse "debug", "info", "warn"/"warning", "error" or "off" (any case).
[[nodiscard]] std::optional<Level> parseLevel(std::string_view text);

/// @brief Upper-case tag used in the line prefix.
[[nodiscard]] const char *levelName(Level level);

/// @brief Redirect output; nullptr restores std::cerr.
void setSink(std::ostream *sink);

/// @brief Write @p message at @p level if enabled.
void write(Level level, std::string_view message);

inline void debug(std::string_view message)
{
    write(Level::Debug, message);
}

inline void info(std::string_view message)
{
    write(Level::Info, message);
}

inline void warn(std::string_view message)
{
    write(Level::Warn, message);
}

inline void error(std::string_view message)
{
    write(Level::Error, message);
}

} // namespace keydeck::log
