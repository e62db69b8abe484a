// include/keydeck/config/config.hpp
// @brief Configuration structures and INI loader for the key deck runtime.
// @invariant Values that fail to parse leave the defaults in place.
// @ownership Config owns plain value data only.
#pragma once

#include "keydeck/log/log.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace keydeck::config
{

/// @brief Which device to open and how bright.
struct DeviceConfig
{
    std::size_t index{0};
    int brightness{30};
};

/// @brief Interaction timing.
struct RuntimeConfig
{
    std::chrono::milliseconds longPressDelay{500};
};

struct LogConfig
{
    log::Level level{log::Level::Info};
};

/// @brief Climate widgets: cache age threshold and device identifiers.
struct ClimateConfig
{
    std::chrono::seconds cacheTtl{60};
    std::string appliance{"living-ac"};
    std::string roomSensor{"living-room"};
};

/// @brief Aggregated runtime configuration.
struct Config
{
    DeviceConfig device{};
    RuntimeConfig runtime{};
    LogConfig log{};
    ClimateConfig climate{};
};

/// @brief Load configuration from an INI-like file.
/// @param path Path to configuration file.
/// @param out Config to populate; keys absent from the file keep their values.
/// @return True on success, false if the file cannot be opened.
bool loadFromFile(const std::string &path, Config &out);

} // namespace keydeck::config
