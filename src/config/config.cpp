//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/config.cpp
// Purpose: INI-like configuration loader.
// Key invariants: Reads sections [device], [runtime], [log] and [climate];
//                 unknown sections and keys are ignored.
// Ownership/Lifetime: Loader does not own external resources beyond file path.
//
//===----------------------------------------------------------------------===//

#include "keydeck/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace keydeck::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(
        s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

/// @brief Parse a whole-string integer within [lo, hi].
bool parse_int(const std::string &s, long lo, long hi, long &out)
{
    try
    {
        std::size_t parsed = 0;
        const long v = std::stol(s, &parsed);
        if (parsed != s.size() || v < lo || v > hi)
        {
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

void reject(const std::string &section, const std::string &key, const std::string &value)
{
    log::warn("config: ignoring [" + section + "] " + key + " = '" + value + "'");
}

} // namespace

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    std::string line;
    std::string section;
    while (std::getline(in, line))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        const std::string key = lower(trim(trimmed.substr(0, eq)));
        const std::string value = trim(trimmed.substr(eq + 1));
        long n = 0;

        if (section == "device")
        {
            if (key == "index")
            {
                if (parse_int(value, 0, 255, n))
                    out.device.index = static_cast<std::size_t>(n);
                else
                    reject(section, key, value);
            }
            else if (key == "brightness")
            {
                if (parse_int(value, 0, 100, n))
                    out.device.brightness = static_cast<int>(n);
                else
                    reject(section, key, value);
            }
        }
        else if (section == "runtime")
        {
            if (key == "long_press_ms")
            {
                if (parse_int(value, 1, 60000, n))
                    out.runtime.longPressDelay = std::chrono::milliseconds(n);
                else
                    reject(section, key, value);
            }
        }
        else if (section == "log")
        {
            if (key == "level")
            {
                if (auto level = log::parseLevel(value))
                    out.log.level = *level;
                else
                    reject(section, key, value);
            }
        }
        else if (section == "climate")
        {
            if (key == "cache_ttl_s")
            {
                if (parse_int(value, 0, 86400, n))
                    out.climate.cacheTtl = std::chrono::seconds(n);
                else
                    reject(section, key, value);
            }
            else if (key == "appliance")
            {
                if (!value.empty())
                    out.climate.appliance = value;
                else
                    reject(section, key, value);
            }
            else if (key == "room_sensor")
            {
                if (!value.empty())
                    out.climate.roomSensor = value;
                else
                    reject(section, key, value);
            }
        }
    }
    return true;
}

} // namespace keydeck::config
