// include/keydeck/climate/climate_state.hpp
// @brief Snapshots of an air conditioner and a room sensor, and the bridge error.
// @invariant The option lists describe the ranges valid for the current mode.
// @ownership Value types.
#pragma once

#include "keydeck/sched/clock.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace keydeck::climate
{

/// @brief Air conditioner settings as reported by the bridge.
struct AcState
{
    /// Target temperature; empty when the mode has no temperature setting.
    std::string temperature{};
    std::vector<std::string> temperatureList{};
    std::string mode{"unknown"};
    std::vector<std::string> modeList{};
    std::string volume{"unknown"};
    std::vector<std::string> volumeList{};
    bool power{false};
    /// When the snapshot was fetched or pushed; set by ClimateService.
    sched::TimePoint timestamp{};
};

struct RoomState
{
    double temperature{0.0};
    sched::TimePoint timestamp{};
};

/// @brief The bridge failed to deliver or accept a state.
class ClimateError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace keydeck::climate
