//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/climate/simulated_bridge.cpp
// Purpose: In-process air conditioner and room sensor.
// Key invariants:
//   - Switching mode keeps the temperature and volume when the new mode
//     supports them and otherwise falls back to the first supported value.
//   - Every call counts as one fetch or push, failing or not.
//
//===----------------------------------------------------------------------===//

#include "keydeck/climate/climate_bridge.hpp"

#include <algorithm>

namespace keydeck::climate
{

namespace
{
std::vector<std::string> temperatureRange(int lo, int hi)
{
    std::vector<std::string> out;
    for (int t = lo; t <= hi; ++t)
    {
        out.push_back(std::to_string(t));
    }
    return out;
}

bool contains(const std::vector<std::string> &list, const std::string &value)
{
    return std::find(list.begin(), list.end(), value) != list.end();
}
} // namespace

SimulatedClimateBridge::SimulatedClimateBridge(std::string applianceId, std::string sensorId)
    : applianceId_(std::move(applianceId)), sensorId_(std::move(sensorId))
{
    const std::vector<std::string> volumes{"1", "2", "3", "4", "5", "auto"};
    modes_.push_back({"warm", temperatureRange(14, 30), volumes});
    modes_.push_back({"cool", temperatureRange(18, 30), volumes});
    modes_.push_back({"blow", {""}, volumes});
    modes_.push_back({"dry", {""}, {"auto"}});
}

const SimulatedClimateBridge::ModeRange *SimulatedClimateBridge::findMode(const std::string &name) const
{
    for (const auto &m : modes_)
    {
        if (m.name == name)
            return &m;
    }
    return nullptr;
}

void SimulatedClimateBridge::checkReachable() const
{
    if (failing_)
        throw ClimateError("climate bridge unreachable");
}

AcState SimulatedClimateBridge::fetchAc(const std::string &applianceId)
{
    std::lock_guard<std::mutex> lock(mu_);
    ++fetches_;
    checkReachable();
    if (applianceId != applianceId_)
        throw ClimateError("appliance " + applianceId + " is not found");

    const ModeRange *range = findMode(mode_);
    AcState state;
    state.temperature = temperature_;
    state.temperatureList = range->temperatures;
    state.mode = mode_;
    for (const auto &m : modes_)
    {
        state.modeList.push_back(m.name);
    }
    state.volume = volume_;
    state.volumeList = range->volumes;
    state.power = power_;
    return state;
}

void SimulatedClimateBridge::pushAc(const std::string &applianceId, const AcState &state)
{
    std::lock_guard<std::mutex> lock(mu_);
    ++pushes_;
    checkReachable();
    if (applianceId != applianceId_)
        throw ClimateError("appliance " + applianceId + " is not found");
    const ModeRange *range = findMode(state.mode);
    if (!range)
        throw ClimateError("unsupported mode: " + state.mode);

    mode_ = range->name;
    power_ = state.power;
    if (contains(range->temperatures, state.temperature))
        temperature_ = state.temperature;
    else if (!contains(range->temperatures, temperature_))
        temperature_ = range->temperatures.front();
    if (contains(range->volumes, state.volume))
        volume_ = state.volume;
    else if (!contains(range->volumes, volume_))
        volume_ = range->volumes.front();
}

RoomState SimulatedClimateBridge::fetchRoom(const std::string &sensorId)
{
    std::lock_guard<std::mutex> lock(mu_);
    ++fetches_;
    checkReachable();
    if (sensorId != sensorId_)
        throw ClimateError("device " + sensorId + " is not found");
    return RoomState{roomTemperature_, {}};
}

void SimulatedClimateBridge::setRoomTemperature(double celsius)
{
    std::lock_guard<std::mutex> lock(mu_);
    roomTemperature_ = celsius;
}

void SimulatedClimateBridge::setFailing(bool failing)
{
    std::lock_guard<std::mutex> lock(mu_);
    failing_ = failing;
}

int SimulatedClimateBridge::fetchCount() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return fetches_;
}

int SimulatedClimateBridge::pushCount() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return pushes_;
}

} // namespace keydeck::climate
