//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/climate/climate_service.cpp
// Purpose: Age-bounded cache of appliance and room states.
// Key invariants:
//   - One mutex guards both caches and is held across bridge calls, so a
//     stale entry is refreshed by one caller only.
//   - Entries are stamped with the service clock when stored.
//
//===----------------------------------------------------------------------===//

#include "keydeck/climate/climate_service.hpp"

#include "keydeck/log/log.hpp"

namespace keydeck::climate
{

ClimateService::ClimateService(std::shared_ptr<ClimateBridge> bridge,
                               const sched::Clock &clock,
                               sched::Duration ttl)
    : bridge_(std::move(bridge)), clock_(clock), ttl_(ttl)
{
}

bool ClimateService::fresh(sched::TimePoint stamp) const
{
    return clock_.now() - stamp < ttl_;
}

AcState ClimateService::acState(const std::string &applianceId, bool force)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = ac_.find(applianceId);
    if (it != ac_.end() && !force && fresh(it->second.timestamp))
        return it->second;

    log::debug("climate: fetching appliance " + applianceId);
    AcState state = bridge_->fetchAc(applianceId);
    state.timestamp = clock_.now();
    ac_.insert_or_assign(applianceId, state);
    return state;
}

RoomState ClimateService::roomState(const std::string &sensorId, bool force)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = rooms_.find(sensorId);
    if (it != rooms_.end() && !force && fresh(it->second.timestamp))
        return it->second;

    log::debug("climate: fetching sensor " + sensorId);
    RoomState state = bridge_->fetchRoom(sensorId);
    state.timestamp = clock_.now();
    rooms_.insert_or_assign(sensorId, state);
    return state;
}

void ClimateService::setAcState(const std::string &applianceId, const AcState &state)
{
    std::lock_guard<std::mutex> lock(mu_);
    log::info("climate: " + applianceId + " -> " + (state.power ? "on " : "off ") + state.mode + " " +
              state.temperature + " vol " + state.volume);
    bridge_->pushAc(applianceId, state);
    AcState stored = state;
    try
    {
        stored = bridge_->fetchAc(applianceId);
    }
    catch (const ClimateError &e)
    {
        log::warn(std::string("climate: refresh after push failed: ") + e.what());
    }
    stored.timestamp = clock_.now();
    ac_.insert_or_assign(applianceId, stored);
}

} // namespace keydeck::climate
