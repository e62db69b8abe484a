// include/keydeck/climate/climate_service.hpp
// @brief Process-wide cache in front of a ClimateBridge.
// @invariant A cached entry is served while younger than ttl() unless forced.
// @ownership Shares the bridge; borrows the clock. Constructed once at start-up
//            and shared by every climate widget.
#pragma once

#include "keydeck/climate/climate_bridge.hpp"
#include "keydeck/sched/clock.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace keydeck::climate
{

class ClimateService
{
  public:
    static constexpr std::chrono::seconds kDefaultTtl{60};

    ClimateService(std::shared_ptr<ClimateBridge> bridge,
                   const sched::Clock &clock,
                   sched::Duration ttl = kDefaultTtl);

    /// @brief Cached appliance state, fetched when missing, stale or @p force is set.
    /// @throws ClimateError from the bridge.
    [[nodiscard]] AcState acState(const std::string &applianceId, bool force = false);

    /// @brief Cached room state, fetched when missing, stale or @p force is set.
    /// @throws ClimateError from the bridge.
    [[nodiscard]] RoomState roomState(const std::string &sensorId, bool force = false);

    /// @brief Push @p state, then refresh the cached entry from the bridge.
    /// @details Falls back to caching @p state when the refresh fails.
    /// @throws ClimateError when the push fails; the cache is left untouched then.
    void setAcState(const std::string &applianceId, const AcState &state);

    [[nodiscard]] sched::Duration ttl() const
    {
        return ttl_;
    }

  private:
    bool fresh(sched::TimePoint stamp) const;

    std::shared_ptr<ClimateBridge> bridge_;
    const sched::Clock &clock_;
    const sched::Duration ttl_;
    std::mutex mu_;
    std::map<std::string, AcState> ac_;
    std::map<std::string, RoomState> rooms_;
};

} // namespace keydeck::climate
