// include/keydeck/climate/climate_bridge.hpp
// @brief Transport to climate devices and its in-process simulation.
// @invariant Bridge calls either return a complete state or throw ClimateError.
// @ownership Bridges are shared between the service and whoever created them.
#pragma once

#include "keydeck/climate/climate_state.hpp"

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace keydeck::climate
{

class ClimateBridge
{
  public:
    virtual ~ClimateBridge() = default;

    /// @throws ClimateError when @p applianceId is unknown or unreachable.
    [[nodiscard]] virtual AcState fetchAc(const std::string &applianceId) = 0;

    /// @brief Apply mode, temperature, volume and power of @p state.
    /// @throws ClimateError when the appliance rejects the settings.
    virtual void pushAc(const std::string &applianceId, const AcState &state) = 0;

    /// @throws ClimateError when @p sensorId is unknown or unreachable.
    [[nodiscard]] virtual RoomState fetchRoom(const std::string &sensorId) = 0;
};

/// @brief One simulated air conditioner and one room sensor.
/// @details Modes "warm", "cool", "blow" and "dry"; blow and dry have no
///          temperature setting and dry only supports automatic volume.
class SimulatedClimateBridge final : public ClimateBridge
{
  public:
    SimulatedClimateBridge(std::string applianceId, std::string sensorId);

    [[nodiscard]] AcState fetchAc(const std::string &applianceId) override;
    void pushAc(const std::string &applianceId, const AcState &state) override;
    [[nodiscard]] RoomState fetchRoom(const std::string &sensorId) override;

    void setRoomTemperature(double celsius);

    /// @brief Make every subsequent call throw ClimateError until cleared.
    void setFailing(bool failing);

    [[nodiscard]] int fetchCount() const;
    [[nodiscard]] int pushCount() const;

  private:
    struct ModeRange
    {
        std::string name;
        std::vector<std::string> temperatures;
        std::vector<std::string> volumes;
    };

    const ModeRange *findMode(const std::string &name) const;
    void checkReachable() const;

    const std::string applianceId_;
    const std::string sensorId_;
    std::vector<ModeRange> modes_;

    mutable std::mutex mu_;
    std::string mode_{"cool"};
    std::string temperature_{"26"};
    std::string volume_{"auto"};
    bool power_{false};
    double roomTemperature_{24.5};
    bool failing_{false};
    int fetches_{0};
    int pushes_{0};
};

} // namespace keydeck::climate
