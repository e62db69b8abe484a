// include/keydeck/climate/room_temp_key.hpp
// @brief Key showing a room sensor's temperature, polled while shown.
// @ownership Shares the ClimateService and borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"
#include "keydeck/app/liveness.hpp"
#include "keydeck/climate/climate_service.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace keydeck::climate
{

class RoomTempKey final : public app::Application
{
  public:
    static constexpr std::chrono::seconds kDefaultPeriod{60};

    RoomTempKey(app::Context &ctx,
                KeySet keys,
                std::shared_ptr<ClimateService> service,
                std::string sensorId,
                sched::Duration period = kDefaultPeriod);

    /// @brief Start polling on the next runner turn.
    void onDisplay() override;
    void onHide() override;

  private:
    void poll(const app::LivenessToken &token);

    app::Context &ctx_;
    std::shared_ptr<ClimateService> service_;
    const std::string sensorId_;
    const sched::Duration period_;
    app::Liveness liveness_;
};

} // namespace keydeck::climate
