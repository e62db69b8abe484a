//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/climate/room_temp_key.cpp
// Purpose: Room temperature display.
// Key invariants: A failed read is logged and retried on the next period; the
//                 loop ends only when its token is revoked.
//
//===----------------------------------------------------------------------===//

#include "keydeck/climate/room_temp_key.hpp"

#include "keydeck/log/log.hpp"

#include <cstdio>

namespace keydeck::climate
{

RoomTempKey::RoomTempKey(app::Context &ctx,
                         KeySet keys,
                         std::shared_ptr<ClimateService> service,
                         std::string sensorId,
                         sched::Duration period)
    : Application(std::move(keys)),
      ctx_(ctx),
      service_(std::move(service)),
      sensorId_(std::move(sensorId)),
      period_(period)
{
}

void RoomTempKey::onDisplay()
{
    const app::LivenessToken token = liveness_.renew();
    ctx_.now([this, token] { poll(token); });
}

void RoomTempKey::onHide()
{
    liveness_.revoke();
}

void RoomTempKey::poll(const app::LivenessToken &token)
{
    if (!app::isAlive(token))
        return;
    try
    {
        const RoomState room = service_->roomState(sensorId_);
        char text[32];
        std::snprintf(text, sizeof(text), "%.1f℃", room.temperature);
        ctx_.setImage(keys(), render::TextIcon{.text = text, .size = 12});
    }
    catch (const ClimateError &e)
    {
        log::warn("room " + sensorId_ + ": " + e.what());
    }
    ctx_.after(period_, [this, token] { poll(token); });
}

} // namespace keydeck::climate
