//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/climate/ac_keys.cpp
// Purpose: Air conditioner keys built on ClimateService.
// Key invariants:
//   - A hold loop runs only while its hold token is live; release and hide
//     revoke it.
//   - A delayed commit only applies for the latest press or release serial.
//   - Drawing after a hide is suppressed.
// Ownership/Lifetime: Scheduled continuations capture the key itself; keys
//                     live as long as the page topology.
//
//===----------------------------------------------------------------------===//

#include "keydeck/climate/ac_keys.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace keydeck::climate
{

namespace
{
int indexOf(const std::vector<std::string> &list, const std::string &value)
{
    auto it = std::find(list.begin(), list.end(), value);
    return it == list.end() ? -1 : static_cast<int>(it - list.begin());
}

bool hasTemperatureSetting(const std::vector<std::string> &list)
{
    return !list.empty() && !(list.size() == 1 && list.front().empty());
}
} // namespace

AcKey::AcKey(app::Context &ctx,
             KeySet keys,
             std::shared_ptr<ClimateService> service,
             std::string applianceId,
             render::Icon loadingIcon)
    : Application(std::move(keys)),
      ctx_(ctx),
      service_(std::move(service)),
      applianceId_(std::move(applianceId)),
      loadingIcon_(std::move(loadingIcon))
{
}

void AcKey::onDisplay()
{
    const app::LivenessToken token = shown_.renew();
    ctx_.setImage(keys(), loadingIcon_);
    ctx_.now(
        [this, token]
        {
            if (app::isAlive(token))
                draw();
        });
}

void AcKey::onHide()
{
    shown_.revoke();
}

void AcKey::redraw()
{
    if (shown_.alive())
        draw();
}

AcState AcKey::state()
{
    return service_->acState(applianceId_);
}

void AcKey::setState(const AcState &state)
{
    loading_ = true;
    redraw();
    try
    {
        service_->setAcState(applianceId_, state);
    }
    catch (...)
    {
        loading_ = false;
        redraw();
        throw;
    }
    loading_ = false;
    redraw();
}

AcPowerKey::AcPowerKey(app::Context &ctx,
                       KeyId key,
                       std::shared_ptr<ClimateService> service,
                       std::string applianceId,
                       render::Icon onIcon,
                       render::Icon offIcon,
                       render::Icon loadingIcon)
    : AcKey(ctx, KeySet{key}, std::move(service), std::move(applianceId), std::move(loadingIcon)),
      onIcon_(std::move(onIcon)),
      offIcon_(std::move(offIcon))
{
}

void AcPowerKey::draw()
{
    if (loading())
    {
        ctx_.setImage(keys(), loadingIcon());
        return;
    }
    ctx_.setImage(keys(), state().power ? onIcon_ : offIcon_);
}

void AcPowerKey::onPress(KeyId key)
{
    (void)key;
    AcState s = state();
    s.power = !s.power;
    setState(s);
}

render::Icon AcModeSetting::icon(bool on) const
{
    if (on)
        return onIcon ? *onIcon : render::Icon{render::TextIcon{.bg = render::kWhite, .fg = render::kBlack, .text = mode}};
    return offIcon ? *offIcon : render::Icon{render::TextIcon{.text = mode}};
}

AcModeKeySet::AcModeKeySet(app::Context &ctx,
                           std::shared_ptr<ClimateService> service,
                           std::string applianceId,
                           std::map<KeyId, AcModeSetting> settings,
                           render::Icon loadingIcon)
    : AcKey(ctx,
            [&settings]
            {
                KeySet keys;
                for (const auto &[key, setting] : settings)
                {
                    keys.insert(key);
                }
                return keys;
            }(),
            std::move(service),
            std::move(applianceId),
            std::move(loadingIcon)),
      settings_(std::move(settings))
{
}

void AcModeKeySet::draw()
{
    if (loading())
    {
        for (const auto &[key, setting] : settings_)
        {
            ctx_.setImage(key, setting.icon(false));
        }
        return;
    }
    const AcState s = state();
    for (const auto &[key, setting] : settings_)
    {
        ctx_.setImage(key, setting.icon(s.power && s.mode == setting.mode));
    }
}

void AcModeKeySet::onPress(KeyId key)
{
    auto it = settings_.find(key);
    if (it == settings_.end())
        return;
    AcState s = state();
    if (s.power && s.mode == it->second.mode)
    {
        s.power = false;
    }
    else
    {
        s.mode = it->second.mode;
        s.power = true;
    }
    setState(s);
}

AcTempKeySet::AcTempKeySet(app::Context &ctx,
                           std::shared_ptr<ClimateService> service,
                           std::string applianceId,
                           KeyId upKey,
                           KeyId middleKey,
                           KeyId downKey)
    : AcKey(ctx, KeySet{upKey, middleKey, downKey}, std::move(service), std::move(applianceId)),
      upKey_(upKey),
      middleKey_(middleKey),
      downKey_(downKey)
{
}

void AcTempKeySet::draw()
{
    const AcState s = state();
    const auto &list = s.temperatureList;
    if (s.temperature.empty() || indexOf(list, s.temperature) < 0)
    {
        ctx_.setImage(KeySet{upKey_, downKey_}, render::ColorIcon{render::kGrey});
        ctx_.setImage(middleKey_, render::TextIcon{.bg = render::kGrey, .text = "--℃"});
        return;
    }

    std::string temp = s.temperature;
    if (target_ >= 0 && target_ < static_cast<int>(list.size()))
        temp = list[static_cast<std::size_t>(target_)];
    const int index = indexOf(list, temp);
    const double level = static_cast<double>(index + 1) / static_cast<double>(list.size() + 1);

    ctx_.setImage(upKey_, render::GaugeIcon{.text = "▲", .nKeys = 3, .keyOffset = 2, .value = level});
    ctx_.setImage(middleKey_, render::GaugeIcon{.text = temp + "℃", .nKeys = 3, .keyOffset = 1, .value = level});
    ctx_.setImage(downKey_, render::GaugeIcon{.text = "▼", .nKeys = 3, .keyOffset = 0, .value = level});
}

void AcTempKeySet::onPress(KeyId key)
{
    if (key != upKey_ && key != downKey_)
        return;
    ++releaseSerial_;

    const AcState s = state();
    if (!hasTemperatureSetting(s.temperatureList))
        return;
    const int current = indexOf(s.temperatureList, s.temperature);
    if (current < 0)
        target_ = 0;
    if (target_ < 0)
        target_ = current;

    step(key, hold_.renew());
}

void AcTempKeySet::step(KeyId key, const app::LivenessToken &hold)
{
    if (!app::isAlive(hold))
        return;
    const AcState s = state();
    const int n = static_cast<int>(s.temperatureList.size());
    if (n == 0)
        return;
    if (key == upKey_)
        target_ = std::min(target_ + 1, n - 1);
    else
        target_ = std::max(std::min(target_, n - 1) - 1, 0);
    redraw();
    ctx_.after(kHoldInterval, [this, key, hold] { step(key, hold); });
}

app::Outcome AcTempKeySet::onRelease(KeyId key)
{
    if (key != upKey_ && key != downKey_)
        return app::Outcome::handled();
    hold_.revoke();
    const std::uint64_t serial = ++releaseSerial_;
    ctx_.after(kCommitDelay, [this, serial] { commit(serial); });
    return app::Outcome::handled();
}

void AcTempKeySet::commit(std::uint64_t serial)
{
    if (serial != releaseSerial_ || target_ < 0)
        return;
    AcState s = state();
    const int target = target_;
    target_ = -1;
    if (target >= static_cast<int>(s.temperatureList.size()))
    {
        redraw();
        return;
    }
    const std::string &temp = s.temperatureList[static_cast<std::size_t>(target)];
    if (temp == s.temperature)
    {
        redraw();
        return;
    }
    s.temperature = temp;
    setState(s);
}

void AcTempKeySet::onHide()
{
    hold_.revoke();
    AcKey::onHide();
}

AcVolumeKey::AcVolumeKey(app::Context &ctx,
                         KeySet keys,
                         std::shared_ptr<ClimateService> service,
                         std::string applianceId)
    : AcKey(ctx, std::move(keys), std::move(service), std::move(applianceId))
{
}

double AcVolumeKey::volumeLevel(const std::vector<std::string> &volumes, const std::string &volume)
{
    int steps = 0;
    int index = -1;
    for (const auto &v : volumes)
    {
        if (v == "auto")
            continue;
        if (v == volume)
            index = steps;
        ++steps;
    }
    if (index < 0)
        return 0.0;
    if (steps <= 1)
        return 1.0;
    return static_cast<double>(index) / static_cast<double>(steps - 1);
}

void AcVolumeKey::draw()
{
    const AcState s = state();
    std::string volume = s.volume;
    if (target_ >= 0 && target_ < static_cast<int>(s.volumeList.size()))
        volume = s.volumeList[static_cast<std::size_t>(target_)];

    if (volume == "auto" || indexOf(s.volumeList, volume) < 0)
    {
        ctx_.setImage(keys(), render::TextIcon{.text = volume});
        return;
    }
    const double level = volumeLevel(s.volumeList, volume);
    char label[16];
    std::snprintf(label, sizeof(label), "%.0f%%", level * 100.0);
    ctx_.setImage(keys(), render::GaugeIcon{.text = label, .value = level});
}

void AcVolumeKey::onPress(KeyId key)
{
    (void)key;
    const std::uint64_t serial = ++pressSerial_;
    const AcState s = state();
    const int n = static_cast<int>(s.volumeList.size());
    if (n == 0)
        return;
    if (target_ < 0)
        target_ = indexOf(s.volumeList, s.volume);
    target_ = (target_ + 1) % n;
    redraw();
    ctx_.after(kCommitDelay, [this, serial] { commit(serial); });
}

void AcVolumeKey::commit(std::uint64_t serial)
{
    if (serial != pressSerial_ || target_ < 0)
        return;
    AcState s = state();
    const int target = target_;
    target_ = -1;
    if (target >= static_cast<int>(s.volumeList.size()))
    {
        redraw();
        return;
    }
    const std::string &volume = s.volumeList[static_cast<std::size_t>(target)];
    if (volume == s.volume)
    {
        redraw();
        return;
    }
    s.volume = volume;
    setState(s);
}

} // namespace keydeck::climate
