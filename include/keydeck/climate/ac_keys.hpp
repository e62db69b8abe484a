// include/keydeck/climate/ac_keys.hpp
// @brief Air conditioner control keys: power, mode, target temperature, volume.
// @invariant Keys only draw while shown; changes made after a hide reach the
//            appliance but not the device.
// @ownership Each key shares the ClimateService and borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"
#include "keydeck/app/liveness.hpp"
#include "keydeck/climate/climate_service.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace keydeck::climate
{

/// @brief Common base: shows a loading icon, then draws from the cached state.
class AcKey : public app::Application
{
  public:
    AcKey(app::Context &ctx,
          KeySet keys,
          std::shared_ptr<ClimateService> service,
          std::string applianceId,
          render::Icon loadingIcon = render::ColorIcon{});

    /// @brief Paint the loading icon now and the real state on the next turn.
    void onDisplay() override;
    void onHide() override;

    [[nodiscard]] bool loading() const
    {
        return loading_;
    }

  protected:
    virtual void draw() = 0;

    /// @brief draw() if the key is still shown.
    void redraw();

    [[nodiscard]] AcState state();

    /// @brief Push @p state, drawing the loading look while the push runs.
    void setState(const AcState &state);

    [[nodiscard]] const render::Icon &loadingIcon() const
    {
        return loadingIcon_;
    }

    app::Context &ctx_;

  private:
    std::shared_ptr<ClimateService> service_;
    const std::string applianceId_;
    const render::Icon loadingIcon_;
    bool loading_{false};
    app::Liveness shown_;
};

/// @brief Toggles power.
class AcPowerKey final : public AcKey
{
  public:
    AcPowerKey(app::Context &ctx,
               KeyId key,
               std::shared_ptr<ClimateService> service,
               std::string applianceId,
               render::Icon onIcon,
               render::Icon offIcon,
               render::Icon loadingIcon);

    void onPress(KeyId key) override;

  protected:
    void draw() override;

  private:
    const render::Icon onIcon_;
    const render::Icon offIcon_;
};

/// @brief Mode bound to one key and its icons for the active and inactive look.
struct AcModeSetting
{
    std::string mode;
    std::optional<render::Icon> onIcon{};
    std::optional<render::Icon> offIcon{};

    /// @brief Configured icon, or the mode name (inverted when @p on).
    [[nodiscard]] render::Icon icon(bool on) const;
};

/// @brief One key per mode; pressing the active mode powers off, another mode
///        switches to it and powers on.
class AcModeKeySet final : public AcKey
{
  public:
    AcModeKeySet(app::Context &ctx,
                 std::shared_ptr<ClimateService> service,
                 std::string applianceId,
                 std::map<KeyId, AcModeSetting> settings,
                 render::Icon loadingIcon = render::ColorIcon{});

    void onPress(KeyId key) override;

  protected:
    void draw() override;

  private:
    const std::map<KeyId, AcModeSetting> settings_;
};

/// @brief Three-key gauge: up, current target and down.
/// @details Holding up or down steps the target every holdInterval; the target
///          is committed commitDelay after the last release.
class AcTempKeySet final : public AcKey
{
  public:
    static constexpr std::chrono::milliseconds kHoldInterval{500};
    static constexpr std::chrono::seconds kCommitDelay{1};

    AcTempKeySet(app::Context &ctx,
                 std::shared_ptr<ClimateService> service,
                 std::string applianceId,
                 KeyId upKey,
                 KeyId middleKey,
                 KeyId downKey);

    void onPress(KeyId key) override;
    [[nodiscard]] app::Outcome onRelease(KeyId key) override;
    void onHide() override;

    /// @brief Index of the pending target in the temperature list, -1 if none.
    [[nodiscard]] int target() const
    {
        return target_;
    }

  protected:
    void draw() override;

  private:
    void step(KeyId key, const app::LivenessToken &hold);
    void commit(std::uint64_t serial);

    const KeyId upKey_;
    const KeyId middleKey_;
    const KeyId downKey_;
    int target_{-1};
    app::Liveness hold_;
    std::uint64_t releaseSerial_{0};
};

/// @brief Cycles the fan volume; committed commitDelay after the last press.
class AcVolumeKey final : public AcKey
{
  public:
    static constexpr std::chrono::seconds kCommitDelay{1};

    AcVolumeKey(app::Context &ctx, KeySet keys, std::shared_ptr<ClimateService> service, std::string applianceId);

    void onPress(KeyId key) override;

    [[nodiscard]] int target() const
    {
        return target_;
    }

    /// @brief Gauge level of @p volume among the non-automatic entries of @p volumes.
    [[nodiscard]] static double volumeLevel(const std::vector<std::string> &volumes, const std::string &volume);

  protected:
    void draw() override;

  private:
    void commit(std::uint64_t serial);

    int target_{-1};
    std::uint64_t pressSerial_{0};
};

} // namespace keydeck::climate
