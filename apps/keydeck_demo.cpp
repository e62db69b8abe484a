// apps/keydeck_demo.cpp
// @brief Demo wiring a deck, the runner and the STBY / AC / TOOLS pages.
// @invariant Exits on Ctrl+Q in interactive mode; headless renders once.
// @ownership main owns the deck, runner, context and page topology.

#include "keydeck/app/context.hpp"
#include "keydeck/app/group.hpp"
#include "keydeck/app/pager.hpp"
#include "keydeck/app/static_key.hpp"
#include "keydeck/climate/ac_keys.hpp"
#include "keydeck/climate/climate_bridge.hpp"
#include "keydeck/climate/climate_service.hpp"
#include "keydeck/climate/room_temp_key.hpp"
#include "keydeck/config/config.hpp"
#include "keydeck/device/deck.hpp"
#include "keydeck/device/term_io.hpp"
#include "keydeck/device/terminal_deck.hpp"
#include "keydeck/device/virtual_deck.hpp"
#include "keydeck/log/log.hpp"
#include "keydeck/sched/task_runner.hpp"
#include "keydeck/widgets/clock_key.hpp"
#include "keydeck/widgets/counter_key.hpp"
#include "keydeck/widgets/kitchen_timer_key.hpp"
#include "keydeck/widgets/stopwatch_key.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace keydeck;

namespace
{

using render::Edge;
using render::MarkerIcon;
using render::MarkerKind;
using render::TextIcon;

// Row-major keyboard layout for a 3x5 deck.
constexpr const char *kKeyMap = "12345qwertasdfg";

MarkerIcon tab(const std::string &text, Edge edge, bool active = false)
{
    return MarkerIcon{.text = text,
                      .size = 12,
                      .position = edge,
                      .kind = active ? MarkerKind::Triangle : MarkerKind::Square};
}

std::unique_ptr<app::Application> standbyPage(app::Context &ctx)
{
    auto page = std::make_unique<app::Group>();
    page->emplace<app::NavigationKey>(ctx, 0, tab("AC", Edge::Left), "AC");
    page->emplace<app::NavigationKey>(ctx, 4, tab("TOOLS", Edge::Right), "TOOLS");
    page->emplace<widgets::ClockKey>(ctx, KeySet{7}, "%H:%M", 12);
    page->emplace<widgets::ClockKey>(ctx, KeySet{12}, "%m/%d", 12);
    page->emplace<app::StaticKey>(ctx, 14, tab("STBY", Edge::Right, true));
    return page;
}

std::unique_ptr<app::Application> acPage(app::Context &ctx,
                                         const std::shared_ptr<climate::ClimateService> &service,
                                         const config::Config &cfg)
{
    const std::string &ac = cfg.climate.appliance;
    auto page = std::make_unique<app::Group>();
    page->emplace<climate::AcPowerKey>(ctx,
                                       0,
                                       service,
                                       ac,
                                       tab("ON", Edge::Left, true),
                                       tab("OFF", Edge::Left, true),
                                       tab("...", Edge::Left, true));
    std::map<KeyId, climate::AcModeSetting> modes;
    modes.emplace(1, climate::AcModeSetting{"warm", MarkerIcon{.text = "WARM", .size = 12, .width = 16}, TextIcon{.text = "WARM", .size = 12}});
    modes.emplace(2, climate::AcModeSetting{"cool", MarkerIcon{.text = "COOL", .size = 12, .width = 16}, TextIcon{.text = "COOL", .size = 12}});
    modes.emplace(6, climate::AcModeSetting{"blow", MarkerIcon{.text = "BLOW", .size = 12, .width = 16}, TextIcon{.text = "BLOW", .size = 12}});
    modes.emplace(7, climate::AcModeSetting{"dry", MarkerIcon{.text = "DRY", .size = 12, .width = 16}, TextIcon{.text = "DRY", .size = 12}});
    page->emplace<climate::AcModeKeySet>(ctx, service, ac, std::move(modes));
    page->emplace<climate::AcTempKeySet>(ctx, service, ac, 3, 8, 13);
    page->emplace<climate::RoomTempKey>(ctx, KeySet{11}, service, cfg.climate.roomSensor);
    page->emplace<climate::AcVolumeKey>(ctx, KeySet{12}, service, ac);
    page->emplace<app::NavigationKey>(ctx, 4, tab("TOOLS", Edge::Right), "TOOLS");
    page->emplace<app::NavigationKey>(ctx, 14, tab("STBY", Edge::Right), "STBY");
    return page;
}

std::unique_ptr<app::Application> toolsPage(app::Context &ctx, const config::Config &cfg)
{
    const sched::Duration longPress = cfg.runtime.longPressDelay;
    auto page = std::make_unique<app::Group>();
    page->emplace<widgets::CounterKey>(
        ctx, KeySet{0, 1}, render::kBlack, render::kWhite, 24, longPress);
    page->emplace<widgets::ClockKey>(ctx, KeySet{2}, "%H:%M:%S", 12);
    page->emplace<widgets::ClockKey>(ctx, KeySet{3}, "%m/%d", 12);
    page->emplace<app::StaticKey>(ctx, 4, tab("TOOLS", Edge::Right, true));
    page->emplace<widgets::StopWatchKey>(ctx, KeySet{5, 6});
    page->emplace<widgets::KitchenTimerKey>(ctx, 10, 11, 12, longPress);
    page->emplace<app::NavigationKey>(ctx, 9, tab("AC", Edge::Right), "AC");
    page->emplace<app::NavigationKey>(ctx, 14, tab("STBY", Edge::Right), "STBY");
    return page;
}

} // namespace

int main(int argc, char **argv)
{
    config::Config cfg;
    if (argc > 1 && !config::loadFromFile(argv[1], cfg))
    {
        log::error(std::string("cannot read configuration: ") + argv[1]);
        return 1;
    }
    log::setLevel(cfg.log.level);

    device::TerminalSession session;
    const bool headless = !session.active();
    device::RealTermIO tio;

    device::DeviceManager manager;
    device::TerminalDeck *terminal = nullptr;
    if (headless)
    {
        manager.addProvider(device::VirtualDeck::provider());
    }
    else
    {
        manager.addProvider(
            [&tio, &terminal]
            {
                auto deck = std::make_unique<device::TerminalDeck>(
                    tio, device::VirtualDeck::kDefaultLayout, kKeyMap, true);
                terminal = deck.get();
                std::vector<std::unique_ptr<device::DeckDriver>> out;
                out.push_back(std::move(deck));
                return out;
            });
    }

    // Outlives the deck: the terminal reader thread may still call the quit handler.
    sched::TaskRunner runner;
    std::unique_ptr<device::Deck> deck;
    try
    {
        deck = device::Deck::open(manager, cfg.device.index);
    }
    catch (const device::DeviceNotFoundError &e)
    {
        log::error(e.what());
        return 1;
    }
    deck->setBrightness(cfg.device.brightness);

    auto bridge = std::make_shared<climate::SimulatedClimateBridge>(cfg.climate.appliance, cfg.climate.roomSensor);
    auto service = std::make_shared<climate::ClimateService>(bridge, runner.clock(), cfg.climate.cacheTtl);

    app::Context ctx(*deck, runner);
    std::vector<app::Pager::Page> pages;
    pages.push_back({"STBY", standbyPage(ctx)});
    pages.push_back({"AC", acPage(ctx, service, cfg)});
    pages.push_back({"TOOLS", toolsPage(ctx, cfg)});
    app::Pager pager(ctx, "STBY", std::move(pages));

    if (headless)
    {
        ctx.attachApplication(pager);
        runner.poll();
        log::info("headless: first frame rendered");
        return 0;
    }

    if (terminal)
        terminal->setQuitHandler([&runner] { runner.requestStop(); });
    ctx.executeApplication(pager);
    runner.wait();
    if (terminal)
        terminal->setQuitHandler(nullptr);
    log::info("bye");
    return 0;
}
