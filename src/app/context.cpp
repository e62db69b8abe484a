//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/app/context.cpp
// Purpose: Bridge between the device callback, the runner and the attached
//          application.
// Key invariants:
//   - The device thread only enqueues; application code runs on the worker.
//   - No exception from an application capability escapes this boundary.
//   - A switch outcome that nobody consumed is logged and dropped.
// Ownership/Lifetime: The installed callback captures this context and the
//                     application; the destructor removes it.
//
//===----------------------------------------------------------------------===//

#include "keydeck/app/context.hpp"

#include "keydeck/app/application.hpp"
#include "keydeck/log/log.hpp"

#include <exception>
#include <string>

namespace keydeck::app
{

Context::Context(device::Deck &deck, sched::TaskRunner &runner) : deck_(deck), runner_(runner) {}

Context::~Context()
{
    if (attached_)
        deck_.setKeyCallback(nullptr);
}

void Context::setImage(KeyId key, const render::Icon &icon)
{
    deck_.setImage(key, icon);
}

void Context::setImage(KeyId key, const render::Bitmap &image)
{
    deck_.setImage(key, image);
}

void Context::setImage(const KeySet &keys, const render::Icon &icon)
{
    deck_.setImage(keys, icon);
}

void Context::setImage(const KeySet &keys, const render::Bitmap &image)
{
    deck_.setImage(keys, image);
}

void Context::now(sched::Task task)
{
    runner_.now(std::move(task));
}

void Context::after(sched::Duration delay, sched::Task task)
{
    runner_.after(delay, std::move(task));
}

void Context::at(sched::TimePoint when, sched::Task task)
{
    runner_.at(when, std::move(task));
}

void Context::deliver(Application &app, KeyId key, bool pressed)
{
    try
    {
        if (pressed)
        {
            app.onPress(key);
            return;
        }
        const Outcome outcome = app.onRelease(key);
        if (outcome.isSwitch())
            log::warn("no such page: " + outcome.target());
    }
    catch (const std::exception &e)
    {
        log::error("key " + std::to_string(key) + (pressed ? " press" : " release") +
                   " failed: " + e.what());
    }
    catch (...)
    {
        log::error("key " + std::to_string(key) + (pressed ? " press" : " release") +
                   " failed: unknown exception");
    }
}

void Context::attachApplication(Application &app)
{
    deck_.setKeyCallback(
        [this, &app](KeyId key, bool pressed)
        {
            try
            {
                runner_.now([this, &app, key, pressed] { deliver(app, key, pressed); });
            }
            catch (const std::exception &e)
            {
                log::error(std::string("dropping key event: ") + e.what());
            }
            catch (...)
            {
                log::error("dropping key event: unknown exception");
            }
        });
    attached_ = true;

    try
    {
        app.onDisplay();
    }
    catch (const std::exception &e)
    {
        log::error(std::string("initial display failed: ") + e.what());
    }
    catch (...)
    {
        log::error("initial display failed: unknown exception");
    }
}

void Context::executeApplication(Application &app)
{
    attachApplication(app);
    runner_.start();
}

} // namespace keydeck::app
