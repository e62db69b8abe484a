// include/keydeck/app/context.hpp
// @brief Facade handed to applications: image push, scheduling and the clock.
// @invariant Key events reach the attached application only through the runner.
// @ownership Context borrows the deck and the runner; both must outlive it.
#pragma once

#include "keydeck/device/deck.hpp"
#include "keydeck/render/icon.hpp"
#include "keydeck/sched/task_runner.hpp"

namespace keydeck::app
{

class Application;

class Context
{
  public:
    Context(device::Deck &deck, sched::TaskRunner &runner);

    /// @brief Detaches the device callback if an application was attached.
    ~Context();

    Context(const Context &) = delete;
    Context &operator=(const Context &) = delete;

    void setImage(KeyId key, const render::Icon &icon);
    void setImage(KeyId key, const render::Bitmap &image);
    void setImage(const KeySet &keys, const render::Icon &icon);
    void setImage(const KeySet &keys, const render::Bitmap &image);

    void now(sched::Task task);
    void after(sched::Duration delay, sched::Task task);
    void at(sched::TimePoint when, sched::Task task);

    [[nodiscard]] const sched::Clock &clock() const
    {
        return runner_.clock();
    }

    [[nodiscard]] sched::TaskRunner &runner()
    {
        return runner_;
    }

    [[nodiscard]] device::Deck &deck()
    {
        return deck_;
    }

    /// @brief Route key events to @p app through the runner and draw it once.
    /// @details Errors from the initial display are logged, not thrown.
    void attachApplication(Application &app);

    /// @brief attachApplication() followed by starting the runner's worker.
    void executeApplication(Application &app);

  private:
    void deliver(Application &app, KeyId key, bool pressed);

    device::Deck &deck_;
    sched::TaskRunner &runner_;
    bool attached_{false};
};

} // namespace keydeck::app
