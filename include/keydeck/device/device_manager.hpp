// include/keydeck/device/device_manager.hpp
// @brief Enumerates key decks from registered driver providers.
// @invariant Enumeration order is provider registration order.
// @ownership Returned drivers are owned by the caller.
#pragma once

#include "keydeck/device/driver.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace keydeck::device
{

class DeviceManager
{
  public:
    /// @brief Produces the devices a transport currently sees.
    using Provider = std::function<std::vector<std::unique_ptr<DeckDriver>>()>;

    void addProvider(Provider provider);

    /// @brief All devices from all providers, in registration order.
    [[nodiscard]] std::vector<std::unique_ptr<DeckDriver>> enumerate() const;

  private:
    std::vector<Provider> providers_;
};

} // namespace keydeck::device
