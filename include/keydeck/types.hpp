// include/keydeck/types.hpp
// @brief Key identifiers shared by the device, application and widget layers.
// @invariant Key ids are small non-negative integers stable for a device lifetime.
// @ownership Plain value types.
#pragma once

#include <set>

namespace keydeck
{

/// @brief Identifier of one physical key.
using KeyId = int;

/// @brief Ordered set of key identifiers owned by an application.
using KeySet = std::set<KeyId>;

/// @brief Grid dimensions reported by a device.
struct KeyLayout
{
    int rows{0};
    int cols{0};

    bool operator==(const KeyLayout &) const = default;
};

} // namespace keydeck
