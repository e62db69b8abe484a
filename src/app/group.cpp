//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/app/group.cpp
// Purpose: Fan-out of display/hide and routing of key events to children.
// Key invariants:
//   - Display and hide reach every child in insertion order within one call,
//     even when an earlier child throws.
//   - A key event goes to the first child owning the key, or nowhere.
//
//===----------------------------------------------------------------------===//

#include "keydeck/app/group.hpp"

#include "keydeck/log/log.hpp"

#include <exception>
#include <string>

namespace keydeck::app
{

namespace
{
template <typename Fn> void fanOut(const std::vector<std::unique_ptr<Application>> &children, Fn fn)
{
    std::exception_ptr first;
    for (const auto &child : children)
    {
        try
        {
            fn(*child);
        }
        catch (...)
        {
            if (!first)
                first = std::current_exception();
        }
    }
    if (first)
        std::rethrow_exception(first);
}
} // namespace

Group::Group(std::vector<std::unique_ptr<Application>> children)
{
    for (auto &child : children)
    {
        add(std::move(child));
    }
}

Application &Group::add(std::unique_ptr<Application> child)
{
    for (KeyId key : child->keys())
    {
        if (owns(key))
            log::warn("group: key " + std::to_string(key) + " already owned by an earlier child");
    }
    addKeys(child->keys());
    children_.push_back(std::move(child));
    return *children_.back();
}

Application *Group::ownerOf(KeyId key) const
{
    for (const auto &child : children_)
    {
        if (child->owns(key))
            return child.get();
    }
    return nullptr;
}

void Group::onDisplay()
{
    fanOut(children_, [](Application &a) { a.onDisplay(); });
}

void Group::onHide()
{
    fanOut(children_, [](Application &a) { a.onHide(); });
}

void Group::onPress(KeyId key)
{
    if (Application *owner = ownerOf(key))
        owner->onPress(key);
}

Outcome Group::onRelease(KeyId key)
{
    if (Application *owner = ownerOf(key))
        return owner->onRelease(key);
    return Outcome::handled();
}

} // namespace keydeck::app
