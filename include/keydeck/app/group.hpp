// include/keydeck/app/group.hpp
// @brief Composite of applications with disjoint key sets shown together.
// @invariant keys() is the union of the children's keys.
// @ownership Group owns its children.
#pragma once

#include "keydeck/app/application.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace keydeck::app
{

class Group : public Application
{
  public:
    Group() = default;
    explicit Group(std::vector<std::unique_ptr<Application>> children);

    /// @brief Append @p child and take over its keys.
    /// @return Reference to the stored child.
    Application &add(std::unique_ptr<Application> child);

    /// @brief Construct a child in place.
    template <typename T, typename... Args> T &emplace(Args &&...args)
    {
        auto child = std::make_unique<T>(std::forward<Args>(args)...);
        T &ref = *child;
        add(std::move(child));
        return ref;
    }

    [[nodiscard]] std::size_t size() const
    {
        return children_.size();
    }

    [[nodiscard]] Application &child(std::size_t i)
    {
        return *children_.at(i);
    }

    /// @brief Display every child; rethrows the first failure after all ran.
    void onDisplay() override;

    /// @brief Hide every child; rethrows the first failure after all ran.
    void onHide() override;

    void onPress(KeyId key) override;
    [[nodiscard]] Outcome onRelease(KeyId key) override;

  private:
    Application *ownerOf(KeyId key) const;

    std::vector<std::unique_ptr<Application>> children_;
};

} // namespace keydeck::app
