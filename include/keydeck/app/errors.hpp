// include/keydeck/app/errors.hpp
// @brief Errors raised while building or navigating a page topology.
// @invariant Each error carries the offending page name.
// @ownership Value types.
#pragma once

#include <stdexcept>
#include <string>

namespace keydeck::app
{

/// @brief A page with the same name is already registered.
class DuplicatePageError : public std::invalid_argument
{
  public:
    explicit DuplicatePageError(const std::string &name)
        : std::invalid_argument("duplicate page: " + name), name_(name)
    {
    }

    [[nodiscard]] const std::string &name() const noexcept
    {
        return name_;
    }

  private:
    std::string name_;
};

/// @brief No page with the given name exists.
class UnknownPageError : public std::invalid_argument
{
  public:
    explicit UnknownPageError(const std::string &name)
        : std::invalid_argument("no such page: " + name), name_(name)
    {
    }

    [[nodiscard]] const std::string &name() const noexcept
    {
        return name_;
    }

  private:
    std::string name_;
};

} // namespace keydeck::app
