// include/keydeck/app/pager.hpp
// @brief Named pages of which exactly one is shown at a time.
// @invariant current() is always one of the registered pages.
// @invariant keys() is the union of every page's keys.
// @ownership Pager owns its pages and borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"

#include <memory>
#include <string>
#include <vector>

namespace keydeck::app
{

class Pager : public Application
{
  public:
    struct Page
    {
        std::string name;
        std::unique_ptr<Application> app;
    };

    /// @throws DuplicatePageError when two pages share a name.
    /// @throws UnknownPageError when @p defaultName is not among @p pages.
    Pager(Context &ctx, std::string defaultName, std::vector<Page> pages);

    /// @brief Register another page.
    /// @throws DuplicatePageError when @p name is taken.
    Application &addPage(std::string name, std::unique_ptr<Application> app);

    /// @brief Hide the current page, show @p name and blank keys it leaves unused.
    /// @details Ignored with a warning while another switch of this pager runs.
    /// @throws UnknownPageError when @p name is not registered.
    void switchTo(const std::string &name);

    void onDisplay() override;
    void onHide() override;
    void onPress(KeyId key) override;

    /// @brief Delegates to the current page and consumes switches to known pages.
    /// @return handled, or the unchanged outcome when its target is unknown here.
    [[nodiscard]] Outcome onRelease(KeyId key) override;

    [[nodiscard]] std::vector<std::string> pageNames() const;

    /// @throws UnknownPageError when @p name is not registered.
    [[nodiscard]] Application &page(const std::string &name) const;

    [[nodiscard]] Application &current() const
    {
        return *current_;
    }

    [[nodiscard]] const std::string &currentName() const
    {
        return currentName_;
    }

    [[nodiscard]] const std::string &defaultName() const
    {
        return defaultName_;
    }

  private:
    Application *find(const std::string &name) const;

    Context &ctx_;
    const std::string defaultName_;
    std::vector<Page> pages_;
    Application *current_{nullptr};
    std::string currentName_;
    bool switching_{false};
};

} // namespace keydeck::app
