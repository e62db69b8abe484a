//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/app/pager.cpp
// Purpose: Page registry and page switching.
// Key invariants:
//   - A switch hides the old page, makes the new one current, displays it and
//     paints black over keys only the old page used, each step exactly once.
//   - The current page is reassigned even when hiding the old page throws.
//   - At most one switch of a pager is in progress at any time.
// Ownership/Lifetime: Pages live as long as the pager.
//
//===----------------------------------------------------------------------===//

#include "keydeck/app/pager.hpp"

#include "keydeck/app/errors.hpp"
#include "keydeck/log/log.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

namespace keydeck::app
{

Pager::Pager(Context &ctx, std::string defaultName, std::vector<Page> pages)
    : ctx_(ctx), defaultName_(std::move(defaultName))
{
    for (auto &p : pages)
    {
        addPage(std::move(p.name), std::move(p.app));
    }
    current_ = find(defaultName_);
    if (!current_)
        throw UnknownPageError(defaultName_);
    currentName_ = defaultName_;
}

Application *Pager::find(const std::string &name) const
{
    auto it = std::find_if(pages_.begin(), pages_.end(), [&](const Page &p) { return p.name == name; });
    return it == pages_.end() ? nullptr : it->app.get();
}

Application &Pager::addPage(std::string name, std::unique_ptr<Application> app)
{
    if (find(name))
        throw DuplicatePageError(name);
    addKeys(app->keys());
    pages_.push_back(Page{std::move(name), std::move(app)});
    return *pages_.back().app;
}

void Pager::switchTo(const std::string &name)
{
    Application *next = find(name);
    if (!next)
        throw UnknownPageError(name);
    if (switching_)
    {
        log::warn("page switch to " + name + " ignored: another switch is in progress");
        return;
    }

    struct Guard
    {
        bool &flag;
        ~Guard()
        {
            flag = false;
        }
    } guard{switching_};
    switching_ = true;

    log::debug("page " + currentName_ + " -> " + name);
    const KeySet oldKeys = current_->keys();
    std::exception_ptr failure;
    try
    {
        current_->onHide();
    }
    catch (...)
    {
        failure = std::current_exception();
    }

    current_ = next;
    currentName_ = name;
    try
    {
        next->onDisplay();
    }
    catch (...)
    {
        if (!failure)
            failure = std::current_exception();
    }

    KeySet stale;
    std::set_difference(oldKeys.begin(),
                        oldKeys.end(),
                        next->keys().begin(),
                        next->keys().end(),
                        std::inserter(stale, stale.end()));
    if (!stale.empty())
        ctx_.setImage(stale, render::Icon{});

    if (failure)
        std::rethrow_exception(failure);
}

void Pager::onDisplay()
{
    current_->onDisplay();
}

void Pager::onHide()
{
    current_->onHide();
}

void Pager::onPress(KeyId key)
{
    current_->onPress(key);
}

Outcome Pager::onRelease(KeyId key)
{
    Outcome outcome = current_->onRelease(key);
    if (outcome.isSwitch() && find(outcome.target()))
    {
        switchTo(outcome.target());
        return Outcome::handled();
    }
    return outcome;
}

std::vector<std::string> Pager::pageNames() const
{
    std::vector<std::string> names;
    names.reserve(pages_.size());
    for (const auto &p : pages_)
    {
        names.push_back(p.name);
    }
    return names;
}

Application &Pager::page(const std::string &name) const
{
    Application *app = find(name);
    if (!app)
        throw UnknownPageError(name);
    return *app;
}

} // namespace keydeck::app
