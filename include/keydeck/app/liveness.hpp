// include/keydeck/app/liveness.hpp
// @brief Tokens that keep self-rescheduling loops alive until revoked.
// @invariant renew() revokes the previous token before issuing a new one.
// @ownership Tokens are shared between the issuer and the loops holding them.
#pragma once

#include <atomic>
#include <memory>

namespace keydeck::app
{

using LivenessToken = std::shared_ptr<const std::atomic<bool>>;

/// @brief Whether a loop holding @p token should keep going.
[[nodiscard]] inline bool isAlive(const LivenessToken &token)
{
    return token && token->load();
}

/// @brief Issuer of liveness tokens; one generation is live at a time.
class Liveness
{
  public:
    ~Liveness()
    {
        revoke();
    }

    /// @brief Revoke the current token and issue a fresh live one.
    [[nodiscard]] LivenessToken renew()
    {
        revoke();
        current_ = std::make_shared<std::atomic<bool>>(true);
        return current_;
    }

    /// @brief Stop every loop holding the current token.
    void revoke()
    {
        if (current_)
            current_->store(false);
    }

    [[nodiscard]] bool alive() const
    {
        return current_ && current_->load();
    }

  private:
    std::shared_ptr<std::atomic<bool>> current_;
};

} // namespace keydeck::app
