// include/keydeck/device/term_io.hpp
// @brief Terminal output shims and raw-mode session used by the terminal deck.
// @invariant StringTermIO captures writes verbatim; RealTermIO writes to stdout.
// @ownership TerminalSession restores the saved terminal mode on destruction.
#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace keydeck::device
{

class TermIO
{
  public:
    virtual ~TermIO() = default;
    virtual void write(std::string_view s) = 0;
    virtual void flush() = 0;
};

/// @brief Unbuffered writes to file descriptor 1.
class RealTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override;
    void flush() override;
};

/// @brief Collects output in memory.
class StringTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override
    {
        buffer_.append(s);
    }

    void flush() override {}

    [[nodiscard]] const std::string &buffer() const
    {
        return buffer_;
    }

    void clear()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
};

/// @brief Puts stdin into raw mode for the lifetime of the object.
/// @details Inactive when stdin is not a terminal or KEYDECK_NO_TTY=1.
class TerminalSession
{
  public:
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession &) = delete;
    TerminalSession &operator=(const TerminalSession &) = delete;

    [[nodiscard]] bool active() const
    {
        return active_;
    }

    /// @brief Whether the environment asks for headless operation.
    [[nodiscard]] static bool headlessRequested();

  private:
    bool active_{false};
    struct Saved;
    std::unique_ptr<Saved> saved_;
};

} // namespace keydeck::device
