// include/keydeck/device/terminal_deck.hpp
// @brief Key deck simulated in an ANSI truecolor terminal.
// @invariant Each key is drawn as a block of half-block cells, two pixel rows per cell.
// @ownership Borrows a TermIO; owns its keyboard reader thread.
#pragma once

#include "keydeck/device/driver.hpp"
#include "keydeck/device/term_io.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace keydeck::device
{

class TerminalDeck final : public DeckDriver
{
  public:
    /// @brief Cells per key edge; each cell samples KEY_SIZE / kCells pixels.
    static constexpr int kCells = 12;

    /// @param tio Output target.
    /// @param layout Grid of keys to simulate.
    /// @param keys Characters mapped to key ids in order; the shifted variant holds the key.
    /// @param readInput Whether open() starts the stdin reader thread.
    TerminalDeck(TermIO &tio, KeyLayout layout, std::string keys, bool readInput);
    ~TerminalDeck() override;

    [[nodiscard]] std::string name() const override;
    void open() override;
    void reset() override;
    void close() override;
    void setBrightness(int percent) override;
    void setKeyImage(KeyId key, const render::Bitmap &image) override;
    [[nodiscard]] int keyCount() const override;
    [[nodiscard]] KeyLayout keyLayout() const override;
    void setKeyCallback(KeyCallback callback) override;

    /// @brief Invoked from the reader thread when Ctrl+Q is typed.
    void setQuitHandler(std::function<void()> handler);

    /// @brief Key bound to @p c and whether it is the held (shifted) variant.
    [[nodiscard]] std::optional<std::pair<KeyId, bool>> keyFor(char c) const;

    /// @brief Feed one input byte as if typed; used by the reader thread.
    void feed(char c);

  private:
    void readLoop();
    void emit(KeyId key, bool pressed);

    TermIO &tio_;
    const KeyLayout layout_;
    const std::string keys_;
    const bool readInput_;
    std::mutex outMu_;
    std::mutex cbMu_;
    KeyCallback callback_;
    std::function<void()> quit_;
    int brightness_{100};
    std::atomic<bool> reading_{false};
    std::thread reader_;
};

} // namespace keydeck::device
