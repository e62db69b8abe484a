//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/device/terminal_deck.cpp
// Purpose: Draw key images with truecolor half blocks and turn keystrokes into
//          key edges on a reader thread.
// Key invariants:
//   - Output for one key is written under outMu_ so frames never interleave.
//   - A plain keystroke yields press then release; a shifted one holds the
//     key for one second first.
// Ownership/Lifetime: close() joins the reader thread before returning.
//
//===----------------------------------------------------------------------===//

#include "keydeck/device/terminal_deck.hpp"

#include "keydeck/log/log.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <poll.h>
#include <unistd.h>

namespace keydeck::device
{

namespace
{
constexpr int kTopRow = 3;
constexpr int kGap = 2;
constexpr char kCtrlQ = 17;
constexpr const char *kShiftedDigits = ")!@#$%^&*(";

std::string sgr(render::Rgb fg, render::Rgb bg)
{
    return "\x1b[38;2;" + std::to_string(fg.r) + ";" + std::to_string(fg.g) + ";" + std::to_string(fg.b) +
           ";48;2;" + std::to_string(bg.r) + ";" + std::to_string(bg.g) + ";" + std::to_string(bg.b) + "m";
}

std::string moveTo(int row, int col)
{
    return "\x1b[" + std::to_string(row) + ";" + std::to_string(col) + "H";
}

render::Rgb dim(render::Rgb c, int percent)
{
    return {static_cast<std::uint8_t>(c.r * percent / 100),
            static_cast<std::uint8_t>(c.g * percent / 100),
            static_cast<std::uint8_t>(c.b * percent / 100)};
}
} // namespace

TerminalDeck::TerminalDeck(TermIO &tio, KeyLayout layout, std::string keys, bool readInput)
    : tio_(tio), layout_(layout), keys_(std::move(keys)), readInput_(readInput)
{
}

TerminalDeck::~TerminalDeck()
{
    if (reader_.joinable())
    {
        reading_ = false;
        reader_.join();
    }
}

std::string TerminalDeck::name() const
{
    return "terminal deck";
}

void TerminalDeck::open()
{
    {
        std::lock_guard<std::mutex> lock(outMu_);
        tio_.write("\x1b[?25l");
    }
    if (readInput_ && !reader_.joinable())
    {
        reading_ = true;
        reader_ = std::thread([this] { readLoop(); });
    }
}

void TerminalDeck::reset()
{
    std::lock_guard<std::mutex> lock(outMu_);
    tio_.write("\x1b[0m\x1b[2J\x1b[H");
    tio_.write("KeyDeck  keys: " + keys_ + "  (shift holds, Ctrl+Q quits)");
    tio_.flush();
}

void TerminalDeck::close()
{
    if (reader_.joinable())
    {
        reading_ = false;
        reader_.join();
    }
    std::lock_guard<std::mutex> lock(outMu_);
    const int below = kTopRow + layout_.rows * (kCells / 2 + 1);
    tio_.write("\x1b[0m" + moveTo(below, 1) + "\x1b[?25h\n");
    tio_.flush();
}

void TerminalDeck::setBrightness(int percent)
{
    std::lock_guard<std::mutex> lock(outMu_);
    brightness_ = percent;
}

void TerminalDeck::setKeyImage(KeyId key, const render::Bitmap &image)
{
    if (key < 0 || key >= keyCount())
        return;
    const int step = image.width() / kCells;
    const int half = step / 2;
    const int row = key / layout_.cols;
    const int col = key % layout_.cols;
    const int top = kTopRow + row * (kCells / 2 + 1);
    const int left = 1 + col * (kCells + kGap);

    std::lock_guard<std::mutex> lock(outMu_);
    std::string out;
    for (int cy = 0; cy < kCells / 2; ++cy)
    {
        out += moveTo(top + cy, left);
        for (int cx = 0; cx < kCells; ++cx)
        {
            const int x = cx * step + half;
            const render::Rgb upper = dim(image.at(x, (2 * cy) * step + half), brightness_);
            const render::Rgb lower = dim(image.at(x, (2 * cy + 1) * step + half), brightness_);
            out += sgr(upper, lower);
            out += "\xe2\x96\x80"; // U+2580 upper half block
        }
        out += "\x1b[0m";
    }
    tio_.write(out);
    tio_.flush();
}

int TerminalDeck::keyCount() const
{
    return layout_.rows * layout_.cols;
}

KeyLayout TerminalDeck::keyLayout() const
{
    return layout_;
}

void TerminalDeck::setKeyCallback(KeyCallback callback)
{
    std::lock_guard<std::mutex> lock(cbMu_);
    callback_ = std::move(callback);
}

void TerminalDeck::setQuitHandler(std::function<void()> handler)
{
    std::lock_guard<std::mutex> lock(cbMu_);
    quit_ = std::move(handler);
}

std::optional<std::pair<KeyId, bool>> TerminalDeck::keyFor(char c) const
{
    bool held = false;
    char base = c;
    if (std::isupper(static_cast<unsigned char>(c)))
    {
        held = true;
        base = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    else if (const char *p = std::char_traits<char>::find(kShiftedDigits, 10, c))
    {
        held = true;
        base = static_cast<char>('0' + (p - kShiftedDigits));
    }
    const auto pos = keys_.find(base);
    if (pos == std::string::npos || static_cast<int>(pos) >= keyCount())
        return std::nullopt;
    return std::make_pair(static_cast<KeyId>(pos), held);
}

void TerminalDeck::emit(KeyId key, bool pressed)
{
    KeyCallback callback;
    {
        std::lock_guard<std::mutex> lock(cbMu_);
        callback = callback_;
    }
    if (callback)
        callback(key, pressed);
}

void TerminalDeck::feed(char c)
{
    if (c == kCtrlQ)
    {
        std::function<void()> quit;
        {
            std::lock_guard<std::mutex> lock(cbMu_);
            quit = quit_;
        }
        if (quit)
            quit();
        return;
    }
    auto binding = keyFor(c);
    if (!binding)
        return;
    emit(binding->first, true);
    if (binding->second)
        std::this_thread::sleep_for(std::chrono::seconds(1));
    emit(binding->first, false);
}

void TerminalDeck::readLoop()
{
    while (reading_)
    {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 100);
        if (ready <= 0)
            continue;
        char c = 0;
        if (::read(STDIN_FILENO, &c, 1) != 1)
            continue;
        try
        {
            feed(c);
        }
        catch (const std::exception &e)
        {
            log::error("terminal input failed: " + std::string(e.what()));
        }
    }
}

} // namespace keydeck::device
