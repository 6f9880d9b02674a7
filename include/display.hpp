// include/display.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

struct Display {
    static constexpr size_t WIDTH  = 64;
    static constexpr size_t HEIGHT = 32;

    using Frame = std::array<bool, WIDTH * HEIGHT>;   // row-major

    void clear() { pixels.fill(false); }

    // XOR rows (8 bits each, MSB leftmost) at (x mod W, y mod H), wrapping
    // on both edges. Returns true if any lit pixel was turned off.
    bool draw_sprite(uint8_t x, uint8_t y, const std::vector<uint8_t>& rows);

    bool pixel(size_t x, size_t y) const { return pixels[(y % HEIGHT) * WIDTH + (x % WIDTH)]; }
    size_t lit_count() const;

    Frame snapshot() const { return pixels; }

private:
    Frame pixels{};
};
