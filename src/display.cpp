#include "display.hpp"
#include <algorithm>

bool Display::draw_sprite(uint8_t x, uint8_t y, const std::vector<uint8_t>& rows) {
    const size_t x0 = x % WIDTH, y0 = y % HEIGHT;
    bool collision = false;
    for (size_t r = 0; r < rows.size(); ++r) {
        const size_t py = (y0 + r) % HEIGHT;
        for (size_t c = 0; c < 8; ++c) {
            if (!(rows[r] & (0x80u >> c))) continue;
            bool& p = pixels[py * WIDTH + (x0 + c) % WIDTH];
            if (p) collision = true;
            p = !p;
        }
    }
    return collision;
}

size_t Display::lit_count() const {
    return static_cast<size_t>(std::count(pixels.begin(), pixels.end(), true));
}
