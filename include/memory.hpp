// include/memory.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

class Memory {
public:
    static constexpr size_t   MEM_SIZE   = 4096;
    static constexpr uint16_t FONT_BASE  = 0x050;
    static constexpr uint16_t FONT_GLYPH = 5;       // bytes per glyph
    static constexpr uint16_t ROM_BASE   = 0x200;
    static constexpr size_t   ROM_MAX    = MEM_SIZE - ROM_BASE;

    Memory();

    // Zero everything, install the font, copy rom at 0x200.
    // Throws CapacityExceeded before touching anything if rom does not fit.
    void load(const std::vector<uint8_t>& rom);

    uint8_t  read_byte(size_t addr) const;
    void     write_byte(size_t addr, uint8_t value);
    uint16_t read_word(size_t addr) const;   // big-endian

    static uint16_t font_address(uint8_t digit);

private:
    std::array<uint8_t, MEM_SIZE> mem{};

    void check(size_t addr) const;
};
