#include "memory.hpp"
#include "fault.hpp"
#include <algorithm>
#include <iterator>
#include <iomanip>
#include <sstream>

static constexpr uint8_t FONT[16 * Memory::FONT_GLYPH] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

static std::string hex_addr(size_t v) {
    std::ostringstream o;
    o << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(3) << v;
    return o.str();
}

Memory::Memory() {
    std::copy(std::begin(FONT), std::end(FONT), mem.begin() + FONT_BASE);
}

void Memory::load(const std::vector<uint8_t>& rom) {
    if (rom.size() > ROM_MAX) {
        throw Fault(FaultKind::CapacityExceeded,
                    "rom is " + std::to_string(rom.size()) + " bytes, at most "
                    + std::to_string(ROM_MAX) + " fit");
    }
    mem.fill(0);
    std::copy(std::begin(FONT), std::end(FONT), mem.begin() + FONT_BASE);
    std::copy(rom.begin(), rom.end(), mem.begin() + ROM_BASE);
}

void Memory::check(size_t addr) const {
    if (addr >= MEM_SIZE)
        throw Fault(FaultKind::OutOfBounds, "memory access at " + hex_addr(addr));
}

uint8_t Memory::read_byte(size_t addr) const {
    check(addr);
    return mem[addr];
}

void Memory::write_byte(size_t addr, uint8_t value) {
    check(addr);
    mem[addr] = value;
}

uint16_t Memory::read_word(size_t addr) const {
    uint8_t hi = read_byte(addr);
    uint8_t lo = read_byte(addr + 1);
    return static_cast<uint16_t>((hi << 8) | lo);
}

uint16_t Memory::font_address(uint8_t digit) {
    return static_cast<uint16_t>(FONT_BASE + (digit & 0x0F) * FONT_GLYPH);
}
