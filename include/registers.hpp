// include/registers.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

struct RegisterFile {
    static constexpr size_t   REG_COUNT  = 16;
    static constexpr size_t   STACK_SIZE = 16;
    static constexpr uint16_t PC_START   = 0x200;

    uint16_t I{0};
    uint16_t PC{PC_START};

    void reset();

    // V0..VF; InvalidRegister outside 0..15
    uint8_t v(size_t r) const;
    void    set_v(size_t r, uint8_t value);

    // Call stack
    void     push(uint16_t addr);   // StackOverflow when full
    uint16_t pop();                 // StackUnderflow when empty
    size_t   depth() const { return SP; }

private:
    std::array<uint8_t, REG_COUNT>   V{};
    std::array<uint16_t, STACK_SIZE> stack{};
    size_t SP{0};   // next free slot

    static void check(size_t r);
};
