// include/machine.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "decoder.hpp"
#include "display.hpp"
#include "fault.hpp"
#include "keypad.hpp"
#include "memory.hpp"
#include "registers.hpp"
#include "timers.hpp"

enum class MachineState { Idle, Running, WaitingForKey, Halted };

const char* state_name(MachineState s);

struct MachineConfig {
    uint32_t seed{0xC8C8C8C8};   // RND generator seed
};

// One CHIP-8 machine. Owns every piece of mutable state; drivers only copy
// frames/timers out and keys/ROM bytes in.
class Machine {
public:
    explicit Machine(MachineConfig cfg = {});

    // Full reset then Running. Throws CapacityExceeded (machine untouched).
    void load(const std::vector<uint8_t>& rom);
    // Reload the last ROM. No-op while Idle.
    void reset();

    // Timing entry points
    bool step_cycle();    // false when Idle/Halted (or this cycle faulted)
    void tick_timers();

    // Inward
    void set_key(uint8_t k, bool down);

    // Outward
    Display::Frame framebuffer() const { return display.snapshot(); }
    size_t lit_pixels() const { return display.lit_count(); }
    bool sound_active() const { return timers.sound_active(); }

    MachineState state() const { return state_; }
    const std::optional<Fault>& last_fault() const { return fault_; }
    uint64_t cycles() const { return cycles_; }

    uint16_t pc() const { return regs.PC; }
    uint16_t index() const { return regs.I; }
    uint8_t  v(size_t r) const { return regs.v(r); }
    size_t   stack_depth() const { return regs.depth(); }
    uint8_t  delay_timer() const { return timers.delay(); }
    uint8_t  sound_timer() const { return timers.sound(); }
    bool     key_down(uint8_t k) const { return keypad.is_down(k); }
    const std::array<bool, Keypad::KEY_COUNT>& keys() const { return keypad.keys(); }
    uint8_t  peek(size_t addr) const { return mem.read_byte(addr); }

private:
    Memory       mem;
    RegisterFile regs;
    Timers       timers;
    Keypad       keypad;
    Display      display;

    MachineState         state_{MachineState::Idle};
    std::optional<Fault> fault_;
    uint64_t             cycles_{0};
    std::vector<uint8_t> rom_;
    std::mt19937         rng;
    uint32_t             seed;

    void execute(const Instruction& ins);
    void skip_if(bool cond) { if (cond) regs.PC = static_cast<uint16_t>(regs.PC + 2); }
    void set_with_flag(uint8_t x, uint8_t result, uint8_t flag);
};
