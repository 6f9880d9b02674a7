#include <gtest/gtest.h>
#include <vector>
#include "machine.hpp"

std::vector<uint8_t> demo_program();

namespace {

std::vector<uint8_t> rom(const std::vector<uint16_t>& words) {
    std::vector<uint8_t> out;
    for (uint16_t w : words) { out.push_back(w >> 8); out.push_back(w & 0xFF); }
    return out;
}

// Load and execute `steps` cycles, expecting none of them to fault.
Machine run(const std::vector<uint16_t>& words, int steps) {
    Machine m;
    m.load(rom(words));
    for (int i = 0; i < steps; ++i) {
        EXPECT_TRUE(m.step_cycle()) << "cycle " << i;
    }
    return m;
}

uint16_t ld(int x, int nn) { return static_cast<uint16_t>(0x6000 | (x << 8) | nn); }
uint16_t alu(int x, int y, int n) { return static_cast<uint16_t>(0x8000 | (x << 8) | (y << 4) | n); }

} // namespace

// --- lifecycle ---

TEST(Machine, IdleUntilLoaded) {
    Machine m;
    EXPECT_EQ(m.state(), MachineState::Idle);
    EXPECT_FALSE(m.step_cycle());
    m.reset();
    EXPECT_EQ(m.state(), MachineState::Idle);
}

TEST(Machine, ClearScreenRom) {
    Machine m = run({0x00E0}, 1);
    EXPECT_EQ(m.pc(), 0x202);
    for (bool px : m.framebuffer()) EXPECT_FALSE(px);
}

TEST(Machine, LoadImmediateThenAddImmediate) {
    Machine m = run({0x6A02, 0x7A03}, 2);
    EXPECT_EQ(m.v(0xA), 5);
    EXPECT_EQ(m.pc(), 0x204);
    EXPECT_EQ(m.v(0xF), 0);
}

TEST(Machine, AddImmediateWrapsWithoutTouchingFlag) {
    Machine m = run({ld(0xF, 0x07), ld(1, 0xFF), 0x7102}, 3);
    EXPECT_EQ(m.v(1), 0x01);
    EXPECT_EQ(m.v(0xF), 0x07);
}

TEST(Machine, OversizedLoadLeavesMachineAlone) {
    Machine m;
    m.load(rom({0x6A07}));
    EXPECT_TRUE(m.step_cycle());
    EXPECT_THROW(m.load(std::vector<uint8_t>(Memory::ROM_MAX + 1)), Fault);
    EXPECT_EQ(m.state(), MachineState::Running);
    EXPECT_EQ(m.v(0xA), 7);
}

TEST(Machine, LoadResetsEverything) {
    Machine m = run({ld(3, 9), 0xA123, 0x6305, 0xF318, 0xF015, 0x2300}, 6);
    m.set_key(4, true);
    m.load(rom({0x00E0}));
    EXPECT_EQ(m.state(), MachineState::Running);
    EXPECT_EQ(m.v(3), 0);
    EXPECT_EQ(m.index(), 0);
    EXPECT_EQ(m.pc(), 0x200);
    EXPECT_EQ(m.stack_depth(), 0u);
    EXPECT_EQ(m.sound_timer(), 0);
    EXPECT_FALSE(m.key_down(4));
    EXPECT_EQ(m.cycles(), 0u);
}

TEST(Machine, ResetReloadsCurrentRom) {
    Machine m = run({ld(2, 0x42), 0x1202}, 3);
    EXPECT_EQ(m.v(2), 0x42);
    m.reset();
    EXPECT_EQ(m.v(2), 0);
    EXPECT_EQ(m.pc(), 0x200);
    EXPECT_TRUE(m.step_cycle());
    EXPECT_EQ(m.v(2), 0x42);
}

// --- flow control ---

TEST(Machine, SysIsIgnored) {
    Machine m = run({0x0123}, 1);
    EXPECT_EQ(m.pc(), 0x202);
}

TEST(Machine, JumpCallReturn) {
    // 200 CALL 206 / 202 JP 202 / 204 - / 206 V1=1 / 208 RET
    Machine m = run({0x2206, 0x1202, 0x0000, ld(1, 1), 0x00EE}, 3);
    EXPECT_EQ(m.v(1), 1);
    EXPECT_EQ(m.pc(), 0x202);
    EXPECT_EQ(m.stack_depth(), 0u);
    EXPECT_TRUE(m.step_cycle());
    EXPECT_EQ(m.pc(), 0x202);
}

TEST(Machine, JumpWithOffsetAddsV0) {
    Machine m = run({ld(0, 0x10), 0xB300}, 2);
    EXPECT_EQ(m.pc(), 0x310);
}

TEST(Machine, SkipInstructions) {
    struct { std::vector<uint16_t> prog; uint16_t pc; } cases[] = {
        {{ld(1, 5), 0x3105}, 0x206},              // SE taken
        {{ld(1, 5), 0x3106}, 0x204},
        {{ld(1, 5), 0x4106}, 0x206},              // SNE taken
        {{ld(1, 5), 0x4105}, 0x204},
        {{ld(1, 5), ld(2, 5), 0x5120}, 0x208},    // SE Vx,Vy taken
        {{ld(1, 5), ld(2, 6), 0x5120}, 0x206},
        {{ld(1, 5), ld(2, 6), 0x9120}, 0x208},    // SNE Vx,Vy taken
        {{ld(1, 5), ld(2, 5), 0x9120}, 0x206},
    };
    for (const auto& c : cases) {
        Machine m = run(c.prog, static_cast<int>(c.prog.size()));
        EXPECT_EQ(m.pc(), c.pc);
    }
}

// --- arithmetic and flags ---

TEST(Machine, BitwiseOps) {
    Machine m = run({ld(0, 0xCC), ld(1, 0xAA), ld(2, 0xCC), ld(3, 0xCC), ld(0xF, 9),
                     alu(0, 1, 1), alu(2, 1, 2), alu(3, 1, 3), alu(4, 1, 0)}, 9);
    EXPECT_EQ(m.v(0), 0xEE);
    EXPECT_EQ(m.v(2), 0x88);
    EXPECT_EQ(m.v(3), 0x66);
    EXPECT_EQ(m.v(4), 0xAA);
    EXPECT_EQ(m.v(0xF), 9);
}

TEST(Machine, AddCarryTruthTable) {
    const int values[] = {0, 1, 0x7F, 0x80, 0xFE, 0xFF};
    for (int a : values) {
        for (int b : values) {
            Machine m = run({ld(0, a), ld(1, b), alu(0, 1, 4)}, 3);
            EXPECT_EQ(m.v(0), (a + b) & 0xFF) << a << "+" << b;
            EXPECT_EQ(m.v(0xF), (a + b) > 0xFF ? 1 : 0) << a << "+" << b;
        }
    }
}

TEST(Machine, SubtractBorrowTruthTable) {
    const int values[] = {0, 1, 0x7F, 0x80, 0xFF};
    for (int a : values) {
        for (int b : values) {
            Machine sub = run({ld(0, a), ld(1, b), alu(0, 1, 5)}, 3);
            EXPECT_EQ(sub.v(0), (a - b) & 0xFF);
            EXPECT_EQ(sub.v(0xF), a >= b ? 1 : 0) << a << "-" << b;

            Machine subn = run({ld(0, a), ld(1, b), alu(0, 1, 7)}, 3);
            EXPECT_EQ(subn.v(0), (b - a) & 0xFF);
            EXPECT_EQ(subn.v(0xF), b >= a ? 1 : 0) << b << "-" << a;
        }
    }
}

TEST(Machine, ShiftsReportShiftedOutBit) {
    Machine r = run({ld(2, 0x81), alu(2, 0, 6)}, 2);
    EXPECT_EQ(r.v(2), 0x40);
    EXPECT_EQ(r.v(0xF), 1);

    Machine l = run({ld(2, 0x81), alu(2, 0, 0xE)}, 2);
    EXPECT_EQ(l.v(2), 0x02);
    EXPECT_EQ(l.v(0xF), 1);

    Machine none = run({ld(2, 0x40), alu(2, 0, 0xE)}, 2);
    EXPECT_EQ(none.v(2), 0x80);
    EXPECT_EQ(none.v(0xF), 0);
}

TEST(Machine, FlagWinsWhenTargetIsVF) {
    // VF value, V1 value, ALU op, expected VF (the flag, never the result)
    struct { int vf, v1, n, flag; } cases[] = {
        {0xFF, 0x01, 0x4, 1},   // result 0x00
        {0x10, 0x01, 0x5, 1},   // result 0x0F
        {0x02, 0x00, 0x6, 0},   // result 0x01
        {0x10, 0x01, 0x7, 0},   // result 0xF1
        {0x40, 0x00, 0xE, 0},   // result 0x80
        {0x81, 0x00, 0xE, 1},   // result 0x02
    };
    for (const auto& c : cases) {
        Machine m = run({ld(0xF, c.vf), ld(1, c.v1), alu(0xF, 1, c.n)}, 3);
        EXPECT_EQ(m.v(0xF), c.flag) << "8F1" << std::hex << c.n << " with VF=" << c.vf;
    }
}

// --- index register and memory ---

TEST(Machine, IndexOps) {
    Machine m = run({0xA300, ld(4, 0x20), 0xF41E}, 3);
    EXPECT_EQ(m.index(), 0x320);

    Machine f = run({ld(4, 0x1B), 0xF429}, 2);
    EXPECT_EQ(f.index(), Memory::font_address(0xB));
}

TEST(Machine, BcdDigits) {
    Machine m = run({ld(5, 254), 0xA400, 0xF533}, 3);
    EXPECT_EQ(m.peek(0x400), 2);
    EXPECT_EQ(m.peek(0x401), 5);
    EXPECT_EQ(m.peek(0x402), 4);
    EXPECT_EQ(m.index(), 0x400);
}

TEST(Machine, StoreAndLoadRegistersKeepIndex) {
    Machine m = run({ld(0, 1), ld(1, 2), ld(2, 3), ld(3, 4), 0xA500, 0xF255,
                     ld(0, 0), ld(1, 0), ld(2, 0), ld(3, 0), 0xF365}, 11);
    EXPECT_EQ(m.peek(0x500), 1);
    EXPECT_EQ(m.peek(0x502), 3);
    EXPECT_EQ(m.peek(0x503), 0);   // V3 was not stored
    EXPECT_EQ(m.v(0), 1);
    EXPECT_EQ(m.v(2), 3);
    EXPECT_EQ(m.v(3), 0);
    EXPECT_EQ(m.index(), 0x500);
}

// --- drawing ---

TEST(Machine, DrawGlyphAndCollide) {
    // I = glyph 0, draw at (0,0) twice
    Machine m = run({ld(0, 0), 0xF029, 0xD005}, 3);
    const Display::Frame fb = m.framebuffer();
    int lit = 0;
    for (bool px : fb) lit += px;
    EXPECT_EQ(lit, 14);
    EXPECT_EQ(m.lit_pixels(), 14u);
    EXPECT_EQ(m.v(0xF), 0);

    Machine twice = run({ld(0, 0), 0xF029, 0xD005, 0xD005}, 4);
    for (bool px : twice.framebuffer()) EXPECT_FALSE(px);
    EXPECT_EQ(twice.lit_pixels(), 0u);
    EXPECT_EQ(twice.v(0xF), 1);
}

TEST(Machine, ZeroHeightDrawChangesNothingAndClearsFlag) {
    // glyph 0 at (0,0), then VF = 7 and a zero-row draw over the same spot
    Machine m = run({ld(0, 0), 0xF029, 0xD005, ld(0xF, 7), 0xD000}, 5);
    EXPECT_EQ(m.lit_pixels(), 14u);
    EXPECT_TRUE(m.framebuffer()[0]);
    EXPECT_EQ(m.v(0xF), 0);
    EXPECT_EQ(m.pc(), 0x20A);
}

TEST(Machine, DrawOutsideMemoryHalts) {
    Machine m;
    m.load(rom({0xAFFE, 0xD005}));
    EXPECT_TRUE(m.step_cycle());
    EXPECT_FALSE(m.step_cycle());
    ASSERT_TRUE(m.last_fault().has_value());
    EXPECT_EQ(m.last_fault()->kind, FaultKind::OutOfBounds);
    EXPECT_EQ(m.last_fault()->pc, 0x202);
    EXPECT_EQ(m.last_fault()->opcode, 0xD005);
    EXPECT_EQ(m.last_fault()->op, Op::DRW);
    EXPECT_EQ(m.pc(), 0x202);
}

// --- random ---

TEST(Machine, RandomIsMaskedAndSeeded) {
    std::vector<uint16_t> words;
    for (int r = 0; r < 8; ++r) words.push_back(static_cast<uint16_t>(0xC00F | (r << 8)));

    MachineConfig cfg; cfg.seed = 1234;
    Machine a(cfg), b(cfg);
    a.load(rom(words));
    b.load(rom(words));
    for (size_t i = 0; i < words.size(); ++i) { a.step_cycle(); b.step_cycle(); }
    for (int r = 0; r < 8; ++r) {
        EXPECT_LE(a.v(r), 0x0F);
        EXPECT_EQ(a.v(r), b.v(r));
    }
}

// --- timers ---

TEST(Machine, TimerOps) {
    Machine m = run({ld(1, 3), 0xF115, 0xF118}, 3);
    EXPECT_EQ(m.delay_timer(), 3);
    EXPECT_TRUE(m.sound_active());
    m.tick_timers();
    m.tick_timers();
    m.tick_timers();
    m.tick_timers();
    EXPECT_EQ(m.delay_timer(), 0);
    EXPECT_FALSE(m.sound_active());
}

TEST(Machine, ReadDelayIntoRegister) {
    Machine m = run({ld(1, 10), 0xF115}, 2);
    m.tick_timers();
    m.tick_timers();
    m.load(rom({ld(1, 10), 0xF115, 0xF207}));
    EXPECT_EQ(m.delay_timer(), 0);
    m.step_cycle();
    m.step_cycle();
    m.tick_timers();
    m.tick_timers();
    EXPECT_TRUE(m.step_cycle());
    EXPECT_EQ(m.v(2), 8);
}

// --- keys ---

TEST(Machine, SkipOnKeyState) {
    Machine m;
    m.load(rom({ld(1, 0x15), 0xE19E, 0x0000, 0xE1A1}));   // low nibble: key 5
    m.set_key(5, true);
    EXPECT_TRUE(m.keys()[5]);
    EXPECT_FALSE(m.keys()[4]);
    m.step_cycle();
    m.step_cycle();
    EXPECT_EQ(m.pc(), 0x206);
    m.step_cycle();
    EXPECT_EQ(m.pc(), 0x208);   // key down, SKNP does not skip
}

TEST(Machine, KeyWaitBlocksUntilPress) {
    Machine m;
    m.load(rom({0xF30A, ld(4, 1)}));
    EXPECT_TRUE(m.step_cycle());
    EXPECT_EQ(m.state(), MachineState::WaitingForKey);
    EXPECT_EQ(m.pc(), 0x200);
    for (int i = 0; i < 10; ++i) EXPECT_TRUE(m.step_cycle());
    EXPECT_EQ(m.pc(), 0x200);

    m.set_key(5, true);
    EXPECT_EQ(m.state(), MachineState::Running);
    EXPECT_EQ(m.v(3), 5);
    EXPECT_EQ(m.pc(), 0x202);
    EXPECT_TRUE(m.step_cycle());
    EXPECT_EQ(m.v(4), 1);
}

TEST(Machine, KeyWaitNeedsAFreshPress) {
    Machine m;
    m.load(rom({0xF20A}));
    m.set_key(9, true);
    m.step_cycle();
    EXPECT_EQ(m.state(), MachineState::WaitingForKey);
    m.set_key(9, true);        // still held, no transition
    EXPECT_EQ(m.state(), MachineState::WaitingForKey);
    m.set_key(9, false);
    EXPECT_EQ(m.state(), MachineState::WaitingForKey);
    m.set_key(9, true);
    EXPECT_EQ(m.state(), MachineState::Running);
    EXPECT_EQ(m.v(2), 9);
}

TEST(Machine, TimersRunWhileWaitingForKey) {
    Machine m = run({ld(1, 2), 0xF115, 0xF00A}, 3);
    ASSERT_EQ(m.state(), MachineState::WaitingForKey);
    m.tick_timers();
    EXPECT_EQ(m.delay_timer(), 1);
}

TEST(Machine, InvalidKeyIdIsRejected) {
    Machine m;
    m.load(rom({0x00E0}));
    EXPECT_THROW(m.set_key(16, true), Fault);
    EXPECT_EQ(m.state(), MachineState::Running);
}

// --- faults ---

TEST(Machine, SeventeenNestedCallsOverflow) {
    Machine m;
    m.load(rom({0x2200}));   // calls itself
    for (int i = 0; i < 16; ++i) ASSERT_TRUE(m.step_cycle()) << "call " << i;
    EXPECT_EQ(m.stack_depth(), 16u);
    EXPECT_FALSE(m.step_cycle());
    EXPECT_EQ(m.state(), MachineState::Halted);
    ASSERT_TRUE(m.last_fault().has_value());
    EXPECT_EQ(m.last_fault()->kind, FaultKind::StackOverflow);
    EXPECT_EQ(m.last_fault()->pc, 0x200);
    EXPECT_EQ(m.last_fault()->opcode, 0x2200);
    EXPECT_EQ(m.last_fault()->op, Op::CALL);
    EXPECT_EQ(m.pc(), m.last_fault()->pc);
    EXPECT_EQ(m.stack_depth(), 16u);
}

TEST(Machine, ReturnWithoutCallUnderflows) {
    Machine m;
    m.load(rom({ld(1, 1), 0x00EE}));
    EXPECT_TRUE(m.step_cycle());
    EXPECT_FALSE(m.step_cycle());
    EXPECT_EQ(m.last_fault()->kind, FaultKind::StackUnderflow);
    EXPECT_EQ(m.last_fault()->pc, 0x202);
    EXPECT_EQ(m.last_fault()->op, Op::RET);
    EXPECT_EQ(m.pc(), m.last_fault()->pc);
}

TEST(Machine, FaultAfterJumpLeavesPcOnTarget) {
    // JP 204 / - / unknown word at the jump target
    Machine m;
    m.load(rom({0x1204, 0x0000, 0x5121}));
    EXPECT_TRUE(m.step_cycle());
    EXPECT_FALSE(m.step_cycle());
    EXPECT_EQ(m.last_fault()->pc, 0x204);
    EXPECT_EQ(m.pc(), 0x204);
    EXPECT_FALSE(m.last_fault()->op.has_value());
}

TEST(Machine, UnknownOpcodeHaltsUntilNextLoad) {
    Machine m;
    m.load(rom({ld(1, 1), 0x5121}));
    EXPECT_TRUE(m.step_cycle());
    EXPECT_FALSE(m.step_cycle());
    EXPECT_EQ(m.state(), MachineState::Halted);
    EXPECT_EQ(m.last_fault()->kind, FaultKind::UnknownOpcode);
    EXPECT_EQ(m.last_fault()->pc, 0x202);
    EXPECT_EQ(m.last_fault()->opcode, 0x5121);

    const uint64_t cycles = m.cycles();
    EXPECT_FALSE(m.step_cycle());
    m.tick_timers();
    EXPECT_EQ(m.cycles(), cycles);
    EXPECT_EQ(m.pc(), 0x202);

    m.load(rom({0x00E0}));
    EXPECT_EQ(m.state(), MachineState::Running);
    EXPECT_FALSE(m.last_fault().has_value());
    EXPECT_TRUE(m.step_cycle());
}

TEST(Machine, FetchPastEndOfMemoryHalts) {
    Machine m;
    m.load(rom({0x1FFF}));
    EXPECT_TRUE(m.step_cycle());
    EXPECT_FALSE(m.step_cycle());
    EXPECT_EQ(m.last_fault()->kind, FaultKind::OutOfBounds);
    EXPECT_EQ(m.last_fault()->pc, 0xFFF);
    EXPECT_EQ(m.last_fault()->opcode, 0x0000);
    EXPECT_FALSE(m.last_fault()->op.has_value());
    EXPECT_EQ(m.pc(), 0xFFF);
}

TEST(Machine, StoreRegistersPastEndHalts) {
    Machine m;
    m.load(rom({0xAFFE, 0xF255}));
    m.step_cycle();
    EXPECT_FALSE(m.step_cycle());
    EXPECT_EQ(m.last_fault()->kind, FaultKind::OutOfBounds);
    EXPECT_EQ(m.last_fault()->op, Op::LD_MEM_VX);
    EXPECT_EQ(m.pc(), 0x202);
}

// --- demo ROM ---

TEST(Machine, DemoDrawsFontThenWaitsForKeys) {
    Machine m;
    m.load(demo_program());
    for (int i = 0; i < 500 && m.state() == MachineState::Running; ++i) m.step_cycle();
    ASSERT_EQ(m.state(), MachineState::WaitingForKey);
    int lit = 0;
    for (bool px : m.framebuffer()) lit += px;
    EXPECT_GT(lit, 0);

    m.set_key(0xC, true);
    for (int i = 0; i < 20 && m.state() == MachineState::Running; ++i) m.step_cycle();
    EXPECT_EQ(m.state(), MachineState::WaitingForKey);
    EXPECT_EQ(m.v(5), 0xC);
    EXPECT_TRUE(m.sound_active());
}
