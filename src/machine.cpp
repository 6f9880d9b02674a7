#include "machine.hpp"

const char* state_name(MachineState s) {
    switch (s) {
        case MachineState::Idle:          return "Idle";
        case MachineState::Running:       return "Running";
        case MachineState::WaitingForKey: return "WaitingForKey";
        case MachineState::Halted:        return "Halted";
    }
    return "?";
}

Machine::Machine(MachineConfig cfg) : rng(cfg.seed), seed(cfg.seed) {}

void Machine::load(const std::vector<uint8_t>& rom) {
    mem.load(rom);   // throws before anything changes
    regs.reset();
    timers.reset();
    keypad.reset();
    display.clear();
    rng.seed(seed);
    fault_.reset();
    cycles_ = 0;
    rom_ = rom;
    state_ = MachineState::Running;
}

void Machine::reset() {
    if (state_ == MachineState::Idle) return;
    const std::vector<uint8_t> rom = rom_;
    load(rom);
}

bool Machine::step_cycle() {
    switch (state_) {
        case MachineState::Idle:
        case MachineState::Halted:
            return false;
        case MachineState::WaitingForKey:
            return true;   // yield; set_key resumes
        case MachineState::Running:
            break;
    }

    const uint16_t at = regs.PC;
    uint16_t word = 0;
    std::optional<Op> op;
    try {
        word = mem.read_word(at);
        const Instruction ins = decode(word);
        op = ins.op;
        regs.PC = static_cast<uint16_t>(at + 2);
        execute(ins);
    } catch (Fault& f) {
        regs.PC = at;   // stays on the faulting instruction
        f.pc = at;
        f.opcode = word;
        f.op = op;
        fault_ = f;
        state_ = MachineState::Halted;
        return false;
    }
    ++cycles_;
    return true;
}

void Machine::tick_timers() {
    if (state_ == MachineState::Running || state_ == MachineState::WaitingForKey)
        timers.tick();
}

void Machine::set_key(uint8_t k, bool down) {
    const bool pressed = keypad.set_key(k, down);
    if (pressed && state_ == MachineState::WaitingForKey) {
        regs.set_v(keypad.wait_register(), k);
        regs.PC = static_cast<uint16_t>(regs.PC + 2);
        keypad.end_wait();
        state_ = MachineState::Running;
    }
}

// VX first, VF last: with X == F the flag is what remains.
void Machine::set_with_flag(uint8_t x, uint8_t result, uint8_t flag) {
    regs.set_v(x, result);
    regs.set_v(0xF, flag);
}

void Machine::execute(const Instruction& ins) {
    const uint8_t x = ins.x, y = ins.y;

    switch (ins.op) {
        case Op::SYS: break;   // machine-code routines are not emulated
        case Op::CLS: display.clear(); break;
        case Op::RET: regs.PC = regs.pop(); break;
        case Op::JP:  regs.PC = ins.nnn; break;
        case Op::CALL:
            regs.push(regs.PC);
            regs.PC = ins.nnn;
            break;

        case Op::SE_VX_NN:  skip_if(regs.v(x) == ins.nn); break;
        case Op::SNE_VX_NN: skip_if(regs.v(x) != ins.nn); break;
        case Op::SE_VX_VY:  skip_if(regs.v(x) == regs.v(y)); break;
        case Op::SNE_VX_VY: skip_if(regs.v(x) != regs.v(y)); break;

        case Op::LD_VX_NN:  regs.set_v(x, ins.nn); break;
        case Op::ADD_VX_NN: regs.set_v(x, static_cast<uint8_t>(regs.v(x) + ins.nn)); break;

        case Op::LD_VX_VY: regs.set_v(x, regs.v(y)); break;
        case Op::OR:       regs.set_v(x, regs.v(x) | regs.v(y)); break;
        case Op::AND:      regs.set_v(x, regs.v(x) & regs.v(y)); break;
        case Op::XOR:      regs.set_v(x, regs.v(x) ^ regs.v(y)); break;

        case Op::ADD_VX_VY: {
            const unsigned sum = unsigned(regs.v(x)) + regs.v(y);
            set_with_flag(x, static_cast<uint8_t>(sum), sum > 0xFF ? 1 : 0);
            break;
        }
        case Op::SUB: {
            const uint8_t a = regs.v(x), b = regs.v(y);
            set_with_flag(x, static_cast<uint8_t>(a - b), a >= b ? 1 : 0);
            break;
        }
        case Op::SUBN: {
            const uint8_t a = regs.v(x), b = regs.v(y);
            set_with_flag(x, static_cast<uint8_t>(b - a), b >= a ? 1 : 0);
            break;
        }
        case Op::SHR: {
            const uint8_t a = regs.v(x);
            set_with_flag(x, static_cast<uint8_t>(a >> 1), a & 0x01);
            break;
        }
        case Op::SHL: {
            const uint8_t a = regs.v(x);
            set_with_flag(x, static_cast<uint8_t>(a << 1), (a >> 7) & 0x01);
            break;
        }

        case Op::LD_I:  regs.I = ins.nnn; break;
        case Op::JP_V0: regs.PC = static_cast<uint16_t>(ins.nnn + regs.v(0)); break;
        case Op::RND: {
            std::uniform_int_distribution<int> byte(0, 0xFF);
            regs.set_v(x, static_cast<uint8_t>(byte(rng) & ins.nn));
            break;
        }
        case Op::DRW: {
            std::vector<uint8_t> rows(ins.n);
            for (size_t r = 0; r < rows.size(); ++r)
                rows[r] = mem.read_byte(size_t(regs.I) + r);
            const bool hit = display.draw_sprite(regs.v(x), regs.v(y), rows);
            regs.set_v(0xF, hit ? 1 : 0);
            break;
        }

        case Op::SKP:  skip_if(keypad.is_down(regs.v(x) & 0x0F)); break;
        case Op::SKNP: skip_if(!keypad.is_down(regs.v(x) & 0x0F)); break;

        case Op::LD_VX_DT: regs.set_v(x, timers.delay()); break;
        case Op::LD_VX_K:
            // stay on this instruction until a key goes down
            regs.PC = static_cast<uint16_t>(regs.PC - 2);
            keypad.begin_wait(x);
            state_ = MachineState::WaitingForKey;
            break;
        case Op::LD_DT_VX: timers.set_delay(regs.v(x)); break;
        case Op::LD_ST_VX: timers.set_sound(regs.v(x)); break;
        case Op::ADD_I_VX: regs.I = static_cast<uint16_t>(regs.I + regs.v(x)); break;
        case Op::LD_F_VX:  regs.I = Memory::font_address(regs.v(x)); break;
        case Op::LD_B_VX: {
            const uint8_t val = regs.v(x);
            mem.write_byte(size_t(regs.I),     val / 100);
            mem.write_byte(size_t(regs.I) + 1, (val / 10) % 10);
            mem.write_byte(size_t(regs.I) + 2, val % 10);
            break;
        }
        case Op::LD_MEM_VX:
            for (size_t r = 0; r <= x; ++r)
                mem.write_byte(size_t(regs.I) + r, regs.v(r));
            break;
        case Op::LD_VX_MEM:
            for (size_t r = 0; r <= x; ++r)
                regs.set_v(r, mem.read_byte(size_t(regs.I) + r));
            break;
    }
}
