#include "decoder.hpp"
#include "fault.hpp"
#include <array>
#include <iomanip>
#include <sstream>

namespace {

// Top nibbles whose operation is fixed by the nibble alone. The ambiguous
// groups (0, 8, E, F) are resolved by their own tables below.
enum class Group { Fixed, Sys, Alu, Key, Misc, Cond };

struct Row { Group group; Op op; };

constexpr std::array<Row, 16> TOP = {{
    {Group::Sys,   Op::SYS},        // 0
    {Group::Fixed, Op::JP},         // 1
    {Group::Fixed, Op::CALL},       // 2
    {Group::Fixed, Op::SE_VX_NN},   // 3
    {Group::Fixed, Op::SNE_VX_NN},  // 4
    {Group::Cond,  Op::SE_VX_VY},   // 5 (low nibble must be 0)
    {Group::Fixed, Op::LD_VX_NN},   // 6
    {Group::Fixed, Op::ADD_VX_NN},  // 7
    {Group::Alu,   Op::LD_VX_VY},   // 8
    {Group::Cond,  Op::SNE_VX_VY},  // 9 (low nibble must be 0)
    {Group::Fixed, Op::LD_I},       // A
    {Group::Fixed, Op::JP_V0},      // B
    {Group::Fixed, Op::RND},        // C
    {Group::Fixed, Op::DRW},        // D
    {Group::Key,   Op::SKP},        // E
    {Group::Misc,  Op::LD_VX_DT},   // F
}};

// 8XYn, keyed by n; false marks an unassigned slot
struct Slot { bool valid; Op op; };

constexpr std::array<Slot, 16> ALU = {{
    {true, Op::LD_VX_VY}, {true, Op::OR},   {true, Op::AND},  {true, Op::XOR},
    {true, Op::ADD_VX_VY}, {true, Op::SUB}, {true, Op::SHR},  {true, Op::SUBN},
    {false, Op::SYS}, {false, Op::SYS}, {false, Op::SYS}, {false, Op::SYS},
    {false, Op::SYS}, {false, Op::SYS}, {true, Op::SHL},  {false, Op::SYS},
}};

// EXnn / FXnn, keyed by the low byte
struct ByteSlot { uint8_t key; Op op; };

constexpr std::array<ByteSlot, 2> KEY = {{
    {0x9E, Op::SKP}, {0xA1, Op::SKNP},
}};

constexpr std::array<ByteSlot, 9> MISC = {{
    {0x07, Op::LD_VX_DT}, {0x0A, Op::LD_VX_K},  {0x15, Op::LD_DT_VX},
    {0x18, Op::LD_ST_VX}, {0x1E, Op::ADD_I_VX}, {0x29, Op::LD_F_VX},
    {0x33, Op::LD_B_VX},  {0x55, Op::LD_MEM_VX}, {0x65, Op::LD_VX_MEM},
}};

[[noreturn]] void unknown(uint16_t word) {
    std::ostringstream o;
    o << "unknown opcode 0x" << std::hex << std::uppercase
      << std::setfill('0') << std::setw(4) << word;
    Fault f(FaultKind::UnknownOpcode, o.str());
    f.opcode = word;
    throw f;
}

template <size_t N>
Op by_low_byte(const std::array<ByteSlot, N>& table, uint16_t word) {
    const uint8_t lo = word & 0xFF;
    for (const auto& s : table)
        if (s.key == lo) return s.op;
    unknown(word);
}

} // namespace

Instruction decode(uint16_t word) {
    Instruction ins;
    ins.raw = word;
    ins.x   = (word >> 8) & 0x0F;
    ins.y   = (word >> 4) & 0x0F;
    ins.n   = word & 0x0F;
    ins.nn  = word & 0xFF;
    ins.nnn = word & 0x0FFF;

    const Row& row = TOP[word >> 12];
    switch (row.group) {
        case Group::Fixed: ins.op = row.op; break;
        case Group::Sys:
            if (word == 0x00E0)      ins.op = Op::CLS;
            else if (word == 0x00EE) ins.op = Op::RET;
            else                     ins.op = Op::SYS;
            break;
        case Group::Cond:
            if (ins.n != 0) unknown(word);
            ins.op = row.op;
            break;
        case Group::Alu:
            if (!ALU[ins.n].valid) unknown(word);
            ins.op = ALU[ins.n].op;
            break;
        case Group::Key:  ins.op = by_low_byte(KEY, word); break;
        case Group::Misc: ins.op = by_low_byte(MISC, word); break;
    }
    return ins;
}

const char* mnemonic(Op op) {
    switch (op) {
        case Op::SYS:       return "SYS";
        case Op::CLS:       return "CLS";
        case Op::RET:       return "RET";
        case Op::JP:        return "JP";
        case Op::CALL:      return "CALL";
        case Op::SE_VX_NN:  return "SE Vx, nn";
        case Op::SNE_VX_NN: return "SNE Vx, nn";
        case Op::SE_VX_VY:  return "SE Vx, Vy";
        case Op::LD_VX_NN:  return "LD Vx, nn";
        case Op::ADD_VX_NN: return "ADD Vx, nn";
        case Op::LD_VX_VY:  return "LD Vx, Vy";
        case Op::OR:        return "OR";
        case Op::AND:       return "AND";
        case Op::XOR:       return "XOR";
        case Op::ADD_VX_VY: return "ADD Vx, Vy";
        case Op::SUB:       return "SUB";
        case Op::SHR:       return "SHR";
        case Op::SUBN:      return "SUBN";
        case Op::SHL:       return "SHL";
        case Op::SNE_VX_VY: return "SNE Vx, Vy";
        case Op::LD_I:      return "LD I, nnn";
        case Op::JP_V0:     return "JP V0, nnn";
        case Op::RND:       return "RND";
        case Op::DRW:       return "DRW";
        case Op::SKP:       return "SKP";
        case Op::SKNP:      return "SKNP";
        case Op::LD_VX_DT:  return "LD Vx, DT";
        case Op::LD_VX_K:   return "LD Vx, K";
        case Op::LD_DT_VX:  return "LD DT, Vx";
        case Op::LD_ST_VX:  return "LD ST, Vx";
        case Op::ADD_I_VX:  return "ADD I, Vx";
        case Op::LD_F_VX:   return "LD F, Vx";
        case Op::LD_B_VX:   return "LD B, Vx";
        case Op::LD_MEM_VX: return "LD [I], Vx";
        case Op::LD_VX_MEM: return "LD Vx, [I]";
    }
    return "?";
}
