// include/decoder.hpp
#pragma once
#include <cstdint>

enum class Op {
    SYS, CLS, RET, JP, CALL,
    SE_VX_NN, SNE_VX_NN, SE_VX_VY, LD_VX_NN, ADD_VX_NN,
    LD_VX_VY, OR, AND, XOR, ADD_VX_VY, SUB, SHR, SUBN, SHL,
    SNE_VX_VY, LD_I, JP_V0, RND, DRW,
    SKP, SKNP,
    LD_VX_DT, LD_VX_K, LD_DT_VX, LD_ST_VX, ADD_I_VX,
    LD_F_VX, LD_B_VX, LD_MEM_VX, LD_VX_MEM
};

constexpr int OP_COUNT = 35;

struct Instruction {
    uint16_t raw{0};
    Op       op{Op::SYS};
    uint8_t  x{0};      // 0x0X00
    uint8_t  y{0};      // 0x00Y0
    uint8_t  n{0};      // 0x000N
    uint8_t  nn{0};     // 0x00NN
    uint16_t nnn{0};    // 0x0NNN
};

// Classify a word into one of the 35 operations. Throws UnknownOpcode.
Instruction decode(uint16_t word);

const char* mnemonic(Op op);
