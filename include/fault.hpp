// include/fault.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "decoder.hpp"

enum class FaultKind {
    OutOfBounds, InvalidRegister, StackOverflow, StackUnderflow,
    CapacityExceeded, UnknownOpcode, InvalidKey
};

const char* fault_name(FaultKind k);

// Thrown by the components; the machine catches it at the cycle boundary,
// stamps pc/opcode/op and halts.
struct Fault : std::runtime_error {
    FaultKind kind;
    uint16_t  pc{0};       // address of the faulting instruction
    uint16_t  opcode{0};   // raw word, 0 when not fetched yet
    std::optional<Op> op;  // set when the word decoded

    Fault(FaultKind k, const std::string& what_arg)
        : std::runtime_error(what_arg), kind(k) {}
};
