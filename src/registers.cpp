#include "registers.hpp"
#include "fault.hpp"
#include <string>

void RegisterFile::reset() {
    V.fill(0);
    stack.fill(0);
    SP = 0;
    I  = 0;
    PC = PC_START;
}

void RegisterFile::check(size_t r) {
    if (r >= REG_COUNT)
        throw Fault(FaultKind::InvalidRegister, "register id " + std::to_string(r));
}

uint8_t RegisterFile::v(size_t r) const {
    check(r);
    return V[r];
}

void RegisterFile::set_v(size_t r, uint8_t value) {
    check(r);
    V[r] = value;
}

void RegisterFile::push(uint16_t addr) {
    if (SP >= STACK_SIZE)
        throw Fault(FaultKind::StackOverflow, "call stack full (" + std::to_string(STACK_SIZE) + " entries)");
    stack[SP++] = addr;
}

uint16_t RegisterFile::pop() {
    if (SP == 0)
        throw Fault(FaultKind::StackUnderflow, "return with empty call stack");
    return stack[--SP];
}
