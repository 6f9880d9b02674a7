#include "fault.hpp"

const char* fault_name(FaultKind k) {
    switch (k) {
        case FaultKind::OutOfBounds:      return "OutOfBounds";
        case FaultKind::InvalidRegister:  return "InvalidRegister";
        case FaultKind::StackOverflow:    return "StackOverflow";
        case FaultKind::StackUnderflow:   return "StackUnderflow";
        case FaultKind::CapacityExceeded: return "CapacityExceeded";
        case FaultKind::UnknownOpcode:    return "UnknownOpcode";
        case FaultKind::InvalidKey:       return "InvalidKey";
    }
    return "?";
}
