#include "keypad.hpp"
#include "fault.hpp"
#include <string>

void Keypad::reset() {
    keys_.fill(false);
    waiting_ = false;
    wait_reg_ = 0;
}

void Keypad::check(uint8_t k) {
    if (k >= KEY_COUNT)
        throw Fault(FaultKind::InvalidKey, "key id " + std::to_string(k));
}

bool Keypad::set_key(uint8_t k, bool down) {
    check(k);
    bool pressed = down && !keys_[k];
    keys_[k] = down;
    return pressed;
}

bool Keypad::is_down(uint8_t k) const {
    check(k);
    return keys_[k];
}
