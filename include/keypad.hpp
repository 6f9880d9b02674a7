// include/keypad.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

struct Keypad {
    static constexpr size_t KEY_COUNT = 16;

    void reset();

    // Returns true when the key went from up to down. InvalidKey for k > 0xF.
    bool set_key(uint8_t k, bool down);
    bool is_down(uint8_t k) const;

    // FX0A bookkeeping
    void   begin_wait(size_t reg) { waiting_ = true; wait_reg_ = reg; }
    void   end_wait() { waiting_ = false; }
    bool   waiting() const { return waiting_; }
    size_t wait_register() const { return wait_reg_; }

    const std::array<bool, KEY_COUNT>& keys() const { return keys_; }

private:
    std::array<bool, KEY_COUNT> keys_{};
    bool   waiting_{false};
    size_t wait_reg_{0};

    static void check(uint8_t k);
};
