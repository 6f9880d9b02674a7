// include/timers.hpp
#pragma once
#include <cstdint>

// Delay and sound counters. tick() is driven at 60 Hz by the scheduler,
// independent of the instruction rate.
struct Timers {
    void reset() { delay_ = 0; sound_ = 0; }
    void tick();

    void set_delay(uint8_t v) { delay_ = v; }
    void set_sound(uint8_t v) { sound_ = v; }
    uint8_t delay() const { return delay_; }
    uint8_t sound() const { return sound_; }

    bool sound_active() const { return sound_ != 0; }

private:
    uint8_t delay_{0};
    uint8_t sound_{0};
};
