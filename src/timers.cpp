#include "timers.hpp"

void Timers::tick() {
    if (delay_) --delay_;
    if (sound_) --sound_;
}
