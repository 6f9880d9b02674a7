#include "scheduler.hpp"
#include <stdexcept>
#include <string>

static constexpr uint64_t NS_PER_SEC = 1'000'000'000ull;

Scheduler::Scheduler(Machine& m, uint32_t cycles_per_second) : machine(m), hz(0) {
    set_cycles_per_second(cycles_per_second);
}

void Scheduler::set_cycles_per_second(uint32_t new_hz) {
    if (new_hz == 0 || new_hz > MAX_HZ)
        throw std::invalid_argument("cycles per second must be in 1.." + std::to_string(MAX_HZ)
                                    + ", got " + std::to_string(new_hz));
    // rescale the pending fraction so a rate change does not drop or invent a cycle
    if (hz != 0) cycle_acc = cycle_acc / hz * new_hz;
    hz = new_hz;
}

RunSummary Scheduler::advance(std::chrono::nanoseconds elapsed) {
    RunSummary s;
    if (elapsed.count() <= 0) return s;

    // whole seconds count directly; only the sub-second part is scaled,
    // so ns * hz stays below 1e15 for any slice length
    const uint64_t ns   = static_cast<uint64_t>(elapsed.count());
    const uint64_t secs = ns / NS_PER_SEC;
    const uint64_t rem  = ns % NS_PER_SEC;
    cycle_acc += rem * hz;
    tick_acc  += rem * TIMER_HZ;
    const uint64_t n = secs * hz + cycle_acc / NS_PER_SEC;
    const uint64_t m = secs * TIMER_HZ + tick_acc / NS_PER_SEC;
    cycle_acc %= NS_PER_SEC;
    tick_acc  %= NS_PER_SEC;

    auto run_until = [&](uint64_t target) {
        while (s.cycles < target) {
            if (stop_requested()) { s.stopped = true; return false; }
            if (!machine.step_cycle()) {
                s.halted = machine.state() == MachineState::Halted;
                return false;
            }
            ++s.cycles;
        }
        return true;
    };

    // spread the m ticks evenly among the n cycles
    for (uint64_t t = 0; t < m; ++t) {
        if (!run_until(n * (t + 1) / m)) return s;
        if (stop_requested()) { s.stopped = true; return s; }
        machine.tick_timers();
        ++s.ticks;
    }
    run_until(n);
    return s;
}
