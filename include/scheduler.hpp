// include/scheduler.hpp
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

#include "machine.hpp"

struct RunSummary {
    uint64_t cycles{0};   // cycle slots consumed (including key-wait yields)
    uint64_t ticks{0};    // 60 Hz timer ticks delivered
    bool     stopped{false};
    bool     halted{false};
};

// Multiplexes the instruction schedule and the 60 Hz timer schedule onto
// one thread. Elapsed time is kept as integer remainders so that slicing
// the same interval differently yields the same number of units.
class Scheduler {
public:
    static constexpr uint32_t TIMER_HZ   = 60;
    static constexpr uint32_t DEFAULT_HZ = 700;
    static constexpr uint32_t MAX_HZ     = 1'000'000;

    explicit Scheduler(Machine& m, uint32_t cycles_per_second = DEFAULT_HZ);

    void     set_cycles_per_second(uint32_t hz);   // std::invalid_argument outside 1..MAX_HZ
    uint32_t cycles_per_second() const { return hz; }

    RunSummary advance(std::chrono::nanoseconds elapsed);

    // Checked between cycles; never interrupts an instruction.
    void request_stop() { stop.store(true); }
    void clear_stop()   { stop.store(false); }
    bool stop_requested() const { return stop.load(); }

private:
    Machine&          machine;
    uint32_t          hz;
    uint64_t          cycle_acc{0};   // ns * hz, kept below one second
    uint64_t          tick_acc{0};    // ns * TIMER_HZ
    std::atomic<bool> stop{false};
};
