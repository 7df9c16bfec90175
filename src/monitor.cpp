// src/monitor.cpp
#include "monitor.hpp"
#include <iostream>

bool try_step(CPU& cpu) {
    try {
        return cpu.step();
    } catch (const UnsupportedOpcode& e) {
        std::cerr << "[cpu] " << e.what() << "\n";
        return false;
    }
}

static StopReason stop_state(const CPU& cpu) {
    return cpu.faulted() ? StopReason::Faulted : StopReason::Halted;
}

RunResult run_until(CPU& cpu, const std::unordered_set<uint16_t>& breakpoints, uint64_t limit) {
    RunResult r{StopReason::Limit, 0};
    while (r.executed < limit) {
        if (cpu.state != RunState::Running) { r.reason = stop_state(cpu); return r; }
        if (r.executed > 0 && breakpoints.count(cpu.PC)) { r.reason = StopReason::Breakpoint; return r; }
        if (!try_step(cpu)) { r.reason = stop_state(cpu); return r; }
        ++r.executed;
    }
    if (cpu.state != RunState::Running) r.reason = stop_state(cpu);
    return r;
}
