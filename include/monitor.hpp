// include/monitor.hpp
#pragma once
#include <cstdint>
#include <unordered_set>
#include "cpu.hpp"

enum class StopReason { Halted, Faulted, Breakpoint, Limit };

struct RunResult {
    StopReason reason;
    uint64_t executed;   // instructions completed, BRK excluded
};

// Instruction budget for 'g', so a program that never reaches BRK hands control back
constexpr uint64_t GO_WATCHDOG = 10'000'000;

// One instruction; an unsupported opcode is reported on std::cerr as [cpu] and returns false
bool try_step(CPU& cpu);

// Steps until halt, fault, breakpoint or limit instructions. A breakpoint stops
// before the instruction at its address, except on the first step so a run can leave it.
RunResult run_until(CPU& cpu, const std::unordered_set<uint16_t>& breakpoints, uint64_t limit);
