// include/trace.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class BusDir { Read, Write };

struct BusEvent {
    uint64_t step;         // instruction number since reset
    BusDir dir;            // memory direction
    uint16_t address;
    uint8_t data;          // byte transferred
    std::string note;      // e.g. "opcode fetch", "operand lo", "STA"
};

struct TraceFrame {
    // Snapshot after one instruction; pc is where its opcode was fetched
    uint64_t step;
    uint16_t pc;
    uint8_t opcode;
    uint8_t a, x, y, sp, flags;
    std::vector<BusEvent> events; // bus traffic of this instruction
};
