// src/bus.cpp
#include "bus.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

uint16_t Bus::read16(uint16_t addr) const {
    uint16_t lo = mem[addr];
    uint16_t hi = mem[static_cast<uint16_t>(addr + 1)];
    return static_cast<uint16_t>(lo | (hi << 8));
}

void Bus::write16(uint16_t addr, uint16_t value) {
    mem[addr] = static_cast<uint8_t>(value & 0xFF);
    mem[static_cast<uint16_t>(addr + 1)] = static_cast<uint8_t>(value >> 8);
}

bool Bus::load_program(const std::vector<uint8_t>& bytes) {
    return load(bytes, PROGRAM_ORIGIN);
}

bool Bus::load(const std::vector<uint8_t>& bytes, uint16_t origin) {
    if (origin + bytes.size() > MEM_SIZE) {
        std::ostringstream at;
        at << std::hex << std::setfill('0') << std::setw(4) << origin;
        std::cerr << "[bus] program of " << bytes.size() << " bytes does not fit at " << at.str() << "\n";
        return false;
    }
    std::copy(bytes.begin(), bytes.end(), mem.begin() + origin);
    return true;
}
