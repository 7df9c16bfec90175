// include/bus.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

// Flat 64 KiB address space. The CPU owns one of these and reaches memory only through it.
struct Bus {
    static constexpr size_t   MEM_SIZE       = 65536;
    static constexpr uint16_t PROGRAM_ORIGIN = 0x8000;
    static constexpr uint16_t RESET_VECTOR   = 0xFFFC;

    std::array<uint8_t, MEM_SIZE> mem{};

    uint8_t read_byte(uint16_t addr) const { return mem[addr]; }
    void    write_byte(uint16_t addr, uint8_t value) { mem[addr] = value; }

    // little-endian, spans addr and addr+1 (wraps at 0xFFFF)
    uint16_t read16(uint16_t addr) const;
    void     write16(uint16_t addr, uint16_t value);

    // Copy bytes to PROGRAM_ORIGIN / to origin. False (and nothing written) if the image runs past 0xFFFF.
    bool load_program(const std::vector<uint8_t>& bytes);
    bool load(const std::vector<uint8_t>& bytes, uint16_t origin);

    void clear() { mem.fill(0); }
};
