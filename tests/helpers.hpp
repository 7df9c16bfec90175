// tests/helpers.hpp
#pragma once
#include <catch2/catch.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "cpu.hpp"

// Loads at 8000 and resets, but does not run.
inline CPU prepared(const std::vector<uint8_t>& program, CpuConfig cfg = CpuConfig{}) {
    CPU cpu(cfg);
    REQUIRE(cpu.load_program(program));
    cpu.reset();
    return cpu;
}

inline CPU ran(const std::vector<uint8_t>& program, CpuConfig cfg = CpuConfig{}) {
    CPU cpu = prepared(program, cfg);
    cpu.run();
    REQUIRE(cpu.halted());
    return cpu;
}

inline CpuConfig legacy_config() {
    CpuConfig cfg;
    cfg.indirect = IndirectMode::Legacy;
    return cfg;
}

inline CpuConfig traced_config(size_t limit = 4096) {
    CpuConfig cfg;
    cfg.trace = true;
    cfg.trace_limit = limit;
    return cfg;
}

// Collects std::cerr output for the lifetime of the object
struct CerrCapture {
    std::ostringstream text;
    std::streambuf* saved;
    CerrCapture() : saved(std::cerr.rdbuf(text.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(saved); }
    std::string str() const { return text.str(); }
};

// std::cerr formatting state is back to its defaults
inline bool cerr_format_is_default() {
    return std::cerr.fill() == ' ' && (std::cerr.flags() & std::ios::basefield) == std::ios::dec;
}
