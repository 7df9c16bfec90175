// include/disasm.hpp
#pragma once
#include <cstdint>
#include <string>
#include "bus.hpp"

std::string hex8(uint8_t v);
std::string hex16(uint16_t v);

// Opcode plus operand bytes; unknown opcodes count as one .DB byte
int instr_len(uint8_t opcode);

// "8000:  a9 81      LDA #$81"
std::string disasm_one(const Bus& bus, uint16_t pc);
