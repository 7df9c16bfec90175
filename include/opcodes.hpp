// include/opcodes.hpp
#pragma once
#include <cstdint>
#include <array>

enum class AddrMode : uint8_t {
    None,       // implied / accumulator
    Immediate,
    ZeroPage,
    ZeroPageX,
    ZeroPageY,
    Absolute,
    AbsoluteX,
    AbsoluteY,
    IndirectX,  // ($nn,X)
    IndirectY,  // ($nn),Y
};

enum class Op : uint8_t {
    Invalid,
    ADC, SBC,
    AND, ORA, EOR,
    ASL,
    LDA, LDX, LDY,
    STA, STX, STY,
    TAX, TAY, TSX, TXA, TXS, TYA,
    SEC, SED, SEI,
    NOP,
    BRK,
};

struct OpcodeInfo {
    const char* mnemonic;
    Op op;
    AddrMode mode;
};

constexpr uint8_t OPCODE_BRK = 0x00;

// bytes following the opcode
constexpr int operand_width(AddrMode mode) {
    switch (mode) {
        case AddrMode::None:      return 0;
        case AddrMode::Absolute:
        case AddrMode::AbsoluteX:
        case AddrMode::AbsoluteY: return 2;
        default:                  return 1;
    }
}

const char* addr_mode_name(AddrMode mode);

// 256 entries, unimplemented opcodes are {"???", Op::Invalid, AddrMode::None}
const std::array<OpcodeInfo, 256>& opcode_table();

inline const OpcodeInfo& decode(uint8_t opcode) { return opcode_table()[opcode]; }
