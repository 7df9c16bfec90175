// src/opcodes.cpp
#include "opcodes.hpp"

const char* addr_mode_name(AddrMode mode) {
    switch (mode) {
        case AddrMode::None:      return "implied";
        case AddrMode::Immediate: return "immediate";
        case AddrMode::ZeroPage:  return "zero page";
        case AddrMode::ZeroPageX: return "zero page,X";
        case AddrMode::ZeroPageY: return "zero page,Y";
        case AddrMode::Absolute:  return "absolute";
        case AddrMode::AbsoluteX: return "absolute,X";
        case AddrMode::AbsoluteY: return "absolute,Y";
        case AddrMode::IndirectX: return "(indirect,X)";
        case AddrMode::IndirectY: return "(indirect),Y";
    }
    return "?";
}

static std::array<OpcodeInfo, 256> build_table() {
    std::array<OpcodeInfo, 256> t;
    t.fill(OpcodeInfo{"???", Op::Invalid, AddrMode::None});

    auto set = [&](uint8_t code, const char* name, Op op, AddrMode mode) {
        t[code] = OpcodeInfo{name, op, mode};
    };
    using M = AddrMode;

    // ADC / SBC
    set(0x69, "ADC", Op::ADC, M::Immediate);
    set(0x65, "ADC", Op::ADC, M::ZeroPage);
    set(0x75, "ADC", Op::ADC, M::ZeroPageX);
    set(0x6D, "ADC", Op::ADC, M::Absolute);
    set(0x7D, "ADC", Op::ADC, M::AbsoluteX);
    set(0x79, "ADC", Op::ADC, M::AbsoluteY);
    set(0x61, "ADC", Op::ADC, M::IndirectX);
    set(0x71, "ADC", Op::ADC, M::IndirectY);

    set(0xE9, "SBC", Op::SBC, M::Immediate);
    set(0xE5, "SBC", Op::SBC, M::ZeroPage);
    set(0xF5, "SBC", Op::SBC, M::ZeroPageX);
    set(0xED, "SBC", Op::SBC, M::Absolute);
    set(0xFD, "SBC", Op::SBC, M::AbsoluteX);
    set(0xF9, "SBC", Op::SBC, M::AbsoluteY);
    set(0xE1, "SBC", Op::SBC, M::IndirectX);
    set(0xF1, "SBC", Op::SBC, M::IndirectY);

    // AND / ORA / EOR
    set(0x29, "AND", Op::AND, M::Immediate);
    set(0x25, "AND", Op::AND, M::ZeroPage);
    set(0x35, "AND", Op::AND, M::ZeroPageX);
    set(0x2D, "AND", Op::AND, M::Absolute);
    set(0x3D, "AND", Op::AND, M::AbsoluteX);
    set(0x39, "AND", Op::AND, M::AbsoluteY);
    set(0x21, "AND", Op::AND, M::IndirectX);
    set(0x31, "AND", Op::AND, M::IndirectY);

    set(0x09, "ORA", Op::ORA, M::Immediate);
    set(0x05, "ORA", Op::ORA, M::ZeroPage);
    set(0x15, "ORA", Op::ORA, M::ZeroPageX);
    set(0x0D, "ORA", Op::ORA, M::Absolute);
    set(0x1D, "ORA", Op::ORA, M::AbsoluteX);
    set(0x19, "ORA", Op::ORA, M::AbsoluteY);
    set(0x01, "ORA", Op::ORA, M::IndirectX);
    set(0x11, "ORA", Op::ORA, M::IndirectY);

    set(0x49, "EOR", Op::EOR, M::Immediate);
    set(0x45, "EOR", Op::EOR, M::ZeroPage);
    set(0x55, "EOR", Op::EOR, M::ZeroPageX);
    set(0x4D, "EOR", Op::EOR, M::Absolute);
    set(0x5D, "EOR", Op::EOR, M::AbsoluteX);
    set(0x59, "EOR", Op::EOR, M::AbsoluteY);
    set(0x41, "EOR", Op::EOR, M::IndirectX);
    set(0x51, "EOR", Op::EOR, M::IndirectY);

    // ASL (0x0A is ASL A)
    set(0x0A, "ASL", Op::ASL, M::None);
    set(0x06, "ASL", Op::ASL, M::ZeroPage);
    set(0x16, "ASL", Op::ASL, M::ZeroPageX);
    set(0x0E, "ASL", Op::ASL, M::Absolute);
    set(0x1E, "ASL", Op::ASL, M::AbsoluteX);

    // loads
    set(0xA9, "LDA", Op::LDA, M::Immediate);
    set(0xA5, "LDA", Op::LDA, M::ZeroPage);
    set(0xB5, "LDA", Op::LDA, M::ZeroPageX);
    set(0xAD, "LDA", Op::LDA, M::Absolute);
    set(0xBD, "LDA", Op::LDA, M::AbsoluteX);
    set(0xB9, "LDA", Op::LDA, M::AbsoluteY);
    set(0xA1, "LDA", Op::LDA, M::IndirectX);
    set(0xB1, "LDA", Op::LDA, M::IndirectY);

    set(0xA2, "LDX", Op::LDX, M::Immediate);
    set(0xA6, "LDX", Op::LDX, M::ZeroPage);
    set(0xB6, "LDX", Op::LDX, M::ZeroPageY);
    set(0xAE, "LDX", Op::LDX, M::Absolute);
    set(0xBE, "LDX", Op::LDX, M::AbsoluteY);

    set(0xA0, "LDY", Op::LDY, M::Immediate);
    set(0xA4, "LDY", Op::LDY, M::ZeroPage);
    set(0xB4, "LDY", Op::LDY, M::ZeroPageX);
    set(0xAC, "LDY", Op::LDY, M::Absolute);
    set(0xBC, "LDY", Op::LDY, M::AbsoluteX);

    // stores
    set(0x85, "STA", Op::STA, M::ZeroPage);
    set(0x95, "STA", Op::STA, M::ZeroPageX);
    set(0x8D, "STA", Op::STA, M::Absolute);
    set(0x9D, "STA", Op::STA, M::AbsoluteX);
    set(0x99, "STA", Op::STA, M::AbsoluteY);
    set(0x81, "STA", Op::STA, M::IndirectX);
    set(0x91, "STA", Op::STA, M::IndirectY);

    set(0x86, "STX", Op::STX, M::ZeroPage);
    set(0x96, "STX", Op::STX, M::ZeroPageY);
    set(0x8E, "STX", Op::STX, M::Absolute);

    set(0x84, "STY", Op::STY, M::ZeroPage);
    set(0x94, "STY", Op::STY, M::ZeroPageX);
    set(0x8C, "STY", Op::STY, M::Absolute);

    // transfers
    set(0xAA, "TAX", Op::TAX, M::None);
    set(0xA8, "TAY", Op::TAY, M::None);
    set(0xBA, "TSX", Op::TSX, M::None);
    set(0x8A, "TXA", Op::TXA, M::None);
    set(0x9A, "TXS", Op::TXS, M::None);
    set(0x98, "TYA", Op::TYA, M::None);

    // flags, misc
    set(0x38, "SEC", Op::SEC, M::None);
    set(0xF8, "SED", Op::SED, M::None);
    set(0x78, "SEI", Op::SEI, M::None);
    set(0xEA, "NOP", Op::NOP, M::None);
    set(OPCODE_BRK, "BRK", Op::BRK, M::None);

    return t;
}

const std::array<OpcodeInfo, 256>& opcode_table() {
    static const std::array<OpcodeInfo, 256> table = build_table();
    return table;
}
