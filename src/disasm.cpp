// src/disasm.cpp
#include "disasm.hpp"
#include <iomanip>
#include <sstream>
#include "opcodes.hpp"

std::string hex8(uint8_t v)  { std::ostringstream o; o<<std::hex<<std::setfill('0')<<std::setw(2)<<int(v); return o.str(); }
std::string hex16(uint16_t v){ std::ostringstream o; o<<std::hex<<std::setfill('0')<<std::setw(4)<<int(v); return o.str(); }

int instr_len(uint8_t opcode) {
    const OpcodeInfo& info = decode(opcode);
    if (info.op == Op::Invalid) return 1;
    return 1 + operand_width(info.mode);
}

std::string disasm_one(const Bus& bus, uint16_t pc) {
    const uint8_t op = bus.read_byte(pc);
    const OpcodeInfo& info = decode(op);
    const int L = instr_len(op);

    const uint8_t lo = (L >= 2 ? bus.read_byte((uint16_t)(pc + 1)) : 0);
    const uint8_t hi = (L >= 3 ? bus.read_byte((uint16_t)(pc + 2)) : 0);
    const uint16_t abs = (uint16_t)(lo | (uint16_t(hi) << 8));

    std::ostringstream out;

    // bytes column (up to 3 bytes)
    out << hex16(pc) << ":  "
        << hex8(op) << (L>=2 ? (" " + hex8(lo)) : "   ")
        << (L>=3 ? (" " + hex8(hi)) : "   ")
        << "   ";

    if (info.op == Op::Invalid) {
        out << ".DB $" << hex8(op);
        return out.str();
    }

    out << info.mnemonic;
    switch (info.mode) {
        case AddrMode::None:
            if (info.op == Op::ASL) out << " A";
            break;
        case AddrMode::Immediate: out << " #$" << hex8(lo); break;
        case AddrMode::ZeroPage:  out << " $"  << hex8(lo); break;
        case AddrMode::ZeroPageX: out << " $"  << hex8(lo) << ",X"; break;
        case AddrMode::ZeroPageY: out << " $"  << hex8(lo) << ",Y"; break;
        case AddrMode::Absolute:  out << " $"  << hex16(abs); break;
        case AddrMode::AbsoluteX: out << " $"  << hex16(abs) << ",X"; break;
        case AddrMode::AbsoluteY: out << " $"  << hex16(abs) << ",Y"; break;
        case AddrMode::IndirectX: out << " ($" << hex8(lo) << ",X)"; break;
        case AddrMode::IndirectY: out << " ($" << hex8(lo) << "),Y"; break;
    }
    return out.str();
}
