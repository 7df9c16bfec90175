// include/cpu.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <deque>
#include <memory>
#include <stdexcept>
#include <vector>
#include "bus.hpp"
#include "opcodes.hpp"
#include "trace.hpp"

// How (ind,X) and (ind),Y resolve their pointer.
//   Canonical: 6502 reference, pointer fetched from zero page with 8-bit wrap.
//   Legacy:    bit-exact with the emulator this core replaces (see DESIGN.md).
enum class IndirectMode { Canonical, Legacy };

// Halted: BRK executed. Faulted: unsupported opcode. Both hold until reset().
enum class RunState { Running, Halted, Faulted };

enum class Reg { A, X, Y, S };

struct CpuConfig {
    IndirectMode indirect{IndirectMode::Canonical};
    bool   trace{false};          // record one TraceFrame per instruction
    size_t trace_limit{4096};     // oldest frames dropped past this
};

// Status register, packs as NV1B DIZC
struct Flags {
    bool C{false};
    bool Z{false};
    bool I{true};
    bool D{false};   // settable, no effect on arithmetic
    bool B{false};
    bool U{true};    // always 1
    bool V{false};
    bool N{false};

    uint8_t pack() const;
    void    unpack(uint8_t p);
};

class UnsupportedOpcode : public std::runtime_error {
public:
    UnsupportedOpcode(uint8_t opcode, uint16_t address);
    uint8_t  opcode() const { return opcode_; }
    uint16_t address() const { return address_; }
private:
    uint8_t  opcode_;
    uint16_t address_;
};

struct CPU {
    static constexpr uint8_t SP_RESET = 0xFD;

    // Registers
    uint8_t  A{0}, X{0}, Y{0};
    uint16_t PC{0};
    uint8_t  SP{SP_RESET};
    Flags    P{};

    // Control state
    RunState  state{RunState::Running};
    uint64_t  steps{0};      // opcodes fetched since reset, BRK included
    CpuConfig config;

    // Trace timeline (one frame per instruction, only when config.trace)
    std::deque<TraceFrame> timeline;

    explicit CPU(CpuConfig cfg = CpuConfig{});
    CPU(std::unique_ptr<Bus> bus, CpuConfig cfg);

    Bus&       bus()       { return *bus_; }
    const Bus& bus() const { return *bus_; }
    bool halted() const { return state == RunState::Halted; }
    bool faulted() const { return state == RunState::Faulted; }

    // API
    // Loads through the bus, then points the reset vector at origin.
    bool load_program(const std::vector<uint8_t>& bytes, uint16_t origin = Bus::PROGRAM_ORIGIN);
    void reset();
    // One fetch-decode-execute. Returns false once BRK halts the CPU, and
    // without fetching anything while halted or faulted.
    // Throws UnsupportedOpcode for opcodes outside the implemented set and enters Faulted.
    bool step();
    // Steps until halt; returns the number of instructions executed (BRK excluded).
    uint64_t run();
    bool load_and_run(const std::vector<uint8_t>& bytes);
    void clear_trace() { timeline.clear(); }

    // Effective address for mode, PC at the first operand byte. Throws std::logic_error for AddrMode::None.
    uint16_t operand_address(AddrMode mode);

    // Flag updates
    void set_carry(bool carry)      { P.C = carry; }
    void set_zero(uint8_t result)   { P.Z = (result == 0); }
    void set_negative(uint8_t result) { P.N = (result & 0x80) != 0; }
    void set_overflow(uint8_t a, uint8_t b, uint8_t result) { P.V = ((a ^ result) & (b ^ result) & 0x80) != 0; }

    uint8_t& reg_ref(Reg r);

private:
    std::unique_ptr<Bus> bus_;
    std::vector<BusEvent> events_;   // bus traffic of the instruction in flight

    uint8_t  read(uint16_t addr, const char* note = "");
    void     write(uint16_t addr, uint8_t data, const char* note = "");
    uint16_t read16(uint16_t addr, const char* note = "");
    void     record_frame(uint16_t pc, uint8_t opcode);

    void execute(const OpcodeInfo& info);
    void advance_pc(AddrMode mode) { PC = static_cast<uint16_t>(PC + operand_width(mode)); }
    void set_zn(uint8_t v) { set_zero(v); set_negative(v); }
    void halt();

    // Instruction handlers
    void add_with_carry(uint8_t operand);   // ADC core, SBC passes ~M
    void adc(AddrMode mode);
    void sbc(AddrMode mode);
    void bit_op(Op op, AddrMode mode);
    void asl(AddrMode mode);
    void load(Reg r, AddrMode mode);
    void store(Reg r, AddrMode mode);
    template <Reg From, Reg To> void transfer();
};
