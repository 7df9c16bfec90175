#include "cpu.hpp"
#include <cstdio>
#include <string>

static std::string unsupported_message(uint8_t opcode, uint16_t address) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "unsupported opcode %02X at %04X", opcode, address);
    return buf;
}

UnsupportedOpcode::UnsupportedOpcode(uint8_t opcode, uint16_t address)
    : std::runtime_error(unsupported_message(opcode, address)), opcode_(opcode), address_(address) {}

uint8_t Flags::pack() const {
    return static_cast<uint8_t>((N << 7) | (V << 6) | (1 << 5) | (B << 4) |
                                (D << 3) | (I << 2) | (Z << 1) | (C << 0));
}

void Flags::unpack(uint8_t p) {
    C = p & 0x01; Z = p & 0x02; I = p & 0x04; D = p & 0x08;
    B = p & 0x10; U = true;     V = p & 0x40; N = p & 0x80;
}

CPU::CPU(CpuConfig cfg) : CPU(std::make_unique<Bus>(), cfg) {}

CPU::CPU(std::unique_ptr<Bus> bus, CpuConfig cfg) : config(cfg), bus_(std::move(bus)) {
    if (!bus_) throw std::invalid_argument("CPU requires a bus");
}

bool CPU::load_program(const std::vector<uint8_t>& bytes, uint16_t origin) {
    if (!bus_->load(bytes, origin)) return false;
    bus_->write16(Bus::RESET_VECTOR, origin);
    return true;
}

void CPU::reset() {
    SP = SP_RESET;
    P.I = true;
    P.B = false;
    PC = bus_->read16(Bus::RESET_VECTOR);
    state = RunState::Running;
    steps = 0;
    events_.clear();
    timeline.clear();
}

bool CPU::load_and_run(const std::vector<uint8_t>& bytes) {
    if (!load_program(bytes)) return false;
    reset();
    run();
    return true;
}

uint64_t CPU::run() {
    uint64_t executed = 0;
    while (step()) ++executed;
    return executed;
}

bool CPU::step() {
    if (state != RunState::Running) return false;

    events_.clear();
    ++steps;
    const uint16_t at = PC;
    const uint8_t opcode = read(PC, "opcode fetch");
    PC = static_cast<uint16_t>(PC + 1);

    if (opcode == OPCODE_BRK) {
        halt();
        record_frame(at, opcode);
        return false;
    }

    const OpcodeInfo& info = decode(opcode);
    if (info.op == Op::Invalid) {
        state = RunState::Faulted;
        record_frame(at, opcode);
        throw UnsupportedOpcode(opcode, at);
    }

    execute(info);
    record_frame(at, opcode);
    return true;
}

void CPU::halt() {
    P.B = true;
    state = RunState::Halted;
}

// --- bus access (traced) ---

uint8_t CPU::read(uint16_t addr, const char* note) {
    uint8_t v = bus_->read_byte(addr);
    if (config.trace) events_.push_back(BusEvent{steps, BusDir::Read, addr, v, note});
    return v;
}

void CPU::write(uint16_t addr, uint8_t data, const char* note) {
    bus_->write_byte(addr, data);
    if (config.trace) events_.push_back(BusEvent{steps, BusDir::Write, addr, data, note});
}

uint16_t CPU::read16(uint16_t addr, const char* note) {
    uint16_t lo = read(addr, note);
    uint16_t hi = read(static_cast<uint16_t>(addr + 1), note);
    return static_cast<uint16_t>(lo | (hi << 8));
}

void CPU::record_frame(uint16_t pc, uint8_t opcode) {
    if (!config.trace) return;
    timeline.push_back(TraceFrame{steps, pc, opcode, A, X, Y, SP, P.pack(), std::move(events_)});
    events_.clear();
    while (timeline.size() > config.trace_limit) timeline.pop_front();
}

// --- addressing ---

uint16_t CPU::operand_address(AddrMode mode) {
    switch (mode) {
        case AddrMode::Immediate:
            return PC;
        case AddrMode::ZeroPage:
            return read(PC, "operand");
        case AddrMode::ZeroPageX:
            return static_cast<uint8_t>(read(PC, "operand") + X);
        case AddrMode::ZeroPageY:
            return static_cast<uint8_t>(read(PC, "operand") + Y);
        case AddrMode::Absolute:
            return read16(PC, "operand");
        case AddrMode::AbsoluteX:
            return static_cast<uint16_t>(read16(PC, "operand") + X);
        case AddrMode::AbsoluteY:
            return static_cast<uint16_t>(read16(PC, "operand") + Y);
        case AddrMode::IndirectX: {
            const uint8_t ptr = static_cast<uint8_t>(read(PC, "operand") + X);
            if (config.indirect == IndirectMode::Legacy) {
                // hi and lo each come from a 16-bit read, no zero-page wrap on the second byte
                uint16_t hi = read16(static_cast<uint8_t>(ptr + 1), "pointer");
                uint16_t lo = read16(ptr, "pointer");
                return static_cast<uint16_t>((hi << 8) | lo);
            }
            uint16_t lo = read(ptr, "pointer lo");
            uint16_t hi = read(static_cast<uint8_t>(ptr + 1), "pointer hi");
            return static_cast<uint16_t>(lo | (hi << 8));
        }
        case AddrMode::IndirectY: {
            if (config.indirect == IndirectMode::Legacy) {
                // operand bytes taken as an absolute base, no pointer dereference
                uint16_t hi = read(static_cast<uint16_t>(PC + 1), "operand hi");
                uint16_t lo = read(PC, "operand lo");
                return static_cast<uint16_t>(((hi << 8) | lo) + Y);
            }
            const uint8_t zp = read(PC, "operand");
            uint16_t lo = read(zp, "pointer lo");
            uint16_t hi = read(static_cast<uint8_t>(zp + 1), "pointer hi");
            return static_cast<uint16_t>((lo | (hi << 8)) + Y);
        }
        case AddrMode::None:
            break;
    }
    throw std::logic_error("implied addressing has no operand address");
}

uint8_t& CPU::reg_ref(Reg r) {
    switch (r) {
        case Reg::A: return A;
        case Reg::X: return X;
        case Reg::Y: return Y;
        case Reg::S: return SP;
    }
    return A;
}

// TXS is the only transfer that leaves the flags alone
template <Reg From, Reg To>
void CPU::transfer() {
    static_assert(From != To, "transfer needs distinct registers");
    uint8_t& dst = reg_ref(To);
    dst = reg_ref(From);
    if (To != Reg::S) set_zn(dst);
}

// --- dispatch ---

void CPU::execute(const OpcodeInfo& info) {
    const AddrMode mode = info.mode;
    switch (info.op) {
        case Op::ADC: adc(mode); break;
        case Op::SBC: sbc(mode); break;

        case Op::AND:
        case Op::ORA:
        case Op::EOR: bit_op(info.op, mode); break;

        case Op::ASL: asl(mode); break;

        case Op::LDA: load(Reg::A, mode); break;
        case Op::LDX: load(Reg::X, mode); break;
        case Op::LDY: load(Reg::Y, mode); break;

        case Op::STA: store(Reg::A, mode); break;
        case Op::STX: store(Reg::X, mode); break;
        case Op::STY: store(Reg::Y, mode); break;

        case Op::TAX: transfer<Reg::A, Reg::X>(); break;
        case Op::TAY: transfer<Reg::A, Reg::Y>(); break;
        case Op::TSX: transfer<Reg::S, Reg::X>(); break;
        case Op::TXA: transfer<Reg::X, Reg::A>(); break;
        case Op::TXS: transfer<Reg::X, Reg::S>(); break;
        case Op::TYA: transfer<Reg::Y, Reg::A>(); break;

        case Op::SEC: P.C = true; break;
        case Op::SED: P.D = true; break;
        case Op::SEI: P.I = true; break;

        case Op::NOP: break;

        case Op::BRK:
        case Op::Invalid:
            throw std::logic_error("BRK and invalid opcodes are handled by step()");
    }
}

// --- instructions ---

void CPU::add_with_carry(uint8_t operand) {
    const uint8_t a = A;
    const uint16_t partial = static_cast<uint16_t>(a + operand);
    const uint16_t sum = static_cast<uint16_t>((partial & 0xFF) + (P.C ? 1 : 0));
    const uint8_t result = static_cast<uint8_t>(sum);

    A = result;
    set_zn(result);
    set_carry((partial > 0xFF) || (sum > 0xFF));
    set_overflow(a, operand, result);
}

void CPU::adc(AddrMode mode) {
    uint8_t m = read(operand_address(mode), "ADC");
    add_with_carry(m);
    advance_pc(mode);
}

void CPU::sbc(AddrMode mode) {
    uint8_t m = read(operand_address(mode), "SBC");
    add_with_carry(static_cast<uint8_t>(~m));
    advance_pc(mode);
}

void CPU::bit_op(Op op, AddrMode mode) {
    const char* note = op == Op::AND ? "AND" : op == Op::ORA ? "ORA" : "EOR";
    uint8_t m = read(operand_address(mode), note);
    switch (op) {
        case Op::AND: A &= m; break;
        case Op::ORA: A |= m; break;
        case Op::EOR: A ^= m; break;
        default: throw std::logic_error("bit_op called with a non-bitwise op");
    }
    set_zn(A);
    advance_pc(mode);
}

void CPU::asl(AddrMode mode) {
    uint8_t v, r;
    if (mode == AddrMode::None) {
        v = A;
        r = static_cast<uint8_t>(v << 1);
        A = r;
    } else {
        uint16_t addr = operand_address(mode);
        v = read(addr, "ASL");
        r = static_cast<uint8_t>(v << 1);
        write(addr, r, "ASL");
    }
    set_zn(r);
    set_carry((v & 0x80) != 0);
    advance_pc(mode);
}

void CPU::load(Reg r, AddrMode mode) {
    uint8_t& dst = reg_ref(r);
    dst = read(operand_address(mode), "load");
    set_zn(dst);
    advance_pc(mode);
}

void CPU::store(Reg r, AddrMode mode) {
    write(operand_address(mode), reg_ref(r), "store");
    advance_pc(mode);
}
