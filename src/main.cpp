// src/main.cpp
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <unordered_set>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <string>

#include "cpu.hpp"
#include "disasm.hpp"
#include "loader.hpp"
#include "monitor.hpp"

extern std::vector<uint8_t> demo_program();

static bool parse_hex16(const std::string& s, uint16_t& out) {
    std::string t = s;
    if (!t.empty() && t[0] == '$') t = t.substr(1);
    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) t = t.substr(2);
    if (t.empty() || t.size() > 4) return false;
    if (!std::all_of(t.begin(), t.end(), [](unsigned char c){ return std::isxdigit(c); })) return false;
    out = static_cast<uint16_t>(std::stoul(t, nullptr, 16));
    return true;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string flag_bits(const Flags& p) {
    std::string s;
    for (bool f : {p.N, p.V, p.U, p.B, p.D, p.I, p.Z, p.C}) s += f ? '1' : '0';
    return s;
}

static const char* state_name(const CPU& c);

static void print_regs(const CPU& c){
    std::cout << "PC="<<hex16(c.PC)
              << "  A="<<hex8(c.A)
              << "  X="<<hex8(c.X)
              << "  Y="<<hex8(c.Y)
              << "  SP="<<hex8(c.SP)
              << "  NV1BDIZC="<<flag_bits(c.P)
              << "  "<<state_name(c)
              << "  steps="<<std::dec<<c.steps << "\n";
}

static void dump_mem(const Bus& bus, uint16_t base, int rows=8, int cols=16){
    for(int r=0;r<rows;r++){
        uint16_t addr = static_cast<uint16_t>(base + r*cols);
        std::cout<<hex16(addr)<<": ";
        for(int ccol=0;ccol<cols;ccol++){
            std::cout<<hex8(bus.read_byte(static_cast<uint16_t>(addr+ccol)))<<' ';
        }
        std::cout<<"\n";
    }
}

static void disasm_range(const Bus& bus, uint16_t start, int count_instrs) {
    uint16_t pc = start;
    for (int i = 0; i < count_instrs; ++i) {
        std::cout << disasm_one(bus, pc) << "\n";
        pc = uint16_t(pc + instr_len(bus.read_byte(pc)));
    }
}

// Print the last K trace frames (instruction-by-instruction bus view)
static void print_trace(const CPU& c, int k){
    if(c.timeline.empty()){ std::cout<<"(no trace yet, enable with 'trace on')\n"; return; }
    int start = (int)std::max(0, (int)c.timeline.size()-k);
    for(int i=start;i<(int)c.timeline.size();++i){
        const auto& t = c.timeline[i];
        std::cout<< std::dec << t.step << "  "
                 << hex16(t.pc) << "  "
                 << hex8(t.opcode) << " " << std::left << std::setw(4) << std::setfill(' ')
                 << decode(t.opcode).mnemonic << std::right << "  "
                 << hex8(t.a) << " " << hex8(t.x) << " " << hex8(t.y) << " "
                 << hex8(t.sp) << " " << hex8(t.flags)
                 << "  " << addr_mode_name(decode(t.opcode).mode)
                 << "  events:" << t.events.size() << "\n";
        for(const auto& e: t.events){
            std::cout<<"    " << (e.dir==BusDir::Read? "RD":"WR")
                     <<" ["<<hex16(e.address)<<"] = "<<hex8(e.data)
                     <<"  " << e.note << "\n";
        }
    }
}

static const char* state_name(const CPU& c) {
    switch (c.state) {
        case RunState::Running: return "running";
        case RunState::Halted:  return "halted";
        case RunState::Faulted: return "faulted (reset to continue)";
    }
    return "?";
}

// Reports why 'r' or 'g' stopped early
static void report_stop(const CPU& cpu, const RunResult& r, bool watchdog) {
    if (r.reason == StopReason::Breakpoint)
        std::cout << "* Breakpoint hit at PC=" << hex16(cpu.PC) << "\n";
    else if (r.reason == StopReason::Limit && watchdog)
        std::cout << "* watchdog: stopped after " << std::dec << r.executed << " instructions without BRK\n";
}

// PROGRAM given on the command line: dumps carry their own origin, anything else is raw binary
static bool load_program_file(CPU& cpu, const std::string& path, uint16_t origin) {
    if (ends_with(path, ".hex") || ends_with(path, ".txt") || ends_with(path, ".dump")) {
        HexImage img;
        if (!read_file_hexdump(path, img)) return false;
        return cpu.load_program(img.bytes, img.origin);
    }
    std::vector<uint8_t> buf;
    if (!read_file_binary(path, buf)) return false;
    return cpu.load_program(buf, origin);
}

static void usage(const char* argv0) {
    std::cout << "usage: " << argv0 << " [--legacy-indirect] [--trace] [--origin HEX] [--run] [PROGRAM]\n"
              << "  PROGRAM  *.hex/*.txt/*.dump address-prefixed dump, otherwise raw binary at --origin\n"
              << "  --run    execute to BRK, print registers and exit\n";
}

int main(int argc, char** argv){
    CpuConfig config;
    uint16_t origin = Bus::PROGRAM_ORIGIN;
    bool batch = false;
    std::string program_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { usage(argv[0]); return 0; }
        else if (arg == "--legacy-indirect") config.indirect = IndirectMode::Legacy;
        else if (arg == "--trace") config.trace = true;
        else if (arg == "--run") batch = true;
        else if (arg == "--origin") {
            if (i + 1 >= argc || !parse_hex16(argv[i + 1], origin)) {
                std::cerr << "[args] --origin needs a hex address\n";
                return 1;
            }
            ++i;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[args] unknown option '" << arg << "'\n";
            usage(argv[0]);
            return 1;
        }
        else program_path = arg;
    }

    CPU cpu(config);
    if (program_path.empty()) {
        if (!cpu.load_program(demo_program())) return 1;
    } else if (!load_program_file(cpu, program_path, origin)) {
        std::cerr << "[load] failed to load '" << program_path << "'\n";
        return 1;
    }
    cpu.reset();

    if (batch) {
        try {
            cpu.run();
        } catch (const UnsupportedOpcode& e) {
            std::cerr << "[cpu] " << e.what() << "\n";
            print_regs(cpu);
            return 2;
        }
        print_regs(cpu);
        return 0;
    }

    std::unordered_set<uint16_t> breakpoints;

    std::cout << "6502 core monitor (CLI)\n";
    std::cout << "Type 'help' for commands.\n\n";
    print_regs(cpu);

    std::string line;
    while (true){
        std::cout << "\n> " << std::flush;
        if(!std::getline(std::cin, line)) break;

        std::istringstream iss(line);
        std::string cmd; iss >> cmd;
        if(cmd.empty()) continue;

        // normalize lowercase
        std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

        if(cmd=="q" || cmd=="quit" || cmd=="exit"){
            break;
        }
        else if(cmd=="help" || cmd=="h" || cmd=="?"){
            std::cout <<
R"(Commands:
  s                 step one instruction
  r N               run N instructions
  g                 run until halt or breakpoint
  p                 print registers
  m ADDR [ROWS]     dump memory from hex ADDR (default 8 rows of 16)
  w ADDR BYTE       write BYTE at ADDR (both hex)
  b ADDR            add breakpoint at PC==ADDR (hex)
  bl                list breakpoints
  bc [ADDR]         clear breakpoint at ADDR or all if none
  t [K]             show last K trace frames (default 20)
  trace on|off      record bus events per instruction
  mode canonical|legacy   (ind,X)/(ind),Y resolution
  reset             reset CPU from the reset vector and clear trace
  d ADDR [N-instr]  disassemble N instructions starting at address ADDR
  loadhex FILE ADDR       load whitespace-separated hex bytes at ADDR
  loaddump FILE           load an 'AAAA: bb bb ..' dump and point the reset vector at it
  loadbin FILE ADDR       load a raw binary at ADDR
  setrv ADDR        set the reset vector at FFFC
  demo              clear memory and reload the built-in demo program at 8000
  help              this text
  quit              exit
)";
        }
        else if(cmd=="s"){
            if(cpu.state==RunState::Running && !try_step(cpu) && cpu.halted())
                std::cout<<"BRK at "<<hex16(uint16_t(cpu.PC-1))<<", halted\n";
            print_regs(cpu);
        }
        else if(cmd=="r"){
            int n=0; iss>>n; if(n<=0) n=1;
            report_stop(cpu, run_until(cpu, breakpoints, uint64_t(n)), false);
            print_regs(cpu);
        }
        else if(cmd=="g"){
            report_stop(cpu, run_until(cpu, breakpoints, GO_WATCHDOG), true);
            print_regs(cpu);
        }
        else if(cmd=="p"){
            print_regs(cpu);
        }
        else if(cmd=="m"){
            std::string saddr; int rows=8; iss>>saddr>>rows;
            uint16_t addr;
            if(!parse_hex16(saddr, addr)){ std::cout<<"usage: m ADDR [ROWS]\n"; continue; }
            dump_mem(cpu.bus(), addr, rows, 16);
        }
        else if(cmd=="w"){
            std::string saddr, sbyte; iss>>saddr>>sbyte;
            uint16_t addr, val;
            if(!parse_hex16(saddr, addr) || !parse_hex16(sbyte, val) || val > 0xFF){ std::cout<<"usage: w ADDR BYTE\n"; continue; }
            cpu.bus().write_byte(addr, static_cast<uint8_t>(val));
            std::cout<<"Wrote "<<hex8(static_cast<uint8_t>(val))<<" to ["<<hex16(addr)<<"]\n";
        }
        else if(cmd=="b"){
            std::string saddr; iss>>saddr;
            uint16_t addr;
            if(!parse_hex16(saddr, addr)){ std::cout<<"usage: b ADDR\n"; continue; }
            breakpoints.insert(addr);
            std::cout<<"Breakpoint added at PC="<<hex16(addr)<<"\n";
        }
        else if(cmd=="bl"){
            if(breakpoints.empty()) std::cout<<"(no breakpoints)\n";
            for(auto pc: breakpoints) std::cout<<" - "<<hex16(pc)<<"\n";
        }
        else if(cmd=="bc"){
            std::string saddr; iss>>saddr;
            uint16_t addr;
            if(saddr.empty()){ breakpoints.clear(); std::cout<<"Breakpoints cleared.\n"; }
            else if(parse_hex16(saddr, addr)){
                breakpoints.erase(addr);
                std::cout<<"Cleared "<<hex16(addr)<<"\n";
            }
            else std::cout<<"usage: bc [ADDR]\n";
        }
        else if(cmd=="t"){
            int k=20; iss>>k; if(k<=0) k=20;
            print_trace(cpu, k);
        }
        else if(cmd=="trace"){
            std::string v; iss>>v;
            if(v=="on") cpu.config.trace = true;
            else if(v=="off") { cpu.config.trace = false; cpu.clear_trace(); }
            else { std::cout<<"usage: trace on|off\n"; continue; }
            std::cout<<"Trace "<<v<<"\n";
        }
        else if(cmd=="mode"){
            std::string v; iss>>v;
            if(v=="canonical") cpu.config.indirect = IndirectMode::Canonical;
            else if(v=="legacy") cpu.config.indirect = IndirectMode::Legacy;
            else { std::cout<<"usage: mode canonical|legacy\n"; continue; }
            std::cout<<"Indirect addressing: "<<v<<"\n";
        }
        else if(cmd=="reset"){
            cpu.reset();
            std::cout<<"Reset done.\n";
            print_regs(cpu);
        }
        else if (cmd=="d" || cmd=="dis" || cmd=="disasm") {
            std::string saddr; int n = 16;
            iss >> saddr >> n;
            uint16_t addr;
            if (!parse_hex16(saddr, addr)) {
                std::cout << "usage: d <ADDR-hex> [N-instr]\n";
                continue;
            }
            if (n <= 0) n = 16;
            disasm_range(cpu.bus(), addr, n);
        }
        else if (cmd=="loadbin" || cmd=="loadhex") {
            std::string path, saddr; iss >> path >> saddr;
            uint16_t base;
            if(path.empty() || !parse_hex16(saddr, base)){ std::cout<<"usage: "<<cmd<<" <path> <addr-hex>\n"; continue; }
            std::vector<uint8_t> buf;
            bool ok = (cmd=="loadbin") ? read_file_binary(path, buf) : read_file_hexbytes(path, buf);
            if(!ok) { std::cout<<"["<<cmd<<"] failed to read '"<<path<<"'\n"; continue; }
            if(!cpu.bus().load(buf, base)) continue;
            std::cout<<"["<<cmd<<"] loaded "<<std::dec<<buf.size()<<" bytes at "<<hex16(base)<<"\n";
        }
        else if (cmd=="loaddump") {
            std::string path; iss >> path;
            if(path.empty()){ std::cout<<"usage: loaddump <path>\n"; continue; }
            HexImage img;
            if(!read_file_hexdump(path, img)) { std::cout<<"[loaddump] failed to parse '"<<path<<"'\n"; continue; }
            if(!cpu.load_program(img.bytes, img.origin)) continue;
            std::cout<<"[loaddump] loaded "<<std::dec<<img.bytes.size()<<" bytes at "<<hex16(img.origin)
                     <<", reset vector updated\n";
        }
        else if (cmd=="setrv") {
            // set reset vector (little-endian address stored at FFFC/FFFD)
            std::string saddr; iss >> saddr;
            uint16_t start;
            if(!parse_hex16(saddr, start)){ std::cout<<"usage: setrv <addr-hex>\n"; continue; }
            cpu.bus().write16(Bus::RESET_VECTOR, start);
            std::cout<<"[setrv] reset vector set to "<<hex16(start)<<"\n";
        }
        else if (cmd=="demo") {
            cpu.bus().clear();
            if(!cpu.load_program(demo_program())) continue;
            cpu.reset();
            std::cout<<"[demo] loaded at "<<hex16(Bus::PROGRAM_ORIGIN)<<"\n";
            print_regs(cpu);
        }
        else {
            std::cout<<"Unknown command. Type 'help'.\n";
        }
    }

    return 0;
}
