// gui/app.cpp
// SDL2 + Dear ImGui viewer for the 6502 core (SDL_Renderer2 backend)
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include <SDL.h>

#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"

#include "cpu.hpp"
#include "disasm.hpp"
#include "loader.hpp"

extern std::vector<uint8_t> demo_program();

struct ViewerState {
    bool autoRun = false;
    bool legacyIndirect = false;
    int  instrPerFrame = 1;
    int  timelineRows = 256;
    uint16_t memBase = 0x0200;
    uint16_t codeBase = Bus::PROGRAM_ORIGIN;
    char memText[8] = "0200";
    char codeText[8] = "8000";
    std::string lastError;
};

static void placeOnce(float x, float y, float w, float h) {
    ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(w, h), ImGuiCond_FirstUseEver);
}

// Hex text field bound to an address; keeps the old value on bad input
static void addressField(const char* label, char (&text)[8], uint16_t& addr) {
    ImGui::SetNextItemWidth(180);
    if (ImGui::InputText(label, text, sizeof(text),
                         ImGuiInputTextFlags_CharsHexadecimal | ImGuiInputTextFlags_CharsNoBlank)) {
        unsigned v = 0;
        if (std::sscanf(text, "%x", &v) == 1) addr = static_cast<uint16_t>(v & 0xFFFF);
    }
}

// An unsupported opcode stops auto-run and is shown in the controls panel
static void stepCpu(CPU& cpu, ViewerState& vs) {
    try {
        cpu.step();
    } catch (const UnsupportedOpcode& e) {
        vs.lastError = e.what();
        vs.autoRun = false;
    }
}

static void drawControls(CPU& cpu, ViewerState& vs) {
    placeOnce(20, 20, 1000, 220);
    ImGui::Begin("Controls");
    ImGui::Text("PC:%04X  A:%02X X:%02X Y:%02X  SP:%02X  P:%02X  steps:%llu  %s",
                cpu.PC, cpu.A, cpu.X, cpu.Y, cpu.SP, cpu.P.pack(),
                (unsigned long long)cpu.steps, cpu.halted() ? "HALTED" : cpu.faulted() ? "FAULTED (reset)" : "running");
    if (ImGui::Button("Step") && cpu.state == RunState::Running) stepCpu(cpu, vs);
    ImGui::SameLine();
    ImGui::Checkbox("Run", &vs.autoRun);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(140);
    ImGui::InputInt("instr/frame", &vs.instrPerFrame);
    vs.instrPerFrame = std::max(1, vs.instrPerFrame);
    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        cpu.reset();
        vs.lastError.clear();
    }
    if (ImGui::Checkbox("Legacy (ind,X)/(ind),Y", &vs.legacyIndirect))
        cpu.config.indirect = vs.legacyIndirect ? IndirectMode::Legacy : IndirectMode::Canonical;
    if (!vs.lastError.empty())
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", vs.lastError.c_str());
    ImGui::End();
}

static void drawRegisters(const CPU& cpu) {
    placeOnce(20, 260, 1000, 220);
    ImGui::Begin("Registers & Flags");
    ImGui::Text("A:%02X  X:%02X  Y:%02X", cpu.A, cpu.X, cpu.Y);
    ImGui::Text("PC:%04X  SP:%02X  P:%02X", cpu.PC, cpu.SP, cpu.P.pack());
    ImGui::Separator();
    const struct { const char* name; bool set; } bits[] = {
        {"N", cpu.P.N}, {"V", cpu.P.V}, {"-", cpu.P.U}, {"B", cpu.P.B},
        {"D", cpu.P.D}, {"I", cpu.P.I}, {"Z", cpu.P.Z}, {"C", cpu.P.C},
    };
    const ImVec4 on(0.3f, 1.0f, 0.4f, 1.0f), off(0.5f, 0.5f, 0.5f, 1.0f);
    for (const auto& b : bits) {
        ImGui::TextColored(b.set ? on : off, "%s", b.name);
        ImGui::SameLine();
    }
    ImGui::NewLine();
    ImGui::End();
}

static void drawDisassembly(const CPU& cpu, ViewerState& vs) {
    placeOnce(20, 500, 1000, 560);
    ImGui::Begin("Disassembly");
    addressField("From (hex)", vs.codeText, vs.codeBase);
    ImGui::SameLine();
    if (ImGui::Button("Follow PC")) vs.codeBase = cpu.PC;
    ImGui::BeginChild("dis", ImVec2(0, 0), true);
    uint16_t pc = vs.codeBase;
    for (int i = 0; i < 24; ++i) {
        const std::string line = disasm_one(cpu.bus(), pc);
        if (pc == cpu.PC) ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.3f, 1.0f), "> %s", line.c_str());
        else ImGui::Text("  %s", line.c_str());
        pc = static_cast<uint16_t>(pc + instr_len(cpu.bus().read_byte(pc)));
    }
    ImGui::EndChild();
    ImGui::End();
}

static void hexRows(const Bus& bus, uint16_t start, int rows) {
    for (int r = 0; r < rows; ++r) {
        const uint32_t row = start + static_cast<uint32_t>(r) * 16;
        if (row >= Bus::MEM_SIZE) break;
        std::string line;
        char cell[4];
        for (uint32_t a = row; a < row + 16 && a < Bus::MEM_SIZE; ++a) {
            std::snprintf(cell, sizeof(cell), "%02X ", bus.read_byte(static_cast<uint16_t>(a)));
            line += cell;
        }
        ImGui::Text("%04X: %s", (unsigned)row, line.c_str());
    }
}

static void drawMemory(const CPU& cpu, ViewerState& vs) {
    placeOnce(1040, 20, 720, 720);
    ImGui::Begin("Memory");
    addressField("Base (hex)", vs.memText, vs.memBase);
    ImGui::BeginChild("hex", ImVec2(0, 420), true);
    hexRows(cpu.bus(), vs.memBase, 16);
    ImGui::EndChild();
    ImGui::Separator();
    ImGui::Text("Zero page");
    ImGui::BeginChild("zp", ImVec2(0, 180), true);
    hexRows(cpu.bus(), 0x0000, 4);
    ImGui::EndChild();
    ImGui::End();
}

// One row per instruction; expanding a row lists its bus events
static void drawTimeline(const CPU& cpu, ViewerState& vs) {
    placeOnce(1040, 760, 720, 300);
    ImGui::Begin("Timeline");
    ImGui::SliderInt("Rows", &vs.timelineRows, 64, 2000);
    const int total = static_cast<int>(cpu.timeline.size());
    ImGui::BeginChild("tl", ImVec2(0, 220), true);
    for (int i = std::max(0, total - vs.timelineRows); i < total; ++i) {
        const TraceFrame& f = cpu.timeline[i];
        if (ImGui::TreeNode((void*)(intptr_t)i,
                "#%llu %04X  %02X %-3s  A=%02X X=%02X Y=%02X SP=%02X P=%02X",
                (unsigned long long)f.step, f.pc, f.opcode, decode(f.opcode).mnemonic,
                f.a, f.x, f.y, f.sp, f.flags)) {
            for (const BusEvent& e : f.events)
                ImGui::BulletText("%s %04X = %02X  %s",
                    e.dir == BusDir::Read ? "RD" : "WR", e.address, e.data, e.note.c_str());
            ImGui::TreePop();
        }
    }
    ImGui::EndChild();
    ImGui::End();
}

// argv[1] is an address-prefixed dump; without it the demo program is loaded
static bool loadInitialProgram(CPU& cpu, int argc, char** argv) {
    if (argc > 1) {
        HexImage img;
        if (!read_file_hexdump(argv[1], img)) return false;
        if (!cpu.load_program(img.bytes, img.origin)) return false;
    } else if (!cpu.load_program(demo_program())) {
        return false;
    }
    cpu.reset();
    return true;
}

int main(int argc, char** argv) {
    CpuConfig config;
    config.trace = true;
    config.trace_limit = 2000;
    CPU cpu(config);
    if (!loadInitialProgram(cpu, argc, argv)) {
        std::fprintf(stderr, "[gui] failed to load program\n");
        return 1;
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "[gui] SDL_Init: %s\n", SDL_GetError());
        return 1;
    }
    SDL_Window* window = SDL_CreateWindow("trace6502", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          1800, 1100, SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    SDL_Renderer* renderer = window
        ? SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC)
        : nullptr;
    auto closeSdl = [&]() {
        if (renderer) SDL_DestroyRenderer(renderer);
        if (window) SDL_DestroyWindow(window);
        SDL_Quit();
    };
    if (!renderer) {
        std::fprintf(stderr, "[gui] window/renderer: %s\n", SDL_GetError());
        closeSdl();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().FontGlobalScale = 2.0f;   // HiDPI
    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(1.2f);
    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer)) {
        std::fprintf(stderr, "[gui] ImGui SDL2 backend init failed\n");
        ImGui::DestroyContext();
        closeSdl();
        return 1;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer)) {
        std::fprintf(stderr, "[gui] ImGui SDL renderer backend init failed\n");
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        closeSdl();
        return 1;
    }

    ViewerState vs;
    vs.codeBase = cpu.PC;
    bool running = true;
    while (running) {
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            ImGui_ImplSDL2_ProcessEvent(&ev);
            if (ev.type == SDL_QUIT) running = false;
            if (ev.type == SDL_WINDOWEVENT && ev.window.event == SDL_WINDOWEVENT_CLOSE &&
                ev.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        for (int i = 0; vs.autoRun && i < vs.instrPerFrame && cpu.state == RunState::Running; ++i) stepCpu(cpu, vs);

        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        drawControls(cpu, vs);
        drawRegisters(cpu);
        drawDisassembly(cpu, vs);
        drawMemory(cpu, vs);
        drawTimeline(cpu, vs);

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 25, 25, 25, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    closeSdl();
    return 0;
}
