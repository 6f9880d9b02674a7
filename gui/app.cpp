// gui/app.cpp
// SDL2 + Dear ImGui front end for the CHIP-8 core (SDL_Renderer2 backend)
#include <cstdio>
#include <vector>
#include <string>
#include <cstdint>
#include <algorithm>
#include <chrono>

#include <SDL.h>

#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"  // SDL2 renderer v2 backend

#include "machine.hpp"
#include "rom_file.hpp"
#include "scheduler.hpp"

// Forward declaration — implemented in src/demo_program.cpp
extern std::vector<uint8_t> demo_program();

// 1 2 3 C / 4 5 6 D / 7 8 9 E / A 0 B F  on  1234 / QWER / ASDF / ZXCV
static const SDL_Scancode KEYMAP[16] = {
    SDL_SCANCODE_X,                                                   // 0
    SDL_SCANCODE_1, SDL_SCANCODE_2, SDL_SCANCODE_3,                   // 1 2 3
    SDL_SCANCODE_Q, SDL_SCANCODE_W, SDL_SCANCODE_E,                   // 4 5 6
    SDL_SCANCODE_A, SDL_SCANCODE_S, SDL_SCANCODE_D,                   // 7 8 9
    SDL_SCANCODE_Z, SDL_SCANCODE_C,                                   // A B
    SDL_SCANCODE_4, SDL_SCANCODE_R, SDL_SCANCODE_F, SDL_SCANCODE_V,   // C D E F
};

static int chip8_key(SDL_Scancode sc) {
    for (int k = 0; k < 16; ++k) if (KEYMAP[k] == sc) return k;
    return -1;
}

// Square wave; the callback only touches its own phase counter.
struct Tone {
    int freq{440};
    int rate{44100};
    uint32_t phase{0};
};

static void tone_callback(void* user, Uint8* stream, int len) {
    Tone* t = static_cast<Tone*>(user);
    int16_t* out = reinterpret_cast<int16_t*>(stream);
    const int samples = len / static_cast<int>(sizeof(int16_t));
    const uint32_t half = static_cast<uint32_t>(t->rate / (t->freq * 2));
    for (int i = 0; i < samples; ++i) {
        out[i] = ((t->phase++ / half) % 2) ? 3000 : -3000;
    }
}

// Helper: give windows an initial position/size (first run only).
static inline void PlaceFirstUse(const ImVec2& pos, const ImVec2& size) {
    ImGui::SetNextWindowPos(pos, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(size, ImGuiCond_FirstUseEver);
}

static void framebufferView(const Display::Frame& fb) {
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const float cell = std::max(1.0f, std::min(avail.x / Display::WIDTH, avail.y / Display::HEIGHT));
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->AddRectFilled(origin, ImVec2(origin.x + cell * Display::WIDTH, origin.y + cell * Display::HEIGHT),
                      IM_COL32(16, 16, 16, 255));
    for (size_t y = 0; y < Display::HEIGHT; ++y) {
        for (size_t x = 0; x < Display::WIDTH; ++x) {
            if (!fb[y * Display::WIDTH + x]) continue;
            ImVec2 a(origin.x + x * cell, origin.y + y * cell);
            dl->AddRectFilled(a, ImVec2(a.x + cell, a.y + cell), IM_COL32(220, 220, 220, 255));
        }
    }
    ImGui::Dummy(ImVec2(cell * Display::WIDTH, cell * Display::HEIGHT));
}

int main(int argc, char** argv) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL Error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "CHIP-8 VM",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1400, 900,
        SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) { std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError()); SDL_Quit(); return 1; }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) { std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError()); SDL_DestroyWindow(window); SDL_Quit(); return 1; }

    // --- audio (optional: the emulator runs silently without it) ---
    Tone tone;
    SDL_AudioSpec want{}, have{};
    want.freq = tone.rate;
    want.format = AUDIO_S16SYS;
    want.channels = 1;
    want.samples = 512;
    want.callback = tone_callback;
    want.userdata = &tone;
    SDL_AudioDeviceID audio = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
    if (audio == 0) std::fprintf(stderr, "[audio] SDL_OpenAudioDevice failed: %s\n", SDL_GetError());

    // --- ImGui init ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.FontGlobalScale = 1.5f;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForSDLRenderer failed\n");
        SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDLRenderer2_Init failed\n");
        ImGui_ImplSDL2_Shutdown(); SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }

    // --- machine init ---
    Machine vm;
    Scheduler sched(vm);
    static char romPath[512] = "";
    std::string status;
    if (argc > 1) {
        std::snprintf(romPath, sizeof(romPath), "%s", argv[1]);
    }

    auto loadRom = [&](const std::string& path) {
        std::vector<uint8_t> buf;
        if (path.empty()) { vm.load(demo_program()); status = "built-in demo"; return; }
        const RomReadStatus st = read_rom_file(path, buf);
        if (st != RomReadStatus::Ok) {
            status = std::string(rom_read_message(st)) + ": '" + path + "'";
            std::fprintf(stderr, "[load] %s\n", status.c_str());
            return;
        }
        if (!has_rom_extension(path))
            std::fprintf(stderr, "[load] '%s' is not a .ch8/.chip8 file, loading anyway\n", path.c_str());
        try {
            vm.load(buf);
            status = "loaded " + std::to_string(buf.size()) + " bytes";
        } catch (const Fault& f) {
            status = std::string(fault_name(f.kind)) + ": " + f.what();
            std::fprintf(stderr, "[load] %s\n", status.c_str());
        }
    };
    loadRom(romPath);

    bool running = true;
    bool autoRun = true;
    int  hz = static_cast<int>(sched.cycles_per_second());
    Uint64 last = SDL_GetPerformanceCounter();
    const Uint64 freq = SDL_GetPerformanceFrequency();

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) running = false;
            if (event.type == SDL_WINDOWEVENT &&
                event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(window)) running = false;
            if ((event.type == SDL_KEYDOWN || event.type == SDL_KEYUP) && !event.key.repeat && !io.WantTextInput) {
                int k = chip8_key(event.key.keysym.scancode);
                if (k >= 0) vm.set_key(static_cast<uint8_t>(k), event.type == SDL_KEYDOWN);
            }
        }

        // wall clock -> scheduler; clamp long stalls such as a window drag
        Uint64 now = SDL_GetPerformanceCounter();
        const Uint64 dt = std::min<Uint64>(now - last, freq / 10);
        const Uint64 ns = dt * 1'000'000'000ull / freq;
        last = now;
        if (autoRun) {
            RunSummary s = sched.advance(std::chrono::nanoseconds(ns));
            if (s.halted && vm.last_fault()) {
                const Fault& f = *vm.last_fault();
                std::fprintf(stderr, "[fault] %s at PC=%04X opcode=%04X (%s): %s\n",
                             fault_name(f.kind), f.pc, f.opcode,
                             f.op ? mnemonic(*f.op) : "undecoded", f.what());
            }
        }
        if (audio) SDL_PauseAudioDevice(audio, vm.sound_active() ? 0 : 1);

        ImGui_ImplSDL2_NewFrame();
        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui::NewFrame();

        // ---- Screen ----
        PlaceFirstUse({20,20}, {940,500});
        ImGui::Begin("Screen");
        framebufferView(vm.framebuffer());
        ImGui::Text("%zu pixels lit", vm.lit_pixels());
        ImGui::End();

        // ---- Controls ----
        PlaceFirstUse({20,540}, {940,200});
        ImGui::Begin("Controls");
        ImGui::Text("state: %s  cycles: %llu", state_name(vm.state()), (unsigned long long)vm.cycles());
        ImGui::Checkbox("Run", &autoRun); ImGui::SameLine();
        if (ImGui::Button("Step Cycle")) { vm.step_cycle(); } ImGui::SameLine();
        if (ImGui::Button("Reset")) { vm.reset(); }
        ImGui::SetNextItemWidth(200);
        if (ImGui::InputInt("cycles/s", &hz, 50, 500)) {
            hz = std::clamp(hz, 1, static_cast<int>(Scheduler::MAX_HZ));
            sched.set_cycles_per_second(static_cast<uint32_t>(hz));
        }
        ImGui::SetNextItemWidth(500);
        ImGui::InputText("ROM", romPath, sizeof(romPath)); ImGui::SameLine();
        if (ImGui::Button("Load")) loadRom(romPath);
        ImGui::TextUnformatted(status.c_str());
        if (vm.last_fault()) {
            const Fault& f = *vm.last_fault();
            ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s at %04X (opcode %04X %s)",
                               fault_name(f.kind), f.pc, f.opcode, f.op ? mnemonic(*f.op) : "undecoded");
        }
        ImGui::End();

        // ---- Registers & Timers ----
        PlaceFirstUse({980,20}, {380,420});
        ImGui::Begin("Registers");
        ImGui::Text("PC:%04X  I:%04X  SP:%zu", vm.pc(), vm.index(), vm.stack_depth());
        ImGui::Text("DT:%02X  ST:%02X  %s", vm.delay_timer(), vm.sound_timer(), vm.sound_active() ? "(beep)" : "");
        ImGui::Separator();
        for (int r = 0; r < 16; ++r) {
            ImGui::Text("V%X:%02X", r, vm.v(r));
            if (r % 4 != 3) ImGui::SameLine();
        }
        ImGui::Separator(); ImGui::Text("Keys (read-only)");
        const auto& keys = vm.keys();
        for (size_t k = 0; k < keys.size(); ++k) {
            bool down = keys[k];
            char label[4]; std::snprintf(label, sizeof(label), "%zX", k);
            ImGui::Checkbox(label, &down);
            if (k % 4 != 3) ImGui::SameLine();
        }
        ImGui::End();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 25, 25, 25, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    if (audio) SDL_CloseAudioDevice(audio);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
