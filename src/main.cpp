// src/main.cpp
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <string>
#include <cstdint>
#include <algorithm>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <limits>

#include "cli_args.hpp"
#include "machine.hpp"
#include "rom_file.hpp"
#include "scheduler.hpp"

extern std::vector<uint8_t> demo_program();

static std::string hex16(uint16_t v){ std::ostringstream o; o<<std::hex<<std::setw(4)<<std::setfill('0')<<int(v); return o.str(); }
static std::string hex8(uint8_t v){ std::ostringstream o; o<<std::hex<<std::setw(2)<<std::setfill('0')<<int(v); return o.str(); }

static void print_regs(const Machine& m){
    std::cout << "PC="<<hex16(m.pc())
              << "  I="<<hex16(m.index())
              << "  SP="<<m.stack_depth()
              << "  DT="<<hex8(m.delay_timer())
              << "  ST="<<hex8(m.sound_timer())
              << "  state="<< state_name(m.state())
              << "  cycles="<<std::dec<<m.cycles() << "\n";
    for(int r=0;r<16;r++){
        std::cout<<"V"<<std::hex<<std::uppercase<<r<<std::nouppercase<<"="<<hex8(m.v(r))
                 <<(r%8==7 ? "\n" : "  ");
    }
    std::cout<<"keys down:";
    const auto& keys = m.keys();
    for(size_t k=0;k<keys.size();k++) if(keys[k]) std::cout<<" "<<std::hex<<std::uppercase<<k<<std::nouppercase;
    std::cout<<std::dec<<"\n";
}

static void print_screen(const Machine& m){
    const Display::Frame fb = m.framebuffer();
    std::string line;
    for(size_t y=0;y<Display::HEIGHT;y++){
        line.clear();
        for(size_t x=0;x<Display::WIDTH;x++) line += fb[y*Display::WIDTH + x] ? '#' : '.';
        std::cout<<line<<"\n";
    }
    std::cout<<"["<<m.lit_pixels()<<" pixels lit]\n";
}

static void report_fault(const Machine& m){
    const auto& f = m.last_fault();
    if(!f) return;
    std::cerr<<"[fault] "<<fault_name(f->kind)<<" at PC="<<hex16(f->pc)
             <<" opcode="<<hex16(f->opcode);
    if(f->op) std::cerr<<" ("<<mnemonic(*f->op)<<")";
    std::cerr<<": "<<f->what()<<"\n";
}

static bool load_rom(Machine& m, const std::string& path){
    std::vector<uint8_t> buf;
    const RomReadStatus st = read_rom_file(path, buf);
    if(st != RomReadStatus::Ok){ std::cerr<<"[load] "<<rom_read_message(st)<<": '"<<path<<"'\n"; return false; }
    if(!has_rom_extension(path))
        std::cerr<<"[load] '"<<path<<"' is not a .ch8/.chip8 file, loading anyway\n";
    try { m.load(buf); }
    catch(const Fault& f){ std::cerr<<"[load] "<<fault_name(f.kind)<<": "<<f.what()<<"\n"; return false; }
    std::cout<<"[load] loaded "<<buf.size()<<" bytes from '"<<path<<"'\n";
    return true;
}

// Drive the scheduler for the given number of 60 Hz frames of emulated time.
static RunSummary run_frames(Scheduler& sched, int frames){
    RunSummary total;
    const auto frame = std::chrono::nanoseconds(1'000'000'000 / Scheduler::TIMER_HZ);
    for(int i=0;i<frames;i++){
        RunSummary s = sched.advance(frame);
        total.cycles += s.cycles;
        total.ticks  += s.ticks;
        if(s.halted || s.stopped){ total.halted = s.halted; total.stopped = s.stopped; break; }
    }
    return total;
}

static void usage(){
    std::cout << "usage: chip8vm [ROM] [--hz N] [--seed N] [--frames N]\n";
}

int main(int argc, char** argv){
    std::string rom_path;
    uint32_t hz = Scheduler::DEFAULT_HZ;
    MachineConfig cfg;
    int headless_frames = -1;

    for(int i=1;i<argc;i++){
        std::string a = argv[i];
        auto next = [&](const char* flag) -> std::string {
            if(i+1 >= argc) throw std::invalid_argument(std::string(flag) + " needs a value");
            return argv[++i];
        };
        try {
            if(a=="--hz")          hz = parse_u32(next("--hz"), 1, Scheduler::MAX_HZ);
            else if(a=="--seed")   cfg.seed = parse_u32(next("--seed"), 0, std::numeric_limits<uint32_t>::max());
            else if(a=="--frames") headless_frames = (int)parse_u32(next("--frames"), 0, std::numeric_limits<int>::max());
            else if(a=="-h" || a=="--help"){ usage(); return 0; }
            else rom_path = a;
        } catch(const std::exception& e){
            std::cerr<<"[args] "<<e.what()<<"\n";
            usage();
            return 2;
        }
    }

    Machine m(cfg);
    Scheduler sched(m, hz);

    if(rom_path.empty()){
        m.load(demo_program());
        std::cout<<"[load] no ROM given, running the built-in demo\n";
    } else if(!load_rom(m, rom_path)){
        return 1;
    }

    if(headless_frames >= 0){
        RunSummary s = run_frames(sched, headless_frames);
        std::cout<<"[run] "<<s.cycles<<" cycles, "<<s.ticks<<" timer ticks\n";
        print_screen(m);
        report_fault(m);
        return m.state()==MachineState::Halted ? 1 : 0;
    }

    std::cout << "CHIP-8 VM (CLI)\n";
    std::cout << "Type 'help' for commands.\n\n";
    print_regs(m);

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
  s                 step one cycle
  r N               run N cycles (no timer ticks)
  f N               run N 60 Hz frames through the scheduler
  t N               tick timers N times
  p                 print registers and state
  screen            print the framebuffer
  k KEY 0|1         release/press key 0-F (hex)
  hz N              set cycles per second
  load PATH         load a ROM file (full reset)
  reset             reload the current ROM
  sleep MS          sleep for MS milliseconds
  help              this text
  quit              exit
)";
        }
        else if(cmd=="s"){
            if(!m.step_cycle()) report_fault(m);
            print_regs(m);
        }
        else if(cmd=="r"){
            int n=0; iss>>n; if(n<=0) n=1;
            for(int i=0;i<n;i++){
                if(!m.step_cycle()){ report_fault(m); break; }
            }
            print_regs(m);
        }
        else if(cmd=="f"){
            int n=0; iss>>n; if(n<=0) n=1;
            RunSummary s = run_frames(sched, n);
            std::cout<<"[run] "<<s.cycles<<" cycles, "<<s.ticks<<" timer ticks\n";
            if(s.halted) report_fault(m);
            print_regs(m);
        }
        else if(cmd=="t"){
            int n=0; iss>>n; if(n<=0) n=1;
            for(int i=0;i<n;i++) m.tick_timers();
            print_regs(m);
        }
        else if(cmd=="p"){
            print_regs(m);
        }
        else if(cmd=="screen"){
            print_screen(m);
        }
        else if(cmd=="k"){
            std::string skey; int down=-1; iss>>skey>>down;
            if(skey.empty() || (down!=0 && down!=1)){ std::cout<<"usage: k KEY 0|1\n"; continue; }
            uint32_t kid = 0;
            try { kid = parse_u32(skey, 0, 0xF, 16); }
            catch(const std::logic_error& e){ std::cout<<"[key] key id "<<e.what()<<"\n"; continue; }
            m.set_key((uint8_t)kid, down==1);
            print_regs(m);
        }
        else if(cmd=="hz"){
            std::string arg; iss>>arg;
            try { sched.set_cycles_per_second(parse_u32(arg, 1, Scheduler::MAX_HZ)); }
            catch(const std::logic_error& e){ std::cout<<"[hz] "<<e.what()<<"\n"; continue; }
            std::cout<<"[hz] "<<sched.cycles_per_second()<<" cycles/s\n";
        }
        else if(cmd=="load"){
            std::string path; iss>>path;
            if(path.empty()){ std::cout<<"usage: load PATH\n"; continue; }
            if(load_rom(m, path)) print_regs(m);
        }
        else if(cmd=="reset"){
            m.reset();
            std::cout<<"Reset done.\n";
            print_regs(m);
        }
        else if(cmd=="sleep"){
            int ms=0; iss>>ms; if(ms>0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
        else {
            std::cout<<"Unknown command. Type 'help'.\n";
        }
    }

    return 0;
}
