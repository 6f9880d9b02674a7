#include <vector>
#include <cstdint>

// Built-in ROM: draws the 16 font glyphs, then echoes every pressed key as
// a glyph at (28,20) with a short beep.
std::vector<uint8_t> demo_program() {
    std::vector<uint8_t> p;
    auto emit=[&](uint16_t w){ p.push_back(w >> 8); p.push_back(w & 0xFF); };
    emit(0x00E0);               // 200 CLS
    emit(0x6000);               // 202 V0 = 0   digit
    emit(0x6100);               // 204 V1 = 0   x
    emit(0x6200);               // 206 V2 = 0   y
    // glyphs:
    emit(0xF029);               // 208 I = font(V0)
    emit(0xD125);               // 20A DRW V1, V2, 5
    emit(0x7001);               // 20C V0 += 1
    emit(0x7108);               // 20E V1 += 8
    emit(0x3140);               // 210 skip if V1 == 64
    emit(0x1218);               // 212 JP 218
    emit(0x6100);               // 214 V1 = 0
    emit(0x7206);               // 216 V2 += 6
    emit(0x3010);               // 218 skip if V0 == 16
    emit(0x1208);               // 21A JP glyphs
    // key echo:
    emit(0x631C);               // 21C V3 = 28
    emit(0x6414);               // 21E V4 = 20
    emit(0x6500);               // 220 V5 = 0   glyph on screen
    emit(0xF529);               // 222 I = font(V5)
    emit(0xD345);               // 224 DRW V3, V4, 5
    emit(0xF60A);               // 226 V6 = key (wait)
    emit(0xF529);               // 228 I = font(V5)
    emit(0xD345);               // 22A erase old glyph
    emit(0x8560);               // 22C V5 = V6
    emit(0xF529);               // 22E I = font(V5)
    emit(0xD345);               // 230 DRW new glyph
    emit(0x6708);               // 232 V7 = 8
    emit(0xF718);               // 234 ST = V7
    emit(0x1226);               // 236 JP 226
    return p;
}
