#include <vector>
#include <cstdint>

// Exercises ADC, transfers, ASL on A and memory, SEC/SBC and a reload; loads at 8000.
std::vector<uint8_t> demo_program() {
    return {
        0xA9, 0x81,             // LDA #$81
        0x8D, 0x00, 0x02,       // STA $0200
        0x6D, 0x00, 0x02,       // ADC $0200     A=02 C=1 V=1
        0xAA,                   // TAX
        0x0A,                   // ASL A
        0x0E, 0x00, 0x02,       // ASL $0200
        0x0E, 0x00, 0x02,       // ASL $0200
        0x38,                   // SEC
        0xED, 0x00, 0x02,       // SBC $0200
        0x8A,                   // TXA
        0xAE, 0x00, 0x02,       // LDX $0200
        0x00,                   // BRK
    };
}
