#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "helpers.hpp"
#include "loader.hpp"

std::vector<uint8_t> demo_program();

TEST_CASE("ADC overflow program", "[programs]") {
    const std::vector<uint8_t> program = {0xA9, 0x81, 0x8D, 0x00, 0x02, 0x6D, 0x00, 0x02, 0x00};
    CPU cpu = ran(program);

    REQUIRE(cpu.A == 0x02);
    REQUIRE(cpu.bus().read_byte(0x0200) == 0x81);
    REQUIRE(cpu.P.V);
    REQUIRE(cpu.P.C);
    REQUIRE(cpu.P.B);
    REQUIRE(cpu.P.I);
    REQUIRE_FALSE(cpu.P.N);
    REQUIRE_FALSE(cpu.P.Z);
    REQUIRE_FALSE(cpu.P.D);
    REQUIRE(cpu.P.pack() == 0x75);
    REQUIRE(cpu.PC == static_cast<uint16_t>(0x8000 + program.size()));
}

TEST_CASE("Register shuffle through memory", "[programs]") {
    const std::vector<uint8_t> program = {
        0xA9, 0x01,             // LDA #$01
        0x8D, 0x00, 0x02,       // STA $0200
        0xA2, 0x05,             // LDX #$05
        0x8E, 0x01, 0x02,       // STX $0201
        0xA0, 0x08,             // LDY #$08
        0x8C, 0x02, 0x02,       // STY $0202
        0x8D, 0x03, 0x02,       // STA $0203
        0xAD, 0x02, 0x02,       // LDA $0202
        0x8D, 0x00, 0x02,       // STA $0200
        0xAE, 0x03, 0x02,       // LDX $0203
        0x8E, 0x02, 0x02,       // STX $0202
        0xAC, 0x01, 0x02,       // LDY $0201
        0x8C, 0x03, 0x02,       // STY $0203
        0x00,                   // BRK
    };
    CPU cpu = ran(program);

    REQUIRE(cpu.A == 0x08);
    REQUIRE(cpu.X == 0x01);
    REQUIRE(cpu.Y == 0x05);
    REQUIRE(cpu.PC == 0x8025);
    REQUIRE(cpu.bus().read_byte(0x0200) == 0x08);
    REQUIRE(cpu.bus().read_byte(0x0201) == 0x05);
    REQUIRE(cpu.bus().read_byte(0x0202) == 0x01);
    REQUIRE(cpu.bus().read_byte(0x0203) == 0x05);
    REQUIRE(cpu.steps == 14);
}

TEST_CASE("Built-in demo program", "[programs]") {
    const std::vector<uint8_t> program = demo_program();
    CPU cpu = ran(program);

    REQUIRE(cpu.A == 0x02);
    REQUIRE(cpu.X == 0x04);
    REQUIRE(cpu.bus().read_byte(0x0200) == 0x04);
    REQUIRE(cpu.P.C);
    REQUIRE_FALSE(cpu.P.V);
    REQUIRE_FALSE(cpu.P.Z);
    REQUIRE_FALSE(cpu.P.N);
    REQUIRE(cpu.P.B);
    REQUIRE(cpu.P.pack() == 0x35);
    REQUIRE(cpu.PC == static_cast<uint16_t>(0x8000 + program.size()));
}

TEST_CASE("load_and_run", "[programs]") {
    CPU cpu;
    REQUIRE(cpu.load_and_run({0xA2, 0x07, 0x8A, 0x00}));
    REQUIRE(cpu.halted());
    REQUIRE(cpu.A == 0x07);
    REQUIRE(cpu.PC == 0x8004);

    SECTION("the same CPU runs a second program") {
        REQUIRE(cpu.load_and_run({0xA0, 0x03, 0x98, 0x00}));
        REQUIRE(cpu.A == 0x03);
        REQUIRE(cpu.Y == 0x03);
        REQUIRE(cpu.PC == 0x8004);
    }

    SECTION("an oversized program is refused") {
        std::vector<uint8_t> big(0x8001, 0xEA);
        REQUIRE_FALSE(cpu.load_and_run(big));
        REQUIRE(cpu.bus().read16(Bus::RESET_VECTOR) == 0x8000);
    }
}

TEST_CASE("Programs at another origin", "[programs]") {
    HexImage image;
    REQUIRE(parse_hexdump(std::string(
        "0600: a9 05 85 10 a9 03\n"
        "0606: 65 10 00\n"), image));
    REQUIRE(image.origin == 0x0600);

    CPU cpu;
    REQUIRE(cpu.load_program(image.bytes, image.origin));
    REQUIRE(cpu.bus().read16(Bus::RESET_VECTOR) == 0x0600);
    cpu.reset();
    REQUIRE(cpu.PC == 0x0600);
    REQUIRE(cpu.run() == 4);
    REQUIRE(cpu.A == 0x08);
    REQUIRE(cpu.bus().read_byte(0x0010) == 0x05);
    REQUIRE(cpu.PC == 0x0609);
}
