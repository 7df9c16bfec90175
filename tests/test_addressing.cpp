#include <catch2/catch.hpp>
#include <stdexcept>
#include "helpers.hpp"

// PC parked on the operand bytes at 8001, as it is when a handler runs.
static void place_operand(CPU& cpu, uint8_t lo, uint8_t hi = 0x00) {
    cpu.bus().write_byte(0x8001, lo);
    cpu.bus().write_byte(0x8002, hi);
    cpu.PC = 0x8001;
}

TEST_CASE("Direct addressing modes", "[addressing]") {
    CPU cpu = prepared({0x00});

    SECTION("immediate addresses the operand byte itself") {
        place_operand(cpu, 0x42);
        REQUIRE(cpu.operand_address(AddrMode::Immediate) == 0x8001);
    }
    SECTION("zero page") {
        place_operand(cpu, 0x42);
        REQUIRE(cpu.operand_address(AddrMode::ZeroPage) == 0x0042);
    }
    SECTION("zero page,X wraps inside page zero") {
        place_operand(cpu, 0xF0);
        cpu.X = 0x20;
        REQUIRE(cpu.operand_address(AddrMode::ZeroPageX) == 0x0010);
    }
    SECTION("zero page,Y wraps inside page zero") {
        place_operand(cpu, 0xFF);
        cpu.Y = 0x01;
        REQUIRE(cpu.operand_address(AddrMode::ZeroPageY) == 0x0000);
    }
    SECTION("absolute is little-endian") {
        place_operand(cpu, 0x34, 0x12);
        REQUIRE(cpu.operand_address(AddrMode::Absolute) == 0x1234);
    }
    SECTION("absolute,X crosses pages") {
        place_operand(cpu, 0xFF, 0x12);
        cpu.X = 0x01;
        REQUIRE(cpu.operand_address(AddrMode::AbsoluteX) == 0x1300);
    }
    SECTION("absolute,Y wraps at the top of memory") {
        place_operand(cpu, 0xFF, 0xFF);
        cpu.Y = 0x02;
        REQUIRE(cpu.operand_address(AddrMode::AbsoluteY) == 0x0001);
    }
    SECTION("resolving does not move PC") {
        place_operand(cpu, 0x34, 0x12);
        cpu.operand_address(AddrMode::Absolute);
        REQUIRE(cpu.PC == 0x8001);
    }
    SECTION("implied has no address") {
        REQUIRE_THROWS_AS(cpu.operand_address(AddrMode::None), std::logic_error);
    }
}

TEST_CASE("Canonical indirect modes", "[addressing][indirect]") {
    CPU cpu = prepared({0x00});
    Bus& bus = cpu.bus();

    SECTION("(zp,X) reads the pointer from page zero") {
        bus.write_byte(0x24, 0x74);
        bus.write_byte(0x25, 0x20);
        place_operand(cpu, 0x20);
        cpu.X = 0x04;
        REQUIRE(cpu.operand_address(AddrMode::IndirectX) == 0x2074);
    }
    SECTION("(zp,X) pointer high byte wraps to 00") {
        bus.write_byte(0xFF, 0x34);
        bus.write_byte(0x00, 0x12);
        bus.write_byte(0x100, 0x77);
        place_operand(cpu, 0xFE);
        cpu.X = 0x01;
        REQUIRE(cpu.operand_address(AddrMode::IndirectX) == 0x1234);
    }
    SECTION("(zp),Y adds Y to the pointer") {
        bus.write_byte(0x86, 0x28);
        bus.write_byte(0x87, 0x40);
        place_operand(cpu, 0x86);
        cpu.Y = 0x10;
        REQUIRE(cpu.operand_address(AddrMode::IndirectY) == 0x4038);
    }
    SECTION("(zp),Y pointer high byte wraps to 00") {
        bus.write_byte(0xFF, 0xF0);
        bus.write_byte(0x00, 0x30);
        place_operand(cpu, 0xFF);
        cpu.Y = 0x20;
        REQUIRE(cpu.operand_address(AddrMode::IndirectY) == 0x3110);
    }
    SECTION("(zp),Y wraps at the top of memory") {
        bus.write_byte(0x10, 0xFF);
        bus.write_byte(0x11, 0xFF);
        place_operand(cpu, 0x10);
        cpu.Y = 0x03;
        REQUIRE(cpu.operand_address(AddrMode::IndirectY) == 0x0002);
    }
    SECTION("LDA (zp),Y end to end") {
        bus.write_byte(0x86, 0x28);
        bus.write_byte(0x87, 0x40);
        bus.write_byte(0x4038, 0x99);
        bus.write_byte(0x8000, 0xB1);
        bus.write_byte(0x8001, 0x86);
        cpu.PC = 0x8000;
        cpu.Y = 0x10;
        cpu.step();
        REQUIRE(cpu.A == 0x99);
        REQUIRE(cpu.PC == 0x8002);
    }
}

TEST_CASE("Legacy indirect modes", "[addressing][indirect][legacy]") {
    CPU cpu = prepared({0x00}, legacy_config());
    Bus& bus = cpu.bus();

    SECTION("(zp,X) agrees with canonical away from the page edge") {
        bus.write_byte(0x24, 0x74);
        bus.write_byte(0x25, 0x20);
        bus.write_byte(0x26, 0x55);
        place_operand(cpu, 0x20);
        cpu.X = 0x04;
        REQUIRE(cpu.operand_address(AddrMode::IndirectX) == 0x2074);
    }
    SECTION("(zp,X) at FF folds byte 0100 into the high byte") {
        bus.write_byte(0xFF, 0x34);
        bus.write_byte(0x00, 0x12);
        bus.write_byte(0x100, 0x40);
        place_operand(cpu, 0xFF);
        cpu.X = 0x00;
        REQUIRE(cpu.operand_address(AddrMode::IndirectX) == 0x5234);
    }
    SECTION("(zp),Y uses the operand bytes as the base") {
        bus.write_byte(0x86, 0x28);
        bus.write_byte(0x87, 0x40);
        place_operand(cpu, 0x86, 0x12);
        cpu.Y = 0x10;
        REQUIRE(cpu.operand_address(AddrMode::IndirectY) == 0x1296);
    }
    SECTION("(zp),Y still advances PC by one operand byte") {
        bus.write_byte(0x8000, 0xB1);
        bus.write_byte(0x8001, 0x00);
        bus.write_byte(0x8002, 0x03);
        bus.write_byte(0x0300, 0x5C);
        cpu.PC = 0x8000;
        cpu.Y = 0x00;
        cpu.step();
        REQUIRE(cpu.A == 0x5C);
        REQUIRE(cpu.PC == 0x8002);
    }
}

TEST_CASE("PC advances by the operand width", "[addressing]") {
    // LDA #, LDA zp, LDA abs, TAX, LDA (zp,X), STA abs,Y, BRK
    CPU cpu = prepared({0xA9, 0x01, 0xA5, 0x10, 0xAD, 0x00, 0x02, 0xAA,
                        0xA1, 0x10, 0x99, 0x00, 0x03, 0x00});
    const uint16_t expected[] = {0x8002, 0x8004, 0x8007, 0x8008, 0x800A, 0x800D};
    for (uint16_t pc : expected) {
        REQUIRE(cpu.step());
        REQUIRE(cpu.PC == pc);
    }
    REQUIRE_FALSE(cpu.step());
    REQUIRE(cpu.PC == 0x800E);
}
