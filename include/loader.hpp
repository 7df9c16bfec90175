// include/loader.hpp
#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

// Contiguous image parsed from an address-prefixed dump
struct HexImage {
    uint16_t origin{0};
    std::vector<uint8_t> bytes;
};

// All loaders report failures on std::cerr with a [tag] prefix and return false.

// Whole stream as raw bytes; the stream must report its size through seekg/tellg.
// name only labels diagnostics.
bool read_binary(std::istream& in, const std::string& name, std::vector<uint8_t>& out);
bool read_file_binary(const std::string& path, std::vector<uint8_t>& out);

// Hex bytes separated by spaces/newlines, e.g.:
//   A9 81 8D 00 02   ; comment
bool parse_hexbytes(std::istream& in, std::vector<uint8_t>& out);
bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out);

// Address-prefixed dump, e.g.:
//   8000: a9 81 8d 00 02
//   8005: 6d 00 02 00
// The first address is the origin; every later line must continue where the previous one ended.
bool parse_hexdump(std::istream& in, HexImage& out);
bool parse_hexdump(const std::string& text, HexImage& out);
bool read_file_hexdump(const std::string& path, HexImage& out);
