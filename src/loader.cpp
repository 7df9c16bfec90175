// src/loader.cpp
#include "loader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

static bool is_hex(char c) {
    return (c>='0'&&c<='9')||(c>='a'&&c<='f')||(c>='A'&&c<='F');
}

// strip comment markers: # ... ; ... // ...
static void strip_comment(std::string& line) {
    auto cut = line.find_first_of("#;");
    if (cut != std::string::npos) line.resize(cut);
    cut = line.find("//");
    if (cut != std::string::npos) line.resize(cut);
}

// Parses one byte token; prints a diagnostic under tag on failure.
static bool parse_byte_token(std::string tok, size_t lineno, const char* tag, std::vector<uint8_t>& out) {
    // remove commas/underscores
    tok.erase(std::remove(tok.begin(), tok.end(), ','), tok.end());
    tok.erase(std::remove(tok.begin(), tok.end(), '_'), tok.end());
    // allow 0x prefix
    if (tok.size() > 2 && (tok[0]=='0') && (tok[1]=='x' || tok[1]=='X')) {
        tok = tok.substr(2);
    }
    if (tok.empty()) return true;

    if (!std::all_of(tok.begin(), tok.end(), is_hex)) {
        std::cerr << "[" << tag << "] non-hex token '" << tok
                  << "' at line " << lineno << "\n";
        return false;
    }
    if (tok.size() > 2) {
        std::cerr << "[" << tag << "] byte out of range '" << tok
                  << "' at line " << lineno << "\n";
        return false;
    }
    out.push_back(static_cast<uint8_t>(std::stoul(tok, nullptr, 16)));
    return true;
}


bool read_binary(std::istream& in, const std::string& name, std::vector<uint8_t>& out) {
    in.seekg(0, std::ios::end);
    std::streamsize n = in.tellg();
    if(n < 0) {
        std::cerr << "[loadbin] cannot determine size of '" << name << "'\n";
        return false;
    }
    in.seekg(0, std::ios::beg);
    out.resize((size_t)n);
    if(n > 0) in.read(reinterpret_cast<char*>(out.data()), n);
    if(!in) {
        std::cerr << "[loadbin] short read from '" << name << "' (" << in.gcount() << " of " << n << " bytes)\n";
        return false;
    }
    return true;
}

bool read_file_binary(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if(!f) {
        std::cerr << "[loadbin] cannot open '" << path << "'\n";
        return false;
    }
    return read_binary(f, path, out);
}

bool parse_hexbytes(std::istream& in, std::vector<uint8_t>& out) {
    out.clear();
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        strip_comment(line);
        std::istringstream iss(line);
        std::string tok;
        while (iss >> tok) {
            if (!parse_byte_token(tok, lineno, "loadhex", out)) return false;
        }
    }
    if (out.empty()) {
        std::cerr << "[loadhex] no bytes read\n";
        return false;
    }
    return true;
}

bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path);
    if(!f) {
        std::cerr << "[loadhex] cannot open '" << path << "'\n";
        return false;
    }
    return parse_hexbytes(f, out);
}

bool parse_hexdump(std::istream& in, HexImage& out) {
    out = HexImage{};
    bool have_origin = false;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        strip_comment(line);
        if (std::all_of(line.begin(), line.end(), [](unsigned char c){ return std::isspace(c); })) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            std::cerr << "[loaddump] missing ':' after address at line " << lineno << "\n";
            return false;
        }
        std::string saddr = line.substr(0, colon);
        saddr.erase(std::remove_if(saddr.begin(), saddr.end(), [](unsigned char c){ return std::isspace(c); }),
                    saddr.end());
        if (!saddr.empty() && saddr[0] == '$') saddr = saddr.substr(1);
        if (saddr.empty() || saddr.size() > 4 || !std::all_of(saddr.begin(), saddr.end(), is_hex)) {
            std::cerr << "[loaddump] bad address '" << saddr << "' at line " << lineno << "\n";
            return false;
        }
        const uint32_t addr = static_cast<uint32_t>(std::stoul(saddr, nullptr, 16));

        if (!have_origin) {
            out.origin = static_cast<uint16_t>(addr);
            have_origin = true;
        }
        const uint32_t expected = uint32_t(out.origin) + uint32_t(out.bytes.size());
        if (addr != expected) {
            std::ostringstream msg;
            msg << "line " << lineno << " starts at " << std::hex << std::setfill('0')
                << std::setw(4) << addr << ", expected " << std::setw(4) << expected;
            std::cerr << "[loaddump] " << msg.str() << " (dump must be contiguous)\n";
            return false;
        }

        std::istringstream iss(line.substr(colon + 1));
        std::string tok;
        while (iss >> tok) {
            if (!parse_byte_token(tok, lineno, "loaddump", out.bytes)) return false;
        }
        if (uint32_t(out.origin) + out.bytes.size() > 0x10000) {
            std::cerr << "[loaddump] image runs past FFFF at line " << lineno << "\n";
            return false;
        }
    }
    if (out.bytes.empty()) {
        std::cerr << "[loaddump] no bytes read\n";
        return false;
    }
    return true;
}

bool parse_hexdump(const std::string& text, HexImage& out) {
    std::istringstream iss(text);
    return parse_hexdump(iss, out);
}

bool read_file_hexdump(const std::string& path, HexImage& out) {
    std::ifstream f(path);
    if(!f) {
        std::cerr << "[loaddump] cannot open '" << path << "'\n";
        return false;
    }
    return parse_hexdump(f, out);
}
