#include "rom_file.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

const char* rom_read_message(RomReadStatus s) {
    switch (s) {
        case RomReadStatus::Ok:         return "ok";
        case RomReadStatus::NotFound:   return "no such file";
        case RomReadStatus::NotAFile:   return "not a regular file";
        case RomReadStatus::Unreadable: return "cannot read";
    }
    return "?";
}

RomReadStatus read_rom_file(const std::string& path, std::vector<uint8_t>& out) {
    std::error_code ec;
    const fs::file_status st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) return RomReadStatus::NotFound;
    if (ec) return RomReadStatus::Unreadable;
    if (!fs::is_regular_file(st)) return RomReadStatus::NotAFile;

    std::ifstream f(path, std::ios::binary);
    if (!f) return RomReadStatus::Unreadable;
    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) return RomReadStatus::Unreadable;
    out.swap(buf);
    return RomReadStatus::Ok;
}

bool has_rom_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".ch8" || ext == ".chip8";
}
