// include/rom_file.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class RomReadStatus { Ok, NotFound, NotAFile, Unreadable };

const char* rom_read_message(RomReadStatus s);

// Read a whole ROM image. `out` is only replaced on Ok.
RomReadStatus read_rom_file(const std::string& path, std::vector<uint8_t>& out);

// .ch8 or .chip8, any case
bool has_rom_extension(const std::string& path);
