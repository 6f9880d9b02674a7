// include/cli_args.hpp
#pragma once
#include <cstdint>
#include <string>

// Whole unsigned number in lo..hi. std::invalid_argument for anything that
// is not one (signs, blanks, trailing junk), std::out_of_range outside lo..hi.
uint32_t parse_u32(const std::string& text, uint32_t lo, uint32_t hi, int base = 10);
