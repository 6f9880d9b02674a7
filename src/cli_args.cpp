#include "cli_args.hpp"
#include <cctype>
#include <stdexcept>

uint32_t parse_u32(const std::string& text, uint32_t lo, uint32_t hi, int base) {
    const std::string range = std::to_string(lo) + ".." + std::to_string(hi);
    if (text.empty() || !std::isxdigit(static_cast<unsigned char>(text[0])))
        throw std::invalid_argument("'" + text + "' is not a number");

    size_t used = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(text, &used, base);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("'" + text + "' is not a number");
    } catch (const std::out_of_range&) {
        throw std::out_of_range("'" + text + "' is outside " + range);
    }
    if (used != text.size())
        throw std::invalid_argument("'" + text + "' is not a number");
    if (v < lo || v > hi)
        throw std::out_of_range("'" + text + "' is outside " + range);
    return static_cast<uint32_t>(v);
}
