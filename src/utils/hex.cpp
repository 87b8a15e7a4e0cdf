#include "utils/hex.hpp"
#include "exception.hpp"
#include <cctype>

namespace bondcpp::utils {

// Helper to convert a hex character to its integer value
static unsigned char hex_char_to_int(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw bondcpp::exception(std::string("Invalid hex character '") + c + "'");
}

std::vector<std::byte> hex_decode(std::string_view hex_string) {
    std::string digits;
    digits.reserve(hex_string.size());
    for (char c : hex_string) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    if (digits.length() % 2 != 0) {
        throw bondcpp::exception("Hex string length must be even.");
    }

    std::vector<std::byte> bytes;
    bytes.reserve(digits.length() / 2);

    for (size_t i = 0; i < digits.length(); i += 2) {
        unsigned char high_nibble = hex_char_to_int(digits[i]);
        unsigned char low_nibble = hex_char_to_int(digits[i+1]);
        bytes.push_back(static_cast<std::byte>((high_nibble << 4) | low_nibble));
    }
    return bytes;
}

} // namespace bondcpp::utils
