#include "utils/utf.hpp"
#include <cstdint>

namespace bondcpp::utils {

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool is_valid_utf8(std::string_view data) {
    const auto* s = reinterpret_cast<const unsigned char*>(data.data());
    size_t len = data.size();
    size_t pos = 0;
    while (pos < len) {
        unsigned char c = s[pos];
        if (c < 0x80) { pos++; continue; }
        if ((c & 0xE0) == 0xC0) {
            if (pos + 1 >= len || (s[pos + 1] & 0xC0) != 0x80 || c < 0xC2) return false;
            pos += 2;
        } else if ((c & 0xF0) == 0xE0) {
            if (pos + 2 >= len || (s[pos + 1] & 0xC0) != 0x80 || (s[pos + 2] & 0xC0) != 0x80) return false;
            uint32_t cp = ((c & 0x0F) << 12) | ((s[pos + 1] & 0x3F) << 6) | (s[pos + 2] & 0x3F);
            if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
            pos += 3;
        } else if ((c & 0xF8) == 0xF0) {
            if (pos + 3 >= len || (s[pos + 1] & 0xC0) != 0x80 || (s[pos + 2] & 0xC0) != 0x80 || (s[pos + 3] & 0xC0) != 0x80) return false;
            uint32_t cp = ((c & 0x07) << 18) | ((s[pos + 1] & 0x3F) << 12) | ((s[pos + 2] & 0x3F) << 6) | (s[pos + 3] & 0x3F);
            if (cp < 0x10000 || cp > 0x10FFFF) return false;
            pos += 4;
        } else {
            return false;
        }
    }
    return true;
}

std::optional<std::string> utf16_to_utf8(std::span<const std::byte> data) {
    if (data.size() % 2 != 0) {
        return std::nullopt;
    }

    bool big_endian = false;
    size_t pos = 0;
    auto unit_at = [&](size_t i) -> uint16_t {
        auto b0 = static_cast<uint16_t>(data[i]);
        auto b1 = static_cast<uint16_t>(data[i + 1]);
        return big_endian ? static_cast<uint16_t>((b0 << 8) | b1)
                          : static_cast<uint16_t>((b1 << 8) | b0);
    };

    if (data.size() >= 2) {
        if (data[0] == std::byte{0xFF} && data[1] == std::byte{0xFE}) {
            pos = 2;
        } else if (data[0] == std::byte{0xFE} && data[1] == std::byte{0xFF}) {
            big_endian = true;
            pos = 2;
        }
    }

    std::string out;
    out.reserve(data.size() / 2);
    while (pos < data.size()) {
        uint32_t unit = unit_at(pos);
        pos += 2;
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (pos >= data.size()) {
                return std::nullopt; // missing trailing surrogate
            }
            uint32_t low = unit_at(pos);
            if (low < 0xDC00 || low > 0xDFFF) {
                return std::nullopt;
            }
            pos += 2;
            append_utf8(out, 0x10000 + (((unit - 0xD800) << 10) | (low - 0xDC00)));
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            return std::nullopt; // dangling trailing surrogate
        } else {
            append_utf8(out, unit);
        }
    }
    return out;
}

} // namespace bondcpp::utils
