#ifndef BONDCPP_TEST_BOND_WRITER_HPP
#define BONDCPP_TEST_BOND_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <string_view>
#include <vector>
#include "types.hpp"

namespace bondcpp::testing {

    // Builds Compact Binary bytes for tests. Not part of the library.
    class BondWriter {
    public:
        BondWriter& byte(uint8_t b) {
            m_data.push_back(static_cast<std::byte>(b));
            return *this;
        }

        BondWriter& bytes(std::initializer_list<uint8_t> bs) {
            for (uint8_t b : bs) byte(b);
            return *this;
        }

        BondWriter& uleb(uint64_t v) {
            do {
                uint8_t b = v & 0x7F;
                v >>= 7;
                if (v != 0) b |= 0x80;
                byte(b);
            } while (v != 0);
            return *this;
        }

        BondWriter& sleb(int64_t v) {
            return uleb((static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63));
        }

        BondWriter& field(Type type, uint16_t id) {
            uint8_t t = static_cast<uint8_t>(type);
            if (id <= 5) {
                byte(static_cast<uint8_t>((id << 5) | t));
            } else if (id <= 0xFF) {
                byte(static_cast<uint8_t>((6 << 5) | t)).byte(static_cast<uint8_t>(id));
            } else {
                byte(static_cast<uint8_t>((7 << 5) | t));
                byte(static_cast<uint8_t>(id & 0xFF)).byte(static_cast<uint8_t>(id >> 8));
            }
            return *this;
        }

        // Container header: inline count up to 6, ULEB128 beyond.
        BondWriter& type_and_count(Type element, uint64_t count) {
            uint8_t t = static_cast<uint8_t>(element);
            if (count < 7) {
                return byte(static_cast<uint8_t>(((count + 1) << 5) | t));
            }
            return byte(t).uleb(count);
        }

        BondWriter& str(std::string_view s) {
            uleb(s.size());
            for (char c : s) byte(static_cast<uint8_t>(c));
            return *this;
        }

        // UTF-16LE code units, count prefix in characters.
        BondWriter& wstr(std::u16string_view s) {
            uleb(s.size());
            for (char16_t c : s) {
                byte(static_cast<uint8_t>(c & 0xFF)).byte(static_cast<uint8_t>(c >> 8));
            }
            return *this;
        }

        BondWriter& f32(float f) {
            uint8_t raw[sizeof(f)];
            std::memcpy(raw, &f, sizeof(f));
            for (uint8_t b : raw) byte(b);
            return *this;
        }

        BondWriter& f64(double d) {
            uint8_t raw[sizeof(d)];
            std::memcpy(raw, &d, sizeof(d));
            for (uint8_t b : raw) byte(b);
            return *this;
        }

        // Struct length prefix; the value is informational to the reader.
        BondWriter& begin_struct(uint64_t length = 0) { return uleb(length); }
        BondWriter& stop() { return byte(static_cast<uint8_t>(Type::Stop)); }
        BondWriter& stop_base() { return byte(static_cast<uint8_t>(Type::StopBase)); }

        const std::vector<std::byte>& data() const { return m_data; }
        size_t size() const { return m_data.size(); }

    private:
        std::vector<std::byte> m_data;
    };

} // namespace bondcpp::testing

#endif // BONDCPP_TEST_BOND_WRITER_HPP
