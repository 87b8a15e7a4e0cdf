#include "varint.hpp"
#include "byte_source.hpp"

namespace bondcpp {

    uint64_t decode_uleb128(ByteSource& source) {
        uint64_t result = 0;
        unsigned shift = 0;
        uint8_t b;
        do {
            b = source.read_u8();
            if (shift < 64) {
                result |= static_cast<uint64_t>(b & 0x7F) << shift;
            }
            shift += 7;
        } while (b & 0x80);
        return result;
    }

    int64_t decode_sleb128(ByteSource& source) {
        return zigzag_decode(decode_uleb128(source));
    }

} // namespace bondcpp
