#ifndef BONDCPP_VARINT_HPP
#define BONDCPP_VARINT_HPP

#include <cstdint>

namespace bondcpp {

    class ByteSource;

    // ULEB128. Groups beyond the 64th bit are dropped, so over-long
    // encodings wrap instead of failing.
    uint64_t decode_uleb128(ByteSource& source);

    // Zig-zag decoded ULEB128: 0, 1, 2, 3, 4 -> 0, -1, 1, -2, 2.
    int64_t decode_sleb128(ByteSource& source);

    inline int64_t zigzag_decode(uint64_t u) {
        return static_cast<int64_t>((u >> 1) ^ (~(u & 1) + 1));
    }

} // namespace bondcpp

#endif // BONDCPP_VARINT_HPP
