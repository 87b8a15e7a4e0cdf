#include "wire.hpp"
#include "byte_source.hpp"
#include "config.hpp"
#include "varint.hpp"

namespace bondcpp {

    FieldHeader read_field_header(ByteSource& source) {
        uint8_t tag = source.read_u8();
        FieldHeader header;
        header.type = type_from_wire(tag);
        uint8_t selector = tag >> config::selector_shift;
        if (selector <= config::inline_id_max) {
            header.id = selector;
        } else if (selector == config::id_in_next_byte) {
            header.id = source.read_u8();
        } else {
            uint8_t lo = source.read_u8();
            uint8_t hi = source.read_u8();
            header.id = static_cast<uint16_t>(lo | (hi << 8));
        }
        return header;
    }

    ContainerHeader read_type_and_count(ByteSource& source) {
        uint8_t tag = source.read_u8();
        ContainerHeader header;
        header.element_type = type_from_wire(tag);
        uint8_t selector = tag >> config::selector_shift;
        if (selector == config::count_follows) {
            header.count = decode_uleb128(source);
        } else {
            header.count = selector - 1u;
        }
        return header;
    }

} // namespace bondcpp
