#ifndef BONDCPP_WIRE_HPP
#define BONDCPP_WIRE_HPP

#include <cstdint>
#include "types.hpp"

namespace bondcpp {

    class ByteSource;

    struct FieldHeader {
        uint16_t id;
        Type type;
    };

    struct ContainerHeader {
        Type element_type;
        uint64_t count;
    };

    // Type in the low 5 bits, id selector in the high 3. Selectors 0-5 are
    // the id itself, 6 means one id byte follows, 7 means two (little-endian).
    FieldHeader read_field_header(ByteSource& source);

    // Element type in the low 5 bits, count selector in the high 3. Selector 0
    // means a ULEB128 count follows, otherwise the count is selector - 1.
    ContainerHeader read_type_and_count(ByteSource& source);

} // namespace bondcpp

#endif // BONDCPP_WIRE_HPP
