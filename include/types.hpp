#ifndef BONDCPP_TYPES_HPP
#define BONDCPP_TYPES_HPP

#include <cstdint>
#include <string_view>

namespace bondcpp {

    // Wire type codes of the Compact Binary format.
    enum class Type : uint8_t {
        Stop = 0,
        StopBase = 1,
        Bool = 2,
        Uint8 = 3,
        Uint16 = 4,
        Uint32 = 5,
        Uint64 = 6,
        Float = 7,
        Double = 8,
        String = 9,
        Struct = 10,
        List = 11,
        Set = 12,
        Map = 13,
        Int8 = 14,
        Int16 = 15,
        Int32 = 16,
        Int64 = 17,
        Wstring = 18,
        Unavailable = 127
    };

    // Maps the low 5 bits of a tag byte to a Type.
    // Throws UnrecognizedTypeTagError for codes outside the catalogue.
    Type type_from_wire(uint8_t tag_byte);

    std::string_view type_name(Type type);

    bool is_signed_integer(Type type);
    bool is_unsigned_integer(Type type);
    // Stop, StopBase and Unavailable carry no payload bytes on the wire.
    bool occupies_no_bytes(Type type);

} // namespace bondcpp

#endif // BONDCPP_TYPES_HPP
