#include "types.hpp"
#include "config.hpp"
#include "exception.hpp"

namespace bondcpp {

    Type type_from_wire(uint8_t tag_byte) {
        uint8_t code = tag_byte & config::type_mask;
        if (code > static_cast<uint8_t>(Type::Wstring)) {
            throw UnrecognizedTypeTagError(code);
        }
        return static_cast<Type>(code);
    }

    std::string_view type_name(Type type) {
        switch (type) {
            case Type::Stop:        return "Stop";
            case Type::StopBase:    return "StopBase";
            case Type::Bool:        return "Bool";
            case Type::Uint8:       return "Uint8";
            case Type::Uint16:      return "Uint16";
            case Type::Uint32:      return "Uint32";
            case Type::Uint64:      return "Uint64";
            case Type::Float:       return "Float";
            case Type::Double:      return "Double";
            case Type::String:      return "String";
            case Type::Struct:      return "Struct";
            case Type::List:        return "List";
            case Type::Set:         return "Set";
            case Type::Map:         return "Map";
            case Type::Int8:        return "Int8";
            case Type::Int16:       return "Int16";
            case Type::Int32:       return "Int32";
            case Type::Int64:       return "Int64";
            case Type::Wstring:     return "Wstring";
            case Type::Unavailable: return "Unavailable";
        }
        return "Invalid";
    }

    bool is_signed_integer(Type type) {
        return type == Type::Int8 || type == Type::Int16 ||
               type == Type::Int32 || type == Type::Int64;
    }

    bool is_unsigned_integer(Type type) {
        return type == Type::Uint8 || type == Type::Uint16 ||
               type == Type::Uint32 || type == Type::Uint64;
    }

    bool occupies_no_bytes(Type type) {
        return type == Type::Stop || type == Type::StopBase || type == Type::Unavailable;
    }

} // namespace bondcpp
