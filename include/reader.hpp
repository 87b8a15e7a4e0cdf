#ifndef BONDCPP_READER_HPP
#define BONDCPP_READER_HPP

#include <cstddef>
#include <istream>
#include <span>
#include "config.hpp"
#include "value.hpp"

namespace bondcpp {

    class ByteSource;

    enum class StringErrorPolicy {
        Propagate,  // throw StringDecodeError / WideStringDecodeError
        Substitute  // decode the field as an empty string and log a warning
    };

    struct DecodeOptions {
        // Deepest allowed nesting of structs, lists, sets and maps. 0 disables the check.
        size_t max_depth = config::default_max_depth;
        StringErrorPolicy string_errors = StringErrorPolicy::Propagate;
        // Compare each struct's declared length with the bytes its fields took.
        bool check_struct_length = false;
        // Largest count allowed for a list, set or map whose elements take no
        // bytes on the wire (Stop or StopBase). 0 disables the check.
        size_t max_empty_elements = config::default_max_empty_elements;
    };

    // Decodes a Compact Binary base struct. The result is the root node: id 0,
    // type Struct, one child per field in wire order.
    Value decode_base_struct(ByteSource& source, const DecodeOptions& options = {});
    Value decode_base_struct(std::span<const std::byte> data, const DecodeOptions& options = {});
    Value decode_base_struct(std::istream& in, const DecodeOptions& options = {});

} // namespace bondcpp

#endif // BONDCPP_READER_HPP
