#ifndef BONDCPP_JSON_HPP
#define BONDCPP_JSON_HPP

#include "value.hpp"
#include <string>

namespace bondcpp::bond_json {

    // Structs become objects keyed by field id, lists and sets arrays, maps
    // arrays of {"key", "value"} objects. Absent payloads and non-finite
    // floats render as null.
    std::string to_json_string(const Value& value, bool pretty = false);

} // namespace bondcpp::bond_json

#endif // BONDCPP_JSON_HPP
