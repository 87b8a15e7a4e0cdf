#ifndef BONDCPP_UTILS_HEX_HPP
#define BONDCPP_UTILS_HEX_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bondcpp::utils {

// Decodes a hex string into bytes. Whitespace between byte pairs is ignored.
// Throws bondcpp::exception if the input is not a valid hex string.
std::vector<std::byte> hex_decode(std::string_view hex_string);

} // namespace bondcpp::utils

#endif // BONDCPP_UTILS_HEX_HPP
