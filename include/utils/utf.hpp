#ifndef BONDCPP_UTILS_UTF_HPP
#define BONDCPP_UTILS_UTF_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bondcpp::utils {

// Rejects overlong forms, surrogates, code points above U+10FFFF and
// truncated sequences.
bool is_valid_utf8(std::string_view data);

// Transcodes UTF-16 to UTF-8. Little-endian unless a leading byte-order mark
// says otherwise; the mark is dropped. Returns std::nullopt on an odd byte
// count or an unpaired surrogate.
std::optional<std::string> utf16_to_utf8(std::span<const std::byte> data);

} // namespace bondcpp::utils

#endif // BONDCPP_UTILS_UTF_HPP
