#ifndef BONDCPP_HASH_HPP
#define BONDCPP_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bondcpp::utils {

    uint32_t djb2_hash(std::string_view key);

    size_t hash_combine(size_t seed, size_t value);

} // namespace bondcpp::utils

#endif // BONDCPP_HASH_HPP
