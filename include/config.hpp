#ifndef BONDCPP_CONFIG_HPP
#define BONDCPP_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace bondcpp::config {
    constexpr size_t default_max_depth = 256;
    constexpr size_t max_reserve_elements = 1024; // cap on up-front reserve for declared counts
    constexpr size_t default_max_empty_elements = 65536;

    constexpr uint8_t type_mask = 0x1F;           // low 5 bits of a tag byte
    constexpr uint8_t selector_shift = 5;         // high 3 bits of a tag byte
    constexpr uint8_t inline_id_max = 5;
    constexpr uint8_t id_in_next_byte = 6;
    constexpr uint8_t id_in_next_two_bytes = 7;
    constexpr uint8_t count_follows = 0;
}

#endif // BONDCPP_CONFIG_HPP
