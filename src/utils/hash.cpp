#include "utils/hash.hpp"

namespace bondcpp::utils {

    uint32_t djb2_hash(std::string_view key) {
        uint32_t hash = 5381;
        for (char c : key) {
            hash = ((hash << 5) + hash) + static_cast<unsigned char>(c); /* hash * 33 + c */
        }
        return hash;
    }

    size_t hash_combine(size_t seed, size_t value) {
        return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
    }

} // namespace bondcpp::utils
