#include "value.hpp"
#include "exception.hpp"
#include "utils/hash.hpp"
#include <cstring>
#include <string>
#include <type_traits>

namespace bondcpp {

    namespace {
        // Payload alternative index each type must carry.
        size_t expected_index(Type type) {
            if (occupies_no_bytes(type)) {
                return 0;
            }
            if (is_signed_integer(type)) {
                return 1;
            }
            if (is_unsigned_integer(type)) {
                return 2;
            }
            switch (type) {
                case Type::Bool:
                    return 3;
                case Type::Float:
                    return 4;
                case Type::Double:
                    return 5;
                case Type::String:
                case Type::Wstring:
                    return 6;
                case Type::Struct:
                case Type::List:
                case Type::Set:
                    return 7;
                case Type::Map:
                    return 8;
                default:
                    return 0;
            }
        }

        template <typename T>
        const T& get_as(const Value::Payload& payload, Type type, const char* wanted) {
            const T* ptr = std::get_if<T>(&payload);
            if (!ptr) {
                throw TypeMismatchError(std::string("Value of type ") +
                                        std::string(type_name(type)) + " is not " + wanted);
            }
            return *ptr;
        }

        template <typename F>
        size_t bits_hash(F f) {
            if (f == F(0)) {
                f = F(0); // -0.0 == 0.0
            }
            uint64_t bits = 0;
            std::memcpy(&bits, &f, sizeof(f));
            return std::hash<uint64_t>{}(bits);
        }
    }

    void Map::insert_or_assign(Value key, Value value) {
        size_t key_hash = key.hash();
        size_t i = index_of(key, key_hash);
        if (i < m_entries.size()) {
            m_entries[i].second = std::move(value);
            return;
        }
        m_entries.emplace_back(std::move(key), std::move(value));
        m_key_hashes.push_back(key_hash);
    }

    const Value* Map::find(const Value& key) const {
        size_t i = index_of(key, key.hash());
        return i < m_entries.size() ? &m_entries[i].second : nullptr;
    }

    size_t Map::index_of(const Value& key, size_t key_hash) const {
        for (size_t i = 0; i < m_entries.size(); ++i) {
            if (m_key_hashes[i] == key_hash && m_entries[i].first == key) {
                return i;
            }
        }
        return m_entries.size();
    }

    bool Map::operator==(const Map& other) const {
        if (size() != other.size()) {
            return false;
        }
        for (size_t i = 0; i < m_entries.size(); ++i) {
            size_t j = other.index_of(m_entries[i].first, m_key_hashes[i]);
            if (j == other.size() || other.m_entries[j].second != m_entries[i].second) {
                return false;
            }
        }
        return true;
    }

    size_t Map::hash() const {
        // Summed so that entry order does not matter.
        size_t h = m_entries.size();
        for (size_t i = 0; i < m_entries.size(); ++i) {
            h += utils::hash_combine(m_key_hashes[i], m_entries[i].second.hash());
        }
        return h;
    }

    Value::Value() : m_id(0), m_type(Type::Unavailable) {}

    Value::Value(uint16_t id, Type type, Payload payload)
        : m_id(id), m_type(type), m_payload(std::move(payload)) {
        if (m_payload.index() != expected_index(type)) {
            throw TypeMismatchError(std::string("Payload does not match type ") +
                                    std::string(type_name(type)));
        }
    }

    const Sequence& Value::children() const {
        static const Sequence empty;
        if (m_type == Type::Struct || m_type == Type::List || m_type == Type::Set) {
            if (const Sequence* seq = std::get_if<Sequence>(&m_payload)) {
                return *seq;
            }
        }
        return empty;
    }

    const Value* Value::child_by_id(uint16_t id) const {
        for (const Value& child : children()) {
            if (child.id() == id) {
                return &child;
            }
        }
        return nullptr;
    }

    const Value& Value::traverse(std::span<const uint16_t> ids) const {
        const Value* current = this;
        for (uint16_t id : ids) {
            const Value* next = current->child_by_id(id);
            if (!next) {
                break;
            }
            current = next;
        }
        return *current;
    }

    const Value& Value::traverse(std::initializer_list<uint16_t> ids) const {
        return traverse(std::span<const uint16_t>(ids.begin(), ids.size()));
    }

    const Value& Value::value_at(size_t index) const {
        const Sequence& elements = children();
        if (index >= elements.size()) {
            throw IndexOutOfRangeError(index, elements.size());
        }
        return elements[index];
    }

    int64_t Value::as_int() const { return get_as<int64_t>(m_payload, m_type, "a signed integer"); }

    uint64_t Value::as_uint() const { return get_as<uint64_t>(m_payload, m_type, "an unsigned integer"); }

    bool Value::as_bool() const { return get_as<bool>(m_payload, m_type, "a bool"); }

    float Value::as_float() const { return get_as<float>(m_payload, m_type, "a float"); }

    double Value::as_double() const { return get_as<double>(m_payload, m_type, "a double"); }

    const std::string& Value::as_string() const {
        return get_as<std::string>(m_payload, m_type, "a string");
    }

    const Map& Value::as_map() const { return get_as<Map>(m_payload, m_type, "a map"); }

    bool Value::operator==(const Value& other) const {
        return m_id == other.m_id && m_type == other.m_type && m_payload == other.m_payload;
    }

    size_t Value::hash() const {
        size_t h = utils::hash_combine(std::hash<uint16_t>{}(m_id),
                                       std::hash<uint8_t>{}(static_cast<uint8_t>(m_type)));
        size_t payload_hash = std::visit([](const auto& p) -> size_t {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return 0;
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                return bits_hash(p);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return utils::djb2_hash(p);
            } else if constexpr (std::is_same_v<T, Sequence>) {
                size_t seq_hash = p.size();
                for (const Value& child : p) {
                    seq_hash = utils::hash_combine(seq_hash, child.hash());
                }
                return seq_hash;
            } else if constexpr (std::is_same_v<T, Map>) {
                return p.hash();
            } else {
                return std::hash<T>{}(p);
            }
        }, m_payload);
        return utils::hash_combine(h, payload_hash);
    }

} // namespace bondcpp
