#ifndef BONDCPP_VALUE_HPP
#define BONDCPP_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "types.hpp"

namespace bondcpp {

    class Value;

    using Sequence = std::vector<Value>;

    // Map payload. Keys are full nodes, possibly composite, compared
    // structurally. Entries keep insertion order.
    class Map {
    public:
        using Entry = std::pair<Value, Value>;
        using const_iterator = std::vector<Entry>::const_iterator;

        // Replaces the value of an equal key in place, otherwise appends.
        void insert_or_assign(Value key, Value value);

        const Value* find(const Value& key) const;
        bool contains(const Value& key) const { return find(key) != nullptr; }

        size_t size() const { return m_entries.size(); }
        bool empty() const { return m_entries.empty(); }

        const_iterator begin() const { return m_entries.begin(); }
        const_iterator end() const { return m_entries.end(); }

        // Order-insensitive.
        bool operator==(const Map& other) const;
        bool operator!=(const Map& other) const { return !(*this == other); }

        size_t hash() const;

    private:
        std::vector<Entry> m_entries;
        std::vector<size_t> m_key_hashes;

        size_t index_of(const Value& key, size_t key_hash) const;
    };

    // A decoded node: field id, wire type and a payload whose shape follows
    // from the type.
    class Value {
    public:
        using Payload = std::variant<std::monostate, int64_t, uint64_t, bool, float,
                                     double, std::string, Sequence, Map>;

        Value();
        // Throws TypeMismatchError if payload does not fit type.
        Value(uint16_t id, Type type, Payload payload = {});

        uint16_t id() const { return m_id; }
        Type type() const { return m_type; }
        const Payload& payload() const { return m_payload; }

        // Children of a Struct, List or Set, otherwise empty.
        const Sequence& children() const;

        // First direct child with the given id, or nullptr.
        const Value* child_by_id(uint16_t id) const;

        // Follows child_by_id for each id. Stops at the first id that has no
        // match and returns the last node reached.
        const Value& traverse(std::span<const uint16_t> ids) const;
        const Value& traverse(std::initializer_list<uint16_t> ids) const;

        // Throws IndexOutOfRangeError if index >= children().size().
        const Value& value_at(size_t index) const;

        bool is_absent() const { return std::holds_alternative<std::monostate>(m_payload); }

        int64_t as_int() const;
        uint64_t as_uint() const;
        bool as_bool() const;
        float as_float() const;
        double as_double() const;
        const std::string& as_string() const;
        const Map& as_map() const;

        Sequence::const_iterator begin() const { return children().begin(); }
        Sequence::const_iterator end() const { return children().end(); }

        bool operator==(const Value& other) const;
        bool operator!=(const Value& other) const { return !(*this == other); }

        size_t hash() const;

    private:
        uint16_t m_id;
        Type m_type;
        Payload m_payload;
    };

} // namespace bondcpp

namespace std {
    template <> struct hash<bondcpp::Value> {
        size_t operator()(const bondcpp::Value& value) const { return value.hash(); }
    };
}

#endif // BONDCPP_VALUE_HPP
