#include "reader.hpp"
#include "json.hpp"
#include "../test/bond_writer.hpp"
#include <iostream>
#include <chrono>
#include <vector>

using bondcpp::Type;
using bondcpp::testing::BondWriter;

static BondWriter make_flat_struct(int fields) {
    BondWriter w;
    w.begin_struct();
    for (int i = 0; i < fields; ++i) {
        w.field(Type::Int64, static_cast<uint16_t>(i)).sleb(-i * 1000);
    }
    w.stop();
    return w;
}

static BondWriter make_string_list(int count) {
    BondWriter w;
    w.begin_struct();
    w.field(Type::List, 1).type_and_count(Type::String, count);
    for (int i = 0; i < count; ++i) {
        w.str("value" + std::to_string(i));
    }
    w.stop();
    return w;
}

static BondWriter make_nested(int depth) {
    BondWriter w;
    w.begin_struct();
    for (int i = 0; i < depth; ++i) {
        w.field(Type::Struct, 1).begin_struct();
        w.field(Type::Uint32, 2).uleb(i);
    }
    for (int i = 0; i <= depth; ++i) {
        w.stop();
    }
    return w;
}

void benchmark_decode(const char* name, const BondWriter& w, int iterations) {
    auto start = std::chrono::high_resolution_clock::now();
    size_t total = 0;
    for (int i = 0; i < iterations; ++i) {
        bondcpp::Value root = bondcpp::decode_base_struct(w.data());
        total += root.children().size();
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << name << ": " << diff.count() << " s (" << total << " nodes)" << std::endl;
}

void benchmark_to_json(const BondWriter& w, int iterations) {
    bondcpp::Value root = bondcpp::decode_base_struct(w.data());
    auto start = std::chrono::high_resolution_clock::now();
    size_t total = 0;
    for (int i = 0; i < iterations; ++i) {
        total += bondcpp::bond_json::to_json_string(root).size();
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_to_json: " << diff.count() << " s (" << total << " bytes)" << std::endl;
}

int main() {
    benchmark_decode("benchmark_flat_struct", make_flat_struct(1000), 1000);
    benchmark_decode("benchmark_string_list", make_string_list(10000), 100);
    benchmark_decode("benchmark_nested", make_nested(200), 1000);
    benchmark_to_json(make_string_list(10000), 100);
    return 0;
}
