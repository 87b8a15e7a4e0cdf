#include "byte_source.hpp"
#include "exception.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using bondcpp::MemorySource;
using bondcpp::StreamSource;

static std::vector<std::byte> bytes_of(std::initializer_list<uint8_t> bs) {
    std::vector<std::byte> out;
    for (uint8_t b : bs) out.push_back(static_cast<std::byte>(b));
    return out;
}

TEST(MemorySourceTest, ReadAndSkip) {
    MemorySource src(bytes_of({1, 2, 3, 4, 5}));
    ASSERT_EQ(src.read_u8(), 1);
    src.skip(2);
    ASSERT_EQ(src.position(), 3u);
    std::byte out[2];
    src.read(out, 2);
    ASSERT_EQ(out[0], std::byte{4});
    ASSERT_EQ(out[1], std::byte{5});
    ASSERT_EQ(src.remaining(), 0u);
}

TEST(MemorySourceTest, ShortReadThrowsWithoutConsuming) {
    MemorySource src(bytes_of({1, 2}));
    std::byte out[3];
    try {
        src.read(out, 3);
        FAIL() << "expected TruncatedInputError";
    } catch (const bondcpp::TruncatedInputError& e) {
        ASSERT_EQ(e.requested(), 3u);
        ASSERT_EQ(e.available(), 2u);
    }
    ASSERT_EQ(src.position(), 0u);
}

TEST(MemorySourceTest, SkipPastEndThrows) {
    MemorySource src(bytes_of({1, 2}));
    ASSERT_THROW(src.skip(3), bondcpp::TruncatedInputError);
    src.skip(2);
    ASSERT_EQ(src.remaining(), 0u);
}

TEST(MemorySourceTest, NonOwningView) {
    std::vector<std::byte> data = bytes_of({9, 8});
    MemorySource src{std::span<const std::byte>(data)};
    ASSERT_EQ(src.read_u8(), 9);
    ASSERT_EQ(src.read_u8(), 8);
    ASSERT_THROW(src.read_u8(), bondcpp::TruncatedInputError);
}

TEST(StreamSourceTest, ReadAndSeekingSkip) {
    std::istringstream in(std::string("\x01\x02\x03\x04\x05", 5));
    StreamSource src(in);
    ASSERT_EQ(src.read_u8(), 1);
    src.skip(3);
    ASSERT_EQ(src.position(), 4u);
    ASSERT_EQ(src.read_u8(), 5);
    ASSERT_THROW(src.read_u8(), bondcpp::TruncatedInputError);
}

TEST(StreamSourceTest, SkipPastEndThrows) {
    std::istringstream in(std::string("\x01\x02", 2));
    StreamSource src(in);
    ASSERT_THROW(src.skip(5), bondcpp::TruncatedInputError);
}

TEST(StreamSourceTest, ShortRead) {
    std::istringstream in(std::string("\x01", 1));
    StreamSource src(in);
    std::byte out[4];
    ASSERT_THROW(src.read(out, 4), bondcpp::TruncatedInputError);
}
