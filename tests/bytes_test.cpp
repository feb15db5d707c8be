#include <gtest/gtest.h>

#include <array>
#include <cstdint>

#include "tabhash/bytes.hpp"

namespace {

TEST(ByteChunks, SplitsKey32LeastSignificantFirst) {
    const auto c = tabhash::byte_chunks<std::uint32_t>(0x04020100u);
    const std::array<std::uint8_t, 4> expected{ 0x00, 0x01, 0x02, 0x04 };
    EXPECT_EQ(c, expected);
}

TEST(ByteChunks, SplitsKey64LeastSignificantFirst) {
    const auto c = tabhash::byte_chunks<std::uint64_t>(0x8877665544332211ull);
    const std::array<std::uint8_t, 8> expected{ 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88 };
    EXPECT_EQ(c, expected);
}

TEST(ByteChunks, ExtremeValues) {
    EXPECT_EQ(tabhash::byte_chunks<std::uint32_t>(0u), (std::array<std::uint8_t, 4>{}));
    const auto ones = tabhash::byte_chunks<std::uint64_t>(~0ull);
    for (auto b : ones) EXPECT_EQ(b, 0xFF);
}

TEST(ByteChunks, ReassemblesToKey) {
    const std::uint64_t key = 0x0123456789ABCDEFull;
    const auto c = tabhash::byte_chunks(key);
    std::uint64_t back = 0;
    for (std::size_t i = 0; i < c.size(); ++i) back |= std::uint64_t(c[i]) << (8 * i);
    EXPECT_EQ(back, key);
}

} // namespace
