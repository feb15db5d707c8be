#include <gtest/gtest.h>

#include <cstdint>
#include <random>

#include "tabhash/simpletab.hpp"
#include "reference_tab.hpp"

namespace {

TEST(SimpleTab32, FoldsOneCellPerByte) {
    tabhash::SimpleTab32::Table t{};
    t[0][0x00] = 7;
    t[1][0x01] = 11;
    t[2][0x02] = 13;
    t[3][0x04] = 17;
    const tabhash::SimpleTab32 h(t);
    EXPECT_EQ(h.hash(0b00000100'00000010'00000001'00000000u), 16u);
}

TEST(SimpleTab32, ZeroTableHashesToZero) {
    const tabhash::SimpleTab32 h(tabhash::SimpleTab32::Table{});
    EXPECT_EQ(h.hash(0u), 0u);
    EXPECT_EQ(h.hash(0xDEADBEEFu), 0u);
}

TEST(SimpleTab32, MatchesReference) {
    std::mt19937_64 gen(0x5EED0001);
    for (int rep = 0; rep < 100; ++rep) {
        const tabhash::SimpleTab32 h(gen);
        std::uint32_t H[4][256];
        for (int i = 0; i < 4; ++i)
            for (int j = 0; j < 256; ++j) H[i][j] = h.table()[i][j];

        for (int k = 0; k < 100; ++k) {
            const std::uint32_t key = rng::draw<std::uint32_t>(gen);
            ASSERT_EQ(h.hash(key), reference::SimpleTab32(key, H)) << "key=" << key;
        }
    }
}

TEST(SimpleTab64, FoldsOneCellPerByte) {
    tabhash::SimpleTab64::Table t{};
    for (std::size_t i = 0; i < 8; ++i) t[i][i + 1] = std::uint64_t(1) << (8 * i);
    const tabhash::SimpleTab64 h(t);
    EXPECT_EQ(h.hash(0x0807060504030201ull), 0x0101010101010101ull);
    // Byte 0 selects row 0x00 in column 0, which is zero.
    EXPECT_EQ(h.hash(0x0807060504030200ull), 0x0101010101010100ull);
}

TEST(SimpleTab64, MatchesReference) {
    std::mt19937_64 gen(0x5EED0002);
    for (int rep = 0; rep < 50; ++rep) {
        const tabhash::SimpleTab64 h(gen);
        std::uint64_t H[8][256];
        for (int i = 0; i < 8; ++i)
            for (int j = 0; j < 256; ++j) H[i][j] = h.table()[i][j];

        for (int k = 0; k < 100; ++k) {
            const std::uint64_t key = rng::draw<std::uint64_t>(gen);
            ASSERT_EQ(h.hash(key), reference::SimpleTab64(key, H)) << "key=" << key;
        }
    }
}

TEST(SimpleTab, Deterministic) {
    const tabhash::SimpleTab64 h;
    for (std::uint64_t k : { 0ull, 1ull, 0xFFull, 0x123456789ull, ~0ull }) {
        EXPECT_EQ(h.hash(k), h.hash(k));
    }
}

TEST(SimpleTab, SameSeedSameTable) {
    std::mt19937_64 a(42), b(42);
    const tabhash::SimpleTab32 ha(a), hb(b);
    EXPECT_EQ(ha, hb);
    EXPECT_EQ(ha.hash(0xCAFEu), hb.hash(0xCAFEu));
}

TEST(SimpleTab, CopyIsIndependentAndEqual) {
    const tabhash::SimpleTab32 h;
    tabhash::SimpleTab32 copy = h;
    EXPECT_EQ(copy, h);
    EXPECT_NE(&copy.table(), &h.table());
    for (std::uint32_t k = 0; k < 1000; ++k) EXPECT_EQ(copy.hash(k), h.hash(k));
}

TEST(SimpleTab, TableReadBackIsSuppliedTable) {
    std::mt19937_64 gen(7);
    const auto t = tabhash::random_table<std::uint64_t, 8>(gen);
    const tabhash::SimpleTab64 h(t);
    EXPECT_EQ(h.table(), t);
}

// Statistical smoke check: two independent tables agree on a key with probability 2^-32.
TEST(SimpleTab, IndependentTablesDisagree) {
    const tabhash::SimpleTab32 a, b;
    int agree = 0;
    for (std::uint32_t k = 0; k < 64; ++k) agree += (a.hash(k) == b.hash(k));
    EXPECT_LT(agree, 2);
}

} // namespace
