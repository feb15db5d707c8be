#pragma once
// Simple tabulation on 32- and 64-bit keys.
// Table: T[C][256] of key-width words (C = bytes per key); hash is XOR of C lookups,
// one per key byte.

// ---- force-inline macro (local, guarded) -----------------------------------
#ifndef TABHASH_FORCEINLINE
#if defined(_MSC_VER)
#define TABHASH_FORCEINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#define TABHASH_FORCEINLINE inline __attribute__((always_inline))
#else
#define TABHASH_FORCEINLINE inline
#endif
#endif
// ---------------------------------------------------------------------------

#include <cstdint>
#include <array>
#include <cstddef>
#include <random>

#include "core/randomgen.hpp"
#include "tabhash/bytes.hpp"
#include "tabhash/table.hpp"

namespace tabhash {

    template <class Key>
    class SimpleTab {
        static_assert(is_key_v<Key>, "SimpleTab: key must be uint32_t or uint64_t");

    public:
        using key_type = Key;
        using cell_type = Key;
        static constexpr std::size_t COLS = chunk_count_v<Key>;
        using Table = tabhash::Table<cell_type, COLS>;

        // Table drawn from the calling thread's default engine.
        SimpleTab() : SimpleTab(rng::default_engine()) {}

        template <std::uniform_random_bit_generator URBG>
        explicit SimpleTab(URBG& gen) : T_(random_table<cell_type, COLS>(gen)) {}

        explicit SimpleTab(const Table& t) : T_(t) {}

        static SimpleTab decode(const Encoded<cell_type>& enc) {
            return SimpleTab(decode_table<cell_type, COLS>(enc));
        }

        TABHASH_FORCEINLINE Key hash(Key x) const {
            Key h = 0;
            const auto c = byte_chunks(x);
            for (std::size_t i = 0; i < COLS; ++i) {
                h ^= T_[i][c[i]];
            }
            return h;
        }

        const Table& table() const { return T_; }
        Encoded<cell_type> encode_table() const { return tabhash::encode_table(T_); }

        friend bool operator==(const SimpleTab& a, const SimpleTab& b) { return a.T_ == b.T_; }

    private:
        Table T_;
    };

    using SimpleTab32 = SimpleTab<std::uint32_t>;
    using SimpleTab64 = SimpleTab<std::uint64_t>;

} // namespace tabhash
