#pragma once
// Twisted tabulation (32-bit key -> 32-bit hash, 64-bit key -> 64-bit hash).
// Cells are twice the key width. The first C-1 key bytes are folded as in simple
// tabulation; the last lookup index is the last key byte XOR the low byte of the
// running hash, and the low key-width bits of the result are shifted out.

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
#include <type_traits>

#include "core/randomgen.hpp"
#include "core/uint128.hpp"
#include "tabhash/bytes.hpp"
#include "tabhash/table.hpp"

namespace tabhash {

    namespace detail {

        // Accumulator / cell type: double the key width.
        template <class Key> struct wide;
        template <> struct wide<std::uint32_t> { using type = std::uint64_t; };
        template <> struct wide<std::uint64_t> { using type = u128::uint128_t; };

    } // namespace detail

    template <class Key>
    class TwistedTab {
        static_assert(is_key_v<Key>, "TwistedTab: key must be uint32_t or uint64_t");

    public:
        using key_type = Key;
        using cell_type = typename detail::wide<Key>::type;
        static constexpr std::size_t COLS = chunk_count_v<Key>;
        static constexpr unsigned KEY_BITS = 8 * sizeof(Key);
        using Table = tabhash::Table<cell_type, COLS>;

        TwistedTab() : TwistedTab(rng::default_engine()) {}

        template <std::uniform_random_bit_generator URBG>
        explicit TwistedTab(URBG& gen) : T_(random_table<cell_type, COLS>(gen)) {}

        explicit TwistedTab(const Table& t) : T_(t) {}

        static TwistedTab decode(const Encoded<cell_type>& enc) {
            return TwistedTab(decode_table<cell_type, COLS>(enc));
        }

        TABHASH_FORCEINLINE Key hash(Key x) const {
            cell_type h = 0;
            const auto c = byte_chunks(x);

            // Fold all but the most-significant byte
            for (std::size_t i = 0; i + 1 < COLS; ++i) {
                h ^= T_[i][c[i]];
            }

            // Last index depends on the hash so far
            const std::uint8_t d = c[COLS - 1] ^ static_cast<std::uint8_t>(h);
            h ^= T_[COLS - 1][d];

            return static_cast<Key>(h >> KEY_BITS);
        }

        const Table& table() const { return T_; }
        Encoded<cell_type> encode_table() const { return tabhash::encode_table(T_); }

        friend bool operator==(const TwistedTab& a, const TwistedTab& b) { return a.T_ == b.T_; }

    private:
        Table T_;
    };

    using TwistedTab32 = TwistedTab<std::uint32_t>;
    using TwistedTab64 = TwistedTab<std::uint64_t>;

} // namespace tabhash
