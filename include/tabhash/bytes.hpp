#pragma once
// Byte decomposition of fixed-width keys.
// Chunk 0 is the least-significant byte; every hasher reads keys through here.

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
#include <cstddef>
#include <array>
#include <type_traits>

namespace tabhash {

    template <class Key>
    inline constexpr bool is_key_v =
        std::is_same_v<Key, std::uint32_t> || std::is_same_v<Key, std::uint64_t>;

    // Number of 8-bit chunks in a key.
    template <class Key>
    inline constexpr std::size_t chunk_count_v = sizeof(Key);

    // Split a 32- or 64-bit key into its bytes, little-endian chunk order.
    template <class Key>
    TABHASH_FORCEINLINE std::array<std::uint8_t, chunk_count_v<Key>> byte_chunks(Key x) {
        static_assert(is_key_v<Key>, "byte_chunks: key must be uint32_t or uint64_t");
        std::array<std::uint8_t, chunk_count_v<Key>> c{};
        for (std::size_t i = 0; i < c.size(); ++i, x >>= 8) {
            c[i] = static_cast<std::uint8_t>(x);
        }
        return c;
    }

} // namespace tabhash
