#pragma once
// 128-bit unsigned cells (Twisted-64 tables) and their hex text form.
// Text form: "0x" + 32 lowercase hex digits, most-significant digit first.

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

#if !defined(__SIZEOF_INT128__)
#error "128-bit integers (unsigned __int128) not supported on this platform/compiler"
#endif

namespace u128 {

    using uint128_t = unsigned __int128;

    inline constexpr uint128_t make(std::uint64_t hi, std::uint64_t lo) {
        return (static_cast<uint128_t>(hi) << 64) | lo;
    }

    inline constexpr std::uint64_t high64(uint128_t x) { return static_cast<std::uint64_t>(x >> 64); }
    inline constexpr std::uint64_t low64(uint128_t x) { return static_cast<std::uint64_t>(x); }

    inline std::string to_hex(uint128_t x) {
        static constexpr char digits[] = "0123456789abcdef";
        std::string s(34, '0');
        s[1] = 'x';
        for (std::size_t i = 33; i >= 2; --i, x >>= 4) {
            s[i] = digits[static_cast<unsigned>(x & 0xF)];
        }
        return s;
    }

    // Parse 1..32 hex digits with an optional 0x/0X prefix; returns false on bad input.
    inline bool from_hex(std::string_view hex, uint128_t& out) {
        auto hexval = [](char c)->int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
            if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
            return -1;
            };
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex.remove_prefix(2);
        if (hex.empty() || hex.size() > 32) return false;
        uint128_t v = 0;
        for (char c : hex) {
            const int d = hexval(c);
            if (d < 0) return false;
            v = (v << 4) | static_cast<uint128_t>(d);
        }
        out = v;
        return true;
    }

} // namespace u128
