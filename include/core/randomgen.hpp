/*
 * This file is based on https://github.com/kipoujr/no_repetition/blob/main/src/framework/randomgen.h
 *
 */


#pragma once
#ifndef RNG_DEFAULT_SEED_DIR
// Define the default seed directory if not defined by build system
#define RNG_DEFAULT_SEED_DIR "./seed"
#endif
#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <mutex>
#include <random>
#include <stdexcept>
#include <fstream>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <type_traits>

#include "core/uint128.hpp"


namespace rng {

    // Byte pool loaded from *.bin seed files, usable as a uniform random bit generator.
    // Draws walk the pool front to back and wrap around at the end, so two pools
    // built from the same files produce the same sequence.
    class SeedPool {
    public:
        using result_type = std::uint64_t;

        explicit SeedPool(const std::filesystem::path& dir = RNG_DEFAULT_SEED_DIR) {
            if (!std::filesystem::exists(dir)) {
                throw std::runtime_error("SeedPool: seed dir not found: " + dir.string());
            }

            std::vector<std::filesystem::path> files;
            for (const auto& e : std::filesystem::directory_iterator(dir)) {
                if (e.is_regular_file() && e.path().extension() == ".bin") files.push_back(e.path());
            }
            std::sort(files.begin(), files.end());
            if (files.empty()) {
                throw std::runtime_error("SeedPool: no .bin files in " + dir.string());
            }

            std::vector<std::uint8_t> tmp;
            for (const auto& p : files) {
                std::ifstream in(p, std::ios::binary);
                if (!in) throw std::runtime_error("SeedPool: cannot open " + p.string());
                in.seekg(0, std::ios::end);
                const std::streamsize sz = in.tellg();
                in.seekg(0, std::ios::beg);
                if (sz <= 0) continue;
                const std::size_t off = tmp.size();
                tmp.resize(off + static_cast<std::size_t>(sz));
                if (!in.read(reinterpret_cast<char*>(tmp.data() + off), sz)) {
                    throw std::runtime_error("SeedPool: short read from " + p.string());
                }
            }
            if (tmp.empty()) throw std::runtime_error("SeedPool: total bytes read = 0");
            bytes_.swap(tmp);
        }

        explicit SeedPool(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {
            if (bytes_.empty()) throw std::runtime_error("SeedPool: empty byte pool");
        }

        SeedPool(const SeedPool&) = delete;
        SeedPool& operator=(const SeedPool&) = delete;

        static constexpr result_type min() { return 0; }
        static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

        // Next 8 pool bytes, first byte most significant.
        result_type operator()() {
            std::scoped_lock lk(mu_);
            std::uint64_t a = 0;
            for (int i = 0; i < 8; ++i) { a = (a << 8) | bytes_[pos_]; advance(1); }
            return a;
        }

        std::size_t size() const { return bytes_.size(); }

    private:
        void advance(std::size_t n) { pos_ += n; if (pos_ >= bytes_.size()) pos_ %= bytes_.size(); }

        mutable std::mutex mu_;
        std::vector<std::uint8_t> bytes_;
        std::size_t pos_{ 0 };
    };

    // Per-thread engine seeded from the host's random_device on first use.
    inline std::mt19937_64& default_engine() {
        thread_local std::mt19937_64 eng = [] {
            std::random_device rd;
            std::seed_seq seq{ rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd() };
            return std::mt19937_64(seq);
            }();
        return eng;
    }

    // True when gen() covers exactly [0, 2^Bits - 1].
    template <class URBG, unsigned Bits>
    inline constexpr bool full_range_v =
        URBG::min() == 0 && std::uint64_t(URBG::max()) == (~0ull >> (64 - Bits));

    // One uniformly distributed value of type T (32, 64 or 128 bits) from any URBG.
    // Full 32/64-bit generators (mt19937, mt19937_64, SeedPool) are read bit for bit,
    // high word first, so a seeded source gives the same tables on every standard library.
    template <class T, class URBG>
    inline T draw(URBG& gen) {
        if constexpr (std::is_same_v<T, u128::uint128_t>) {
            const std::uint64_t hi = draw<std::uint64_t>(gen);
            const std::uint64_t lo = draw<std::uint64_t>(gen);
            return u128::make(hi, lo);
        }
        else {
            static_assert(std::is_same_v<T, std::uint32_t> || std::is_same_v<T, std::uint64_t>,
                "rng::draw: T must be uint32_t, uint64_t or uint128_t");
            if constexpr (full_range_v<URBG, 64>) {
                const std::uint64_t x = gen();
                if constexpr (std::is_same_v<T, std::uint32_t>) return static_cast<std::uint32_t>(x >> 32);
                else return x;
            }
            else if constexpr (full_range_v<URBG, 32>) {
                if constexpr (std::is_same_v<T, std::uint32_t>) return static_cast<std::uint32_t>(gen());
                else {
                    const std::uint64_t hi = static_cast<std::uint32_t>(gen());
                    const std::uint64_t lo = static_cast<std::uint32_t>(gen());
                    return (hi << 32) | lo;
                }
            }
            else {
                std::uniform_int_distribution<T> dist;
                return dist(gen);
            }
        }
    }

    // Convenience wrappers over the per-thread engine
    inline std::uint32_t get_u32() { return draw<std::uint32_t>(default_engine()); }
    inline std::uint64_t get_u64() { return draw<std::uint64_t>(default_engine()); }


} // namespace rng
