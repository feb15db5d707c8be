// speed_tab.cpp
// Time to hash a batch of random keys with each tabulation family.
// Output CSV: function,rep,ns_per_key
//
// Families:
//   - SimpleTab32 / TwistedTab32 : 32-bit keys
//   - SimpleTab64 / TwistedTab64 : 64-bit keys
//
// Per repetition every hasher gets a fresh table, drawn from the thread's default
// engine, or from a seed pool when --seed-dir is given (reproducible tables).

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <memory>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <stdexcept>

#include "core/randomgen.hpp"
#include "core/timer.hpp"
#include "tabhash/simpletab.hpp"
#include "tabhash/twistedtab.hpp"

template <class H>
static H make_hasher(rng::SeedPool* pool) {
    return pool ? H(*pool) : H();
}

template <class H, class Key>
static double ns_per_key(const H& h, const std::vector<Key>& keys) {
    volatile Key sink = 0;
    std::uint64_t ns = 0;
    {
        ScopedTimer t(ns);
        Key acc = 0;
        for (Key k : keys) acc ^= h.hash(k);
        sink = acc;
    }
    (void)sink;
    return keys.empty() ? 0.0 : double(ns) / double(keys.size());
}

int main(int argc, char** argv) {
    try {
        std::size_t N = 1'000'000;
        std::size_t R = 10;
        std::string out_csv = "speed_tab.csv";
        std::string seed_dir;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() { if (i + 1 < argc) return std::string(argv[++i]); throw std::runtime_error("missing value for " + a); };
            if (a == "--keys") N = std::stoull(next());
            else if (a == "--reps") R = std::stoull(next());
            else if (a == "--out") out_csv = next();
            else if (a == "--seed-dir") seed_dir = next();
            else if (a == "--help" || a == "-h") {
                std::cout << "Usage: speed_tab [--keys N] [--reps R] [--out file.csv] [--seed-dir DIR]\n";
                return 0;
            }
            else throw std::runtime_error("unknown option " + a);
        }

        std::unique_ptr<rng::SeedPool> pool;
        if (!seed_dir.empty()) {
            pool = std::make_unique<rng::SeedPool>(seed_dir);
            std::cout << "Seed pool: " << seed_dir << " (" << pool->size() << " bytes)\n";
        }

        std::vector<std::uint32_t> keys32(N);
        std::vector<std::uint64_t> keys64(N);
        for (auto& k : keys32) k = rng::get_u32();
        for (auto& k : keys64) k = rng::get_u64();

        std::ofstream out(out_csv, std::ios::binary);
        if (!out) { std::cerr << "Cannot open " << out_csv << "\n"; return 1; }
        out.setf(std::ios::fixed); out << std::setprecision(4);
        out << "function,rep,ns_per_key\n";

        std::cout << "keys=" << N << "  reps=" << R << "  writing: " << out_csv << "\n";

        for (std::size_t r = 0; r < R; ++r) {
            const auto s32 = make_hasher<tabhash::SimpleTab32>(pool.get());
            const auto s64 = make_hasher<tabhash::SimpleTab64>(pool.get());
            const auto t32 = make_hasher<tabhash::TwistedTab32>(pool.get());
            const auto t64 = make_hasher<tabhash::TwistedTab64>(pool.get());

            out << "SimpleTab32," << (r + 1) << "," << ns_per_key(s32, keys32) << "\n";
            out << "SimpleTab64," << (r + 1) << "," << ns_per_key(s64, keys64) << "\n";
            out << "TwistedTab32," << (r + 1) << "," << ns_per_key(t32, keys32) << "\n";
            out << "TwistedTab64," << (r + 1) << "," << ns_per_key(t64, keys64) << "\n";
        }

        std::cout << "Done.\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }
}
