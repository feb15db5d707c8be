#pragma once
// Fixed-shape lookup tables: Cols columns (one per key byte) x 256 rows (one per byte value).
// Also the interchange codec between the fixed shape and a nested std::vector form,
// used to save a table and to rebuild an identical hasher from it.

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>

#include "core/randomgen.hpp"
#include "tabhash/error.hpp"

namespace tabhash {

    inline constexpr std::size_t kRows = 256;

    // T[column][byte]
    template <class Cell, std::size_t Cols>
    using Table = std::array<std::array<Cell, kRows>, Cols>;

    template <class Cell>
    using Encoded = std::vector<std::vector<Cell>>;

    // Every cell an independent draw from gen.
    template <class Cell, std::size_t Cols, class URBG>
    Table<Cell, Cols> random_table(URBG& gen) {
        Table<Cell, Cols> t;
        for (std::size_t i = 0; i < Cols; ++i) {
            for (std::size_t j = 0; j < kRows; ++j) {
                t[i][j] = rng::draw<Cell>(gen);
            }
        }
        return t;
    }

    template <class Cell, std::size_t Cols>
    Encoded<Cell> encode_table(const Table<Cell, Cols>& t) {
        Encoded<Cell> out;
        out.reserve(Cols);
        for (const auto& col : t) out.emplace_back(col.begin(), col.end());
        return out;
    }

    // Throws shape_mismatch unless enc is exactly Cols columns of 256 cells.
    template <class Cell, std::size_t Cols>
    Table<Cell, Cols> decode_table(const Encoded<Cell>& enc) {
        if (enc.size() != Cols) {
            throw shape_mismatch("decode_table: expected " + std::to_string(Cols) +
                " columns, got " + std::to_string(enc.size()));
        }
        Table<Cell, Cols> t;
        for (std::size_t i = 0; i < Cols; ++i) {
            if (enc[i].size() != kRows) {
                throw shape_mismatch("decode_table: column " + std::to_string(i) + " has " +
                    std::to_string(enc[i].size()) + " cells, expected " + std::to_string(kRows));
            }
            std::copy(enc[i].begin(), enc[i].end(), t[i].begin());
        }
        return t;
    }

} // namespace tabhash
