#pragma once
// JSON records for hashers: {"table": [[cell x 256] x C]}, nothing else.
// 32/64-bit cells are JSON integers (written unsigned, read back when non-negative);
// 128-bit cells are "0x" + 32 hex digits.
//
//   nlohmann::json j = h;                      // save
//   auto h2 = j.get<tabhash::TwistedTab64>();  // rebuild, hashes identically
//
// Reading a record throws malformed_input when it does not hold a nested array of
// valid cells, and shape_mismatch (from decode) when the dimensions are wrong.

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/uint128.hpp"
#include "tabhash/error.hpp"
#include "tabhash/table.hpp"
#include "tabhash/simpletab.hpp"
#include "tabhash/twistedtab.hpp"

namespace tabhash {

    namespace detail {

        inline std::string cell_where(std::size_t col, std::size_t row) {
            return "table[" + std::to_string(col) + "][" + std::to_string(row) + "]";
        }

        template <class Cell>
        nlohmann::json cell_to_json(const Cell& c) {
            if constexpr (std::is_same_v<Cell, u128::uint128_t>) return u128::to_hex(c);
            else return c;
        }

        template <class Cell>
        Cell cell_from_json(const nlohmann::json& j, std::size_t col, std::size_t row) {
            if constexpr (std::is_same_v<Cell, u128::uint128_t>) {
                u128::uint128_t v = 0;
                if (!j.is_string() || !u128::from_hex(j.get_ref<const std::string&>(), v)) {
                    throw malformed_input(cell_where(col, row) + ": expected 128-bit hex string");
                }
                return v;
            }
            else {
                // Signed integers (e.g. after a BSON round trip) are fine when non-negative.
                if (!j.is_number_integer()) {
                    throw malformed_input(cell_where(col, row) + ": expected unsigned integer");
                }
                if (!j.is_number_unsigned() && j.get<std::int64_t>() < 0) {
                    throw malformed_input(cell_where(col, row) + ": negative value " +
                        std::to_string(j.get<std::int64_t>()));
                }
                const std::uint64_t v = j.get<std::uint64_t>();
                if (v > std::numeric_limits<Cell>::max()) {
                    throw malformed_input(cell_where(col, row) + ": value " + std::to_string(v) +
                        " does not fit in " + std::to_string(8 * sizeof(Cell)) + " bits");
                }
                return static_cast<Cell>(v);
            }
        }

        template <class Cell, std::size_t Cols>
        nlohmann::json table_to_json(const Table<Cell, Cols>& t) {
            nlohmann::json cols = nlohmann::json::array();
            for (const auto& col : t) {
                nlohmann::json cells = nlohmann::json::array();
                for (const auto& c : col) cells.push_back(cell_to_json(c));
                cols.push_back(std::move(cells));
            }
            return cols;
        }

        // Any nested array of valid cells; the shape is checked later by decode_table.
        template <class Cell>
        Encoded<Cell> encoded_from_json(const nlohmann::json& j) {
            if (!j.is_array()) throw malformed_input("table: expected array of columns");
            Encoded<Cell> enc;
            enc.reserve(j.size());
            for (std::size_t i = 0; i < j.size(); ++i) {
                const auto& col = j[i];
                if (!col.is_array()) {
                    throw malformed_input("table[" + std::to_string(i) + "]: expected array of cells");
                }
                std::vector<Cell> cells;
                cells.reserve(col.size());
                for (std::size_t r = 0; r < col.size(); ++r) cells.push_back(cell_from_json<Cell>(col[r], i, r));
                enc.push_back(std::move(cells));
            }
            return enc;
        }

        template <class Hasher>
        nlohmann::json record_to_json(const Hasher& h) {
            return nlohmann::json{ { "table", table_to_json(h.table()) } };
        }

        template <class Hasher>
        Hasher record_from_json(const nlohmann::json& j) {
            if (!j.is_object()) throw malformed_input("record: expected JSON object");
            const auto it = j.find("table");
            if (it == j.end()) throw malformed_input("record: missing \"table\"");
            return Hasher::decode(encoded_from_json<typename Hasher::cell_type>(*it));
        }

    } // namespace detail

    // Record text for h; indent < 0 gives the compact form.
    template <class Hasher>
    std::string dump(const Hasher& h, int indent = -1) {
        return nlohmann::json(h).dump(indent);
    }

    template <class Hasher>
    Hasher load(const std::string& text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error& e) {
            throw malformed_input(std::string("record: ") + e.what());
        }
        return j.get<Hasher>();
    }

} // namespace tabhash

namespace nlohmann {

    template <class Key>
    struct adl_serializer<tabhash::SimpleTab<Key>> {
        static void to_json(json& j, const tabhash::SimpleTab<Key>& h) {
            j = tabhash::detail::record_to_json(h);
        }
        static tabhash::SimpleTab<Key> from_json(const json& j) {
            return tabhash::detail::record_from_json<tabhash::SimpleTab<Key>>(j);
        }
    };

    template <class Key>
    struct adl_serializer<tabhash::TwistedTab<Key>> {
        static void to_json(json& j, const tabhash::TwistedTab<Key>& h) {
            j = tabhash::detail::record_to_json(h);
        }
        static tabhash::TwistedTab<Key> from_json(const json& j) {
            return tabhash::detail::record_from_json<tabhash::TwistedTab<Key>>(j);
        }
    };

} // namespace nlohmann
