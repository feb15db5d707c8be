#pragma once
// Exceptions raised while rebuilding a table from saved state.

#include <stdexcept>
#include <string>

namespace tabhash {

    // Nested sequence has the wrong column count or a column length other than 256.
    class shape_mismatch : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Structured record cannot be read as a nested sequence of cells.
    class malformed_input : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace tabhash
