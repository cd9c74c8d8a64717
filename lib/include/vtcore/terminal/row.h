#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/prelude.h"
#include "vtcore/terminal/cell.h"

namespace vtcore::terminal {
/// @brief Represents a on-screen terminal row of cells
struct Row {
    di::Vector<Cell> cells; ///< Fixed size vector of terminal cells for this row.
    bool overflow { false }; ///< Set if the cursor overflowed (auto-wrapped) when at this row.

    static auto blank(u32 cols, Cell const& fill = {}) -> Row;

    // Text of the row, with trailing blank cells removed.
    auto text() const -> di::String;

    auto clone() const -> Row { return { cells.clone(), overflow }; }

    auto operator==(Row const&) const -> bool = default;
};
}
