#pragma once

#include "di/function/minmax.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"

namespace vtcore::terminal {
/// @brief Rows affected by scrolling, set with DECSTBM
///
/// Insert and delete lines, index, reverse index and auto-wrap only move rows
/// inside the region. Rows only enter the scroll back when the region is the
/// whole screen.
struct ScrollRegion {
    u32 start_row { 0 }; ///< First row in the region.
    u32 end_row { 0 };   ///< One past the last row in the region.

    // The default region depends on the screen size, so there is no default constructor.
    ScrollRegion() = delete;

    constexpr ScrollRegion(u32 start_row, u32 end_row) : start_row(start_row), end_row(end_row) {}

    constexpr static auto full(u32 rows) -> ScrollRegion { return { 0, rows }; }

    constexpr auto height() const -> u32 { return end_row - start_row; }
    constexpr auto contains(u32 row) const -> bool { return row >= start_row && row < end_row; }
    constexpr auto is_full(u32 rows) const -> bool { return start_row == 0 && end_row == rows; }

    // A full screen region follows the new size. Otherwise the region is clamped, and
    // reset once nothing of it is left.
    constexpr auto resized(u32 old_rows, u32 new_rows) const -> ScrollRegion {
        if (is_full(old_rows)) {
            return full(new_rows);
        }
        auto result = ScrollRegion { start_row, di::min(end_row, new_rows) };
        if (result.start_row >= result.end_row) {
            return full(new_rows);
        }
        return result;
    }

    auto operator==(ScrollRegion const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ScrollRegion>) {
        return di::make_fields<"ScrollRegion">(di::field<"start_row", &ScrollRegion::start_row>,
                                               di::field<"end_row", &ScrollRegion::end_row>);
    }
};
}
