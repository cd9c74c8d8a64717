#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "vtcore/input/mouse_event_io.h"
#include "vtcore/size.h"
#include "vtcore/terminal/cursor.h"
#include "vtcore/terminal/hyperlink.h"
#include "vtcore/terminal/palette.h"
#include "vtcore/terminal/row.h"
#include "vtcore/terminal/screen.h"

namespace vtcore::terminal {
/// @brief Point in time copy of the terminal state
///
/// A snapshot owns all of its data, so it stays valid and unchanged no matter
/// what happens to the terminal afterwards.
struct Snapshot {
    Size size;
    di::Vector<Row> scroll_back; ///< Oldest row first
    di::Vector<Row> rows;        ///< Exactly size.rows rows of size.cols cells
    Cursor cursor;
    bool alternate_screen { false };
    di::String title;
    di::String icon_title;
    input::MouseProtocol mouse_protocol { input::MouseProtocol::None };
    input::MouseEncoding mouse_encoding { input::MouseEncoding::X10 };
    Palette palette;
    di::Vector<Hyperlink> hyperlinks; ///< Indexed by Cell::hyperlink_id - 1
    di::Vector<StoredImage> images;

    auto hyperlink(u16 id) const -> di::Optional<Hyperlink const&>;
    auto image(u32 id) const -> di::Optional<image::Image const&>;

    /// @brief Rows shown by a renderer which is scrolled back
    ///
    /// @param scroll_offset How many rows the view is scrolled into the scroll back.
    ///                      This is clamped to the scroll back size.
    ///
    /// @return size.rows rows, starting with the last scroll_offset scroll back rows.
    ///         Scroll back rows are not resized, so their width can differ from size.cols.
    auto visible_rows(usize scroll_offset) const -> di::Vector<Row>;

    // Text of the visible display, with trailing blanks removed.
    auto text() const -> di::String;
};
}
