#pragma once

#include "di/container/ring/prelude.h"
#include "di/container/vector/vector.h"
#include "di/vocab/optional/prelude.h"
#include "vtcore/graphics_rendition.h"
#include "vtcore/image/image.h"
#include "vtcore/size.h"
#include "vtcore/terminal/cell.h"
#include "vtcore/terminal/cursor.h"
#include "vtcore/terminal/hyperlink.h"
#include "vtcore/terminal/row.h"
#include "vtcore/terminal/scroll_back.h"
#include "vtcore/terminal/scroll_region.h"

namespace vtcore::terminal {
/// @brief Whether erase operations skip cells protected via DECSCA.
enum class SelectiveErase {
    No,
    Yes,
};

/// @brief A decoded image referenced by screen cells
struct StoredImage {
    u32 id { 0 };
    image::Image image;

    auto clone() const -> StoredImage { return { id, image.clone() }; }
};

/// @brief Represents the visible contents of the terminal and its scroll back
///
/// The screen owns a fixed size grid of rows. Resizing reallocates the grid,
/// clipping or padding existing content, and never rewraps text.
///
/// When scroll back is enabled and the scroll region spans the entire screen,
/// rows which scroll off the top are moved into the scroll back buffer. Otherwise
/// they are discarded.
///
/// A glyph which is 2 columns wide occupies a pair of cells. Every operation
/// which touches one half of a pair (writing, erasing, inserting, deleting,
/// or truncating on resize) clears or moves both halves.
class Screen {
public:
    enum class ScrollBackEnabled { No, Yes };

    constexpr static auto max_hyperlinks = 4096zu;
    constexpr static auto max_images = 16zu;

    // Pixels in one sixel of the largest size. Older images are dropped to stay under it.
    constexpr static auto max_image_pixels = 3840zu * 6480zu;

    explicit Screen(Size const& size, ScrollBackEnabled scroll_back_enabled,
                    usize scroll_back_limit = ScrollBack::default_limit);

    void resize(Size const& size);
    void set_scroll_region(ScrollRegion const& region);

    auto max_height() const -> u32 { return m_size.rows; }
    auto max_width() const -> u32 { return m_size.cols; }
    auto size() const -> Size const& { return m_size; }
    auto scroll_region() const -> ScrollRegion const& { return m_scroll_region; }

    auto current_graphics_rendition() const -> GraphicsRendition const& { return m_graphics_rendition; }
    auto current_hyperlink() const -> di::Optional<Hyperlink const&> { return hyperlink(m_hyperlink_id); }
    auto current_protected() const -> bool { return m_protected; }

    void set_current_graphics_rendition(GraphicsRendition const& rendition) { m_graphics_rendition = rendition; }
    void set_current_hyperlink(di::Optional<Hyperlink const&> hyperlink);
    void set_current_protected(bool value) { m_protected = value; }

    auto hyperlink(u16 id) const -> di::Optional<Hyperlink const&>;
    auto hyperlinks() const -> di::Vector<Hyperlink> const& { return m_hyperlinks; }

    auto cursor() const -> Cursor { return m_cursor; }
    auto origin_mode() const -> OriginMode { return m_origin_mode; }

    auto save_cursor() const -> SavedCursor;
    void restore_cursor(SavedCursor const& cursor);

    void set_cursor_hidden(bool hidden) { m_cursor.hidden = hidden; }
    void set_origin_mode(OriginMode mode);
    void set_cursor_relative(u32 row, u32 col);
    void set_cursor(u32 row, u32 col);
    void set_cursor(u32 row, u32 col, bool overflow_pending);
    void set_cursor_row_relative(u32 row);
    void set_cursor_row(u32 row);
    void set_cursor_col(u32 col);

    // Relative row of the cursor, as reported by DSR 6.
    auto cursor_row_relative() const -> u32;

    void insert_blank_characters(u32 count);
    void insert_blank_lines(u32 count);

    void delete_characters(u32 count);
    void delete_lines(u32 count);

    void clear(SelectiveErase selective = SelectiveErase::No);
    void clear_after_cursor(SelectiveErase selective = SelectiveErase::No);
    void clear_before_cursor(SelectiveErase selective = SelectiveErase::No);

    void clear_row(SelectiveErase selective = SelectiveErase::No);
    void clear_row_after_cursor(SelectiveErase selective = SelectiveErase::No);
    void clear_row_before_cursor(SelectiveErase selective = SelectiveErase::No);
    void erase_characters(u32 count);

    // Fill the screen with a single character, as done by DECALN.
    void fill(c32 code_point);

    /// @brief Scroll the contents of the scroll region up
    ///
    /// Rows leaving the top of the region enter the scroll back if enabled and the
    /// region spans the whole screen. Blank rows appear at the bottom.
    void scroll_up(u32 count = 1);

    /// @brief Scroll the contents of the scroll region down
    ///
    /// Rows leaving the bottom of the region are discarded. Blank rows appear at the top.
    void scroll_down(u32 count = 1);

    void put_code_point(c32 code_point, AutoWrapMode auto_wrap_mode);

    /// @brief Attach a decoded image to the cells starting at the cursor
    ///
    /// @param image The decoded image
    /// @param cell_size Pixel size of a text cell
    /// @param move_cursor If true, the image scrolls the screen as needed and the cursor
    ///                    is left on the line below the image. Otherwise the image is
    ///                    placed at the top left of the screen and clipped to it.
    ///
    /// @return The id assigned to the image
    auto put_image(image::Image image, Size const& cell_size, bool move_cursor) -> u32;

    auto image(u32 id) const -> di::Optional<image::Image const&>;
    auto images() const -> di::Ring<StoredImage> const& { return m_images; }

    auto scroll_back() const -> ScrollBack const& { return m_scroll_back; }
    void set_scroll_back_limit(usize limit) { m_scroll_back.set_limit(limit); }
    void clear_scroll_back() { m_scroll_back.clear(); }

    auto row(u32 index) const -> Row const& { return m_rows[index]; }
    auto rows() const -> di::Vector<Row> const& { return m_rows; }
    auto cell_at(u32 row, u32 col) const -> Cell const& { return m_rows[row].cells[col]; }

    // Text of every row, with trailing blanks removed, joined by newlines.
    auto text() const -> di::String;

private:
    auto translate_row(u32 row) const -> u32;
    auto min_row() const -> u32;
    auto max_row_inclusive() const -> u32;

    auto cursor_in_scroll_region() const -> bool;
    auto blank_cell() const -> Cell;
    auto blank_row() const -> Row;

    void erase_cells(Row& row, u32 start, u32 end, SelectiveErase selective = SelectiveErase::No);
    void repair_wide_pairs(Row& row);
    void line_feed_for_wrap();

    Size m_size;
    di::Vector<Row> m_rows;
    ScrollBack m_scroll_back;
    ScrollBackEnabled m_scroll_back_enabled { ScrollBackEnabled::Yes };
    ScrollRegion m_scroll_region;
    Cursor m_cursor;
    OriginMode m_origin_mode { OriginMode::Disabled };
    GraphicsRendition m_graphics_rendition;
    bool m_protected { false };
    u16 m_hyperlink_id { 0 };
    di::Vector<Hyperlink> m_hyperlinks;
    di::Ring<StoredImage> m_images;
    u32 m_next_image_id { 1 };
};
}
