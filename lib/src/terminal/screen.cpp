#include "vtcore/terminal/screen.h"

#include "di/container/algorithm/rotate.h"
#include "di/math/prelude.h"
#include "di/util/clamp.h"
#include "di/util/scope_exit.h"
#include "dius/unicode/width.h"
#include "vtcore/graphics_rendition.h"
#include "vtcore/terminal/cell.h"
#include "vtcore/terminal/cursor.h"

namespace vtcore::terminal {
Screen::Screen(Size const& size, ScrollBackEnabled scroll_back_enabled, usize scroll_back_limit)
    : m_scroll_back(scroll_back_enabled == ScrollBackEnabled::Yes ? scroll_back_limit : 0)
    , m_scroll_back_enabled(scroll_back_enabled)
    , m_scroll_region(0, size.rows) {
    resize(size);
}

void Screen::resize(Size const& size) {
    ASSERT_GT(size.rows, 0);
    ASSERT_GT(size.cols, 0);

    if (size.cols == max_width() && size.rows == max_height()) {
        m_size = size;
        return;
    }

    // Always update the size and clamp the scroll region in bounds.
    auto _ = di::ScopeExit([&] {
        m_scroll_region = m_scroll_region.resized(m_size.rows, size.rows);
        m_size = size;
    });

    // First fix the column count of the existing rows. Truncating may cut a wide
    // pair in half, in which case the remaining half is cleared.
    for (auto& row : m_rows) {
        if (row.cells.size() > size.cols) {
            row.cells.erase(row.cells.begin() + size.cols, row.cells.end());
            row.overflow = false;
        } else {
            row.cells.insert_container(row.cells.end(), di::repeat(Cell(), size.cols - row.cells.size()));
        }
        repair_wide_pairs(row);
    }

    // Now either add new rows or remove existing ones. Blank rows below the cursor are
    // dropped first, so that the cursor's row stays visible. Any remaining rows are
    // taken from the top of the screen, and go to the scroll back when enabled.
    if (m_rows.size() > size.rows) {
        auto rows_to_delete = m_rows.size() - size.rows;
        while (rows_to_delete > 0 && m_rows.size() > m_cursor.row + 1 &&
               m_rows.back().value().text().empty()) {
            m_rows.pop_back();
            rows_to_delete--;
        }

        for (auto i : di::range(rows_to_delete)) {
            if (m_scroll_back_enabled == ScrollBackEnabled::Yes) {
                m_scroll_back.add_row(di::move(m_rows[i]));
            }
        }
        m_rows.erase(m_rows.begin(), m_rows.begin() + rows_to_delete);

        // Adjust the cursor to account for removed lines.
        if (m_cursor.row > rows_to_delete) {
            m_cursor.row -= rows_to_delete;
        } else {
            m_cursor.row = 0;
        }
    } else if (m_rows.size() < size.rows) {
        for (auto _ : di::range(size.rows - m_rows.size())) {
            m_rows.push_back(Row::blank(size.cols));
        }
    }
    ASSERT_EQ(m_rows.size(), size.rows);

    // Clamp the cursor to the screen size.
    m_cursor.row = di::min(m_cursor.row, size.rows - 1);
    m_cursor.col = di::min(m_cursor.col, size.cols - 1);
    m_cursor.overflow_pending = false;
}

void Screen::set_scroll_region(ScrollRegion const& region) {
    ASSERT_LT(region.start_row, region.end_row);
    ASSERT_LT_EQ(region.end_row, max_height());
    m_scroll_region = region;
}

void Screen::set_current_hyperlink(di::Optional<Hyperlink const&> hyperlink) {
    if (!hyperlink) {
        m_hyperlink_id = 0;
        return;
    }

    for (auto i : di::range(m_hyperlinks.size())) {
        if (m_hyperlinks[i] == hyperlink.value()) {
            m_hyperlink_id = u16(i + 1);
            return;
        }
    }

    // When the table is full, new links are not recorded.
    if (m_hyperlinks.size() >= max_hyperlinks) {
        m_hyperlink_id = 0;
        return;
    }
    m_hyperlinks.push_back(hyperlink.value().clone());
    m_hyperlink_id = u16(m_hyperlinks.size());
}

auto Screen::hyperlink(u16 id) const -> di::Optional<Hyperlink const&> {
    if (id == 0 || id > m_hyperlinks.size()) {
        return {};
    }
    return m_hyperlinks[id - 1];
}

auto Screen::save_cursor() const -> SavedCursor {
    return {
        .row = m_cursor.row,
        .col = m_cursor.col,
        .overflow_pending = m_cursor.overflow_pending,
        .graphics_rendition = m_graphics_rendition,
        .protected_ = m_protected,
        .origin_mode = m_origin_mode,
    };
}

void Screen::restore_cursor(SavedCursor const& cursor) {
    // Restore origin mode first to ensure we clamp the cursor if necessary.
    m_origin_mode = cursor.origin_mode;
    set_cursor(cursor.row, cursor.col);
    m_graphics_rendition = cursor.graphics_rendition;
    m_protected = cursor.protected_;

    // This is restored even if the terminal has been resized such that
    // the cursor is no longer at the end of the row.
    m_cursor.overflow_pending = cursor.overflow_pending && m_cursor.col == max_width() - 1;
}

void Screen::set_origin_mode(OriginMode origin_mode) {
    if (m_origin_mode == origin_mode) {
        return;
    }
    m_origin_mode = origin_mode;

    // If origin mode is enabled, this puts the cursor at the
    // top-left of the scroll region.
    set_cursor_relative(0, 0);
}

void Screen::set_cursor_relative(u32 row, u32 col) {
    set_cursor(translate_row(row), col);
}

void Screen::set_cursor(u32 row, u32 col, bool overflow_pending) {
    set_cursor(row, col);
    m_cursor.overflow_pending = overflow_pending;
}

void Screen::set_cursor(u32 row, u32 col) {
    // Setting the cursor always clears the overflow pending flag.
    m_cursor.overflow_pending = false;
    m_cursor.row = di::clamp(row, min_row(), max_row_inclusive());
    m_cursor.col = di::min(col, max_width() - 1);
}

void Screen::set_cursor_row_relative(u32 row) {
    set_cursor_row(translate_row(row));
}

void Screen::set_cursor_row(u32 row) {
    set_cursor(row, m_cursor.col);
}

void Screen::set_cursor_col(u32 col) {
    set_cursor(m_cursor.row, col);
}

auto Screen::cursor_row_relative() const -> u32 {
    return m_cursor.row - min_row();
}

void Screen::insert_blank_characters(u32 count) {
    m_cursor.overflow_pending = false;

    // Inserting in the middle of a wide pair clears the pair.
    auto& row = m_rows[m_cursor.row];
    if (row.cells[m_cursor.col].wide_continuation) {
        erase_cells(row, m_cursor.col, m_cursor.col + 1);
    }

    // Cells pushed past the right margin are lost. The cursor position is unchanged.
    auto max_to_insert = di::min(count, max_width() - m_cursor.col);
    row.cells.erase(row.cells.end() - max_to_insert, row.cells.end());
    row.cells.insert_container(row.cells.begin() + m_cursor.col, di::repeat(blank_cell(), max_to_insert));
    row.overflow = false;

    // A wide glyph may have been pushed half way off the end of the row.
    repair_wide_pairs(row);
}

void Screen::insert_blank_lines(u32 count) {
    m_cursor.overflow_pending = false;
    if (!cursor_in_scroll_region()) {
        return;
    }

    // Clear the rows at the end of the scroll region, and then rotate them into place.
    auto max_to_insert = di::min(count, m_scroll_region.end_row - m_cursor.row);
    auto end_row_it = m_rows.begin() + m_scroll_region.end_row;
    auto delete_row_it = end_row_it - max_to_insert;
    for (auto it = delete_row_it; it != end_row_it; ++it) {
        *it = blank_row();
    }
    di::rotate(m_rows.begin() + m_cursor.row, delete_row_it, end_row_it);

    // Now set the cursor to the left margin.
    m_cursor.col = 0;
}

void Screen::delete_characters(u32 count) {
    m_cursor.overflow_pending = false;

    // Clear any wide pair straddling the boundaries of the deleted range first, so that
    // no half of a pair gets shifted on its own.
    auto& row = m_rows[m_cursor.row];
    auto max_to_delete = di::min(count, max_width() - m_cursor.col);
    erase_cells(row, m_cursor.col, m_cursor.col + max_to_delete);

    row.cells.erase(row.cells.begin() + m_cursor.col, row.cells.begin() + m_cursor.col + max_to_delete);
    row.cells.insert_container(row.cells.end(), di::repeat(blank_cell(), max_to_delete));
    row.overflow = false;

    repair_wide_pairs(row);
}

void Screen::delete_lines(u32 count) {
    m_cursor.overflow_pending = false;
    if (!cursor_in_scroll_region()) {
        return;
    }

    // Clear the rows starting at the cursor, and then rotate them to the bottom of the scroll region.
    auto max_to_delete = di::min(count, m_scroll_region.end_row - m_cursor.row);
    auto delete_row_it = m_rows.begin() + m_cursor.row;
    auto delete_row_end = delete_row_it + max_to_delete;
    for (auto it = delete_row_it; it != delete_row_end; ++it) {
        *it = blank_row();
    }
    di::rotate(delete_row_it, delete_row_end, m_rows.begin() + m_scroll_region.end_row);

    // Now set the cursor to the left margin.
    m_cursor.col = 0;
}

void Screen::clear(SelectiveErase selective) {
    m_cursor.overflow_pending = false;

    for (auto& row : m_rows) {
        erase_cells(row, 0, max_width(), selective);
    }
}

void Screen::clear_after_cursor(SelectiveErase selective) {
    // First, clear the current cursor row.
    clear_row_after_cursor(selective);

    for (auto& row : m_rows | di::drop(m_cursor.row + 1)) {
        erase_cells(row, 0, max_width(), selective);
    }
}

void Screen::clear_before_cursor(SelectiveErase selective) {
    // First, clear the current cursor row.
    clear_row_before_cursor(selective);

    for (auto& row : m_rows | di::take(m_cursor.row)) {
        erase_cells(row, 0, max_width(), selective);
    }
}

void Screen::clear_row(SelectiveErase selective) {
    m_cursor.overflow_pending = false;
    erase_cells(m_rows[m_cursor.row], 0, max_width(), selective);
}

void Screen::clear_row_after_cursor(SelectiveErase selective) {
    m_cursor.overflow_pending = false;
    erase_cells(m_rows[m_cursor.row], m_cursor.col, max_width(), selective);
}

void Screen::clear_row_before_cursor(SelectiveErase selective) {
    m_cursor.overflow_pending = false;
    erase_cells(m_rows[m_cursor.row], 0, m_cursor.col + 1, selective);
}

void Screen::erase_characters(u32 count) {
    m_cursor.overflow_pending = false;

    auto end = di::min(m_cursor.col + di::max(count, 1u), max_width());
    erase_cells(m_rows[m_cursor.row], m_cursor.col, end);
}

void Screen::fill(c32 code_point) {
    auto cell = Cell {};
    cell.code_point = code_point;
    for (auto& row : m_rows) {
        row = Row::blank(max_width(), cell);
    }
    m_scroll_region = ScrollRegion::full(max_height());
    set_cursor(0, 0);
}

void Screen::scroll_up(u32 count) {
    auto n = di::min(count, m_scroll_region.height());
    if (n == 0) {
        return;
    }

    if (m_scroll_region.is_full(max_height())) {
        // Rows leave the screen entirely. Let the scroll back decide what to keep.
        for (auto i : di::range(n)) {
            m_scroll_back.add_row(di::move(m_rows[i]));
        }
        m_rows.erase(m_rows.begin(), m_rows.begin() + n);
        for (auto _ : di::range(n)) {
            m_rows.push_back(blank_row());
        }
    } else {
        auto begin = m_rows.begin() + m_scroll_region.start_row;
        for (auto it = begin; it != begin + n; ++it) {
            *it = blank_row();
        }
        di::rotate(begin, begin + n, m_rows.begin() + m_scroll_region.end_row);
    }
    m_cursor.overflow_pending = false;
}

void Screen::scroll_down(u32 count) {
    auto n = di::min(count, m_scroll_region.height());
    if (n == 0) {
        return;
    }

    auto begin = m_rows.begin() + m_scroll_region.start_row;
    auto end = m_rows.begin() + m_scroll_region.end_row;
    for (auto it = end - n; it != end; ++it) {
        *it = blank_row();
    }
    di::rotate(begin, end - n, end);
    m_cursor.overflow_pending = false;
}

void Screen::put_code_point(c32 code_point, AutoWrapMode auto_wrap_mode) {
    auto width = dius::unicode::code_point_width(code_point).value_or(0);

    // Zero width code points combine with the previously written cell. If there is
    // no such cell or it is full, the code point is dropped.
    if (width == 0) {
        if (!m_cursor.overflow_pending && m_cursor.col == 0) {
            return;
        }
        auto col = m_cursor.overflow_pending ? m_cursor.col : m_cursor.col - 1;
        auto& row = m_rows[m_cursor.row];
        if (row.cells[col].wide_continuation && col > 0) {
            col--;
        }
        auto& cell = row.cells[col];
        if (cell.code_point != 0) {
            (void) cell.combining.push_back(code_point);
        }
        return;
    }

    // Wrap if the previous character filled the row.
    if (m_cursor.overflow_pending) {
        if (auto_wrap_mode == AutoWrapMode::Enabled) {
            m_rows[m_cursor.row].overflow = true;
            line_feed_for_wrap();
        }
        m_cursor.overflow_pending = false;
    }

    // A wide glyph which doesn't fit at the end of the row wraps early.
    if (width == 2) {
        if (max_width() < 2) {
            return;
        }
        if (m_cursor.col == max_width() - 1) {
            if (auto_wrap_mode == AutoWrapMode::Enabled) {
                erase_cells(m_rows[m_cursor.row], m_cursor.col, max_width());
                m_rows[m_cursor.row].overflow = true;
                line_feed_for_wrap();
            } else {
                m_cursor.col = max_width() - 2;
            }
        }
    }

    // Clear any wide pairs which are about to be partially overwritten.
    auto& row = m_rows[m_cursor.row];
    erase_cells(row, m_cursor.col, m_cursor.col + width);

    auto& cell = row.cells[m_cursor.col];
    cell = Cell {};
    cell.code_point = code_point;
    cell.graphics_rendition = m_graphics_rendition;
    cell.hyperlink_id = m_hyperlink_id;
    cell.protected_ = m_protected;
    if (width == 2) {
        cell.wide = true;

        auto& continuation = row.cells[m_cursor.col + 1];
        continuation = Cell {};
        continuation.graphics_rendition = m_graphics_rendition;
        continuation.hyperlink_id = m_hyperlink_id;
        continuation.protected_ = m_protected;
        continuation.wide_continuation = true;
    }

    // Advance the cursor. Reaching the end of the row leaves the cursor on the last
    // column with a pending wrap.
    auto next_col = m_cursor.col + width;
    if (next_col >= max_width()) {
        m_cursor.col = max_width() - 1;
        m_cursor.overflow_pending = auto_wrap_mode == AutoWrapMode::Enabled;
    } else {
        m_cursor.col = next_col;
    }
}

auto Screen::put_image(image::Image image, Size const& cell_size, bool move_cursor) -> u32 {
    auto id = m_next_image_id++;
    auto cell_width = di::max(cell_size.xpixels, 1u);
    auto cell_height = di::max(cell_size.ypixels, 1u);
    auto image_cols = u32(di::divide_round_up(image.width, cell_width));
    auto image_rows = u32(di::divide_round_up(image.height, cell_height));

    if (!move_cursor) {
        set_cursor(0, 0);
    }
    auto start_col = m_cursor.col;
    m_cursor.overflow_pending = false;

    for (auto tile_row : di::range(image_rows)) {
        auto& row = m_rows[m_cursor.row];
        auto end_col = di::min(start_col + image_cols, max_width());
        erase_cells(row, start_col, end_col);
        for (auto col : di::range(start_col, end_col)) {
            row.cells[col].image = ImageTile { id, u16(tile_row), u16(col - start_col) };
        }

        auto last_row = tile_row + 1 == image_rows;
        if (!move_cursor) {
            if (m_cursor.row + 1 >= max_height()) {
                break;
            }
            m_cursor.row++;
            continue;
        }
        if (!last_row) {
            line_feed_for_wrap();
        }
    }

    if (move_cursor) {
        line_feed_for_wrap();
        m_cursor.col = start_col;
    } else {
        set_cursor(0, 0);
    }

    m_images.push_back({ id, di::move(image) });

    auto stored_pixels = [&] {
        auto total = 0zu;
        for (auto const& stored : m_images) {
            total += usize(stored.image.width) * stored.image.height;
        }
        return total;
    };

    // The newest image is always kept, even when it alone is over the pixel budget.
    while (m_images.size() > max_images || (m_images.size() > 1 && stored_pixels() > max_image_pixels)) {
        m_images.pop_front();
    }
    return id;
}

auto Screen::image(u32 id) const -> di::Optional<image::Image const&> {
    for (auto const& stored : m_images) {
        if (stored.id == id) {
            return stored.image;
        }
    }
    return {};
}

auto Screen::text() const -> di::String {
    return m_rows | di::transform(&Row::text) | di::join_with(U'\n') | di::to<di::String>();
}

auto Screen::translate_row(u32 row) const -> u32 {
    if (m_origin_mode == OriginMode::Enabled) {
        return row + m_scroll_region.start_row;
    }
    return row;
}

auto Screen::min_row() const -> u32 {
    if (m_origin_mode == OriginMode::Enabled) {
        return m_scroll_region.start_row;
    }
    return 0;
}

auto Screen::max_row_inclusive() const -> u32 {
    if (m_origin_mode == OriginMode::Enabled) {
        return m_scroll_region.end_row - 1;
    }
    return max_height() - 1;
}

auto Screen::cursor_in_scroll_region() const -> bool {
    return m_scroll_region.contains(m_cursor.row);
}

// Erased cells keep the current background color (bce).
auto Screen::blank_cell() const -> Cell {
    auto cell = Cell {};
    cell.graphics_rendition.bg = m_graphics_rendition.bg;
    return cell;
}

auto Screen::blank_row() const -> Row {
    return Row::blank(max_width(), blank_cell());
}

void Screen::erase_cells(Row& row, u32 start, u32 end, SelectiveErase selective) {
    if (start >= end) {
        return;
    }

    // Erasing either half of a wide pair erases both halves.
    if (start > 0 && row.cells[start].wide_continuation) {
        start--;
    }
    if (end < row.cells.size() && row.cells[end].wide_continuation) {
        end++;
    }

    auto blank = blank_cell();
    for (auto& cell : *row.cells.subspan(start, end - start)) {
        if (selective == SelectiveErase::Yes && cell.protected_) {
            continue;
        }
        cell = blank;
    }
    if (end == row.cells.size()) {
        row.overflow = false;
    }
}

// Clear any half of a wide pair which lost its sibling.
void Screen::repair_wide_pairs(Row& row) {
    auto blank = blank_cell();
    for (auto i : di::range(row.cells.size())) {
        auto& cell = row.cells[i];
        if (cell.wide && (i + 1 >= row.cells.size() || !row.cells[i + 1].wide_continuation)) {
            cell = blank;
        } else if (cell.wide_continuation && (i == 0 || !row.cells[i - 1].wide)) {
            cell = blank;
        }
    }
}

// Move to the start of the next line, scrolling if the cursor is at the bottom of
// the scroll region.
void Screen::line_feed_for_wrap() {
    m_cursor.col = 0;
    m_cursor.overflow_pending = false;
    if (m_cursor.row + 1 == m_scroll_region.end_row) {
        scroll_up(1);
    } else if (m_cursor.row + 1 < max_height()) {
        m_cursor.row++;
    }
}
}
