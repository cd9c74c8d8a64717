#pragma once

#include "di/container/ring/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "vtcore/terminal/row.h"

namespace vtcore::terminal {
/// @brief Represents the terminal scroll back
///
/// Rows which scroll off the top of the screen are appended here. The buffer is a
/// FIFO bounded by a row limit: once full, every new row evicts exactly the oldest
/// row. A limit of 0 disables the scroll back entirely.
///
/// The scroll back is unaffected by resize operations, so rows can be over or under
/// sized depending on the actual screen size when the scroll back is being rendered.
class ScrollBack {
public:
    constexpr static auto default_limit = 10000zu;

    ScrollBack() = default;
    explicit ScrollBack(usize limit) : m_limit(limit) {}

    /// @brief Absolute index of the oldest retained row
    ///
    /// This counts every row ever evicted, so that absolute row indices remain
    /// stable as the buffer changes.
    auto absolute_row_start() const -> u64 { return m_absolute_row_start; }
    auto absolute_row_end() const -> u64 { return m_absolute_row_start + total_rows(); }
    auto total_rows() const -> usize { return m_rows.size(); }
    auto empty() const -> bool { return m_rows.empty(); }

    auto limit() const -> usize { return m_limit; }

    /// @brief Change the row limit, evicting the oldest rows if needed
    void set_limit(usize limit);

    /// @brief Clear the scroll back history
    void clear();

    /// @brief Append a row, evicting the oldest row when the buffer is full
    void add_row(Row row);

    /// @brief Access a row, where 0 is the oldest retained row
    auto row(usize index) const -> Row const& { return m_rows[index]; }

    auto rows() const -> di::Ring<Row> const& { return m_rows; }

private:
    void evict();

    di::Ring<Row> m_rows;
    usize m_limit { default_limit };
    u64 m_absolute_row_start { 0 };
};
}
