#include "vtcore/terminal/scroll_back.h"

namespace vtcore::terminal {
void ScrollBack::set_limit(usize limit) {
    m_limit = limit;
    evict();
}

void ScrollBack::clear() {
    m_absolute_row_start += m_rows.size();
    m_rows.clear();
}

void ScrollBack::add_row(Row row) {
    if (m_limit == 0) {
        m_absolute_row_start++;
        return;
    }

    m_rows.push_back(di::move(row));
    evict();
}

void ScrollBack::evict() {
    while (m_rows.size() > m_limit) {
        m_rows.pop_front();
        m_absolute_row_start++;
    }
}
}
