#include "vtcore/terminal/row.h"

#include "di/container/view/prelude.h"

namespace vtcore::terminal {
auto Cell::text() const -> di::String {
    auto result = di::String {};
    if (wide_continuation) {
        return result;
    }
    result.push_back(code_point == 0 ? U' ' : code_point);
    for (auto combining_code_point : combining) {
        result.push_back(combining_code_point);
    }
    return result;
}

auto Row::blank(u32 cols, Cell const& fill) -> Row {
    return { di::repeat(fill, cols) | di::to<di::Vector>(), false };
}

auto Row::text() const -> di::String {
    auto end = cells.size();
    while (end > 0 && cells[end - 1].is_blank()) {
        end--;
    }

    auto result = di::String {};
    for (auto const& cell : cells | di::take(end)) {
        result.append(cell.text());
    }
    return result;
}
}
