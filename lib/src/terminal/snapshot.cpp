#include "vtcore/terminal/snapshot.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/view/prelude.h"

namespace vtcore::terminal {
auto Snapshot::hyperlink(u16 id) const -> di::Optional<Hyperlink const&> {
    if (id == 0 || id > hyperlinks.size()) {
        return {};
    }
    return hyperlinks[id - 1];
}

auto Snapshot::image(u32 id) const -> di::Optional<image::Image const&> {
    for (auto const& stored : images) {
        if (stored.id == id) {
            return stored.image;
        }
    }
    return {};
}

auto Snapshot::visible_rows(usize scroll_offset) const -> di::Vector<Row> {
    auto offset = di::min(scroll_offset, scroll_back.size());
    auto result = di::Vector<Row> {};
    result.reserve(rows.size());
    for (auto const& row : scroll_back | di::drop(scroll_back.size() - offset) | di::take(rows.size())) {
        result.push_back(row.clone());
    }
    for (auto const& row : rows) {
        if (result.size() == rows.size()) {
            break;
        }
        result.push_back(row.clone());
    }
    return result;
}

auto Snapshot::text() const -> di::String {
    return rows | di::transform(&Row::text) | di::join_with(U'\n') | di::to<di::String>();
}
}
