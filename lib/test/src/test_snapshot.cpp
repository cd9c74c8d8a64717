#include "di/test/prelude.h"
#include "vtcore/terminal/snapshot.h"

namespace snapshot {
using namespace vtcore;
using namespace vtcore::terminal;

static auto make_row(di::StringView text, u32 cols) -> Row {
    auto row = Row::blank(cols);
    for (auto [i, code_point] : text | di::enumerate) {
        row.cells[i].code_point = code_point;
    }
    return row;
}

static auto make_snapshot() -> Snapshot {
    auto snapshot = Snapshot {};
    snapshot.size = { 2, 3 };
    snapshot.scroll_back.push_back(make_row("s0"_sv, 4));
    snapshot.scroll_back.push_back(make_row("s1"_sv, 2));
    snapshot.scroll_back.push_back(make_row("s2"_sv, 3));
    snapshot.rows.push_back(make_row("abc"_sv, 3));
    snapshot.rows.push_back(make_row("d"_sv, 3));
    return snapshot;
}

static void text() {
    auto snapshot = make_snapshot();
    ASSERT_EQ(snapshot.text(), "abc\nd"_sv);

    snapshot.rows[1] = Row::blank(3);
    ASSERT_EQ(snapshot.text(), "abc\n"_sv);
}

static void visible_rows() {
    auto snapshot = make_snapshot();

    struct Case {
        usize scroll_offset { 0 };
        di::Array<di::StringView, 2> expected {};
    };

    auto cases = di::Array {
        Case { 0, { "abc"_sv, "d"_sv } },
        Case { 1, { "s2"_sv, "abc"_sv } },
        Case { 2, { "s1"_sv, "s2"_sv } },
        Case { 3, { "s0"_sv, "s1"_sv } },

        // Clamped to the scroll back size.
        Case { 100, { "s0"_sv, "s1"_sv } },
    };

    for (auto const& [scroll_offset, expected] : cases) {
        auto rows = snapshot.visible_rows(scroll_offset);
        ASSERT_EQ(rows.size(), 2u);
        ASSERT_EQ(rows[0].text(), expected[0]);
        ASSERT_EQ(rows[1].text(), expected[1]);
    }

    // Scroll back rows keep their original width.
    ASSERT_EQ(snapshot.visible_rows(3)[0].cells.size(), 4u);
}

static void lookups() {
    auto snapshot = make_snapshot();
    snapshot.hyperlinks.push_back({ "https://example.com"_s, ""_s });
    snapshot.images.push_back({ 7, image::Image::create(2, 3) });

    ASSERT(!snapshot.hyperlink(0));
    ASSERT_EQ(snapshot.hyperlink(1).value().uri, "https://example.com"_sv);
    ASSERT(!snapshot.hyperlink(2));

    ASSERT(!snapshot.image(1));
    ASSERT_EQ(snapshot.image(7).value().height, 3u);
}

TEST(snapshot, text)
TEST(snapshot, visible_rows)
TEST(snapshot, lookups)
}
