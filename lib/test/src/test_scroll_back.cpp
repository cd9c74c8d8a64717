#include "di/test/prelude.h"
#include "vtcore/terminal/scroll_back.h"

namespace scroll_back {
using namespace vtcore;
using namespace vtcore::terminal;

static auto make_row(c32 code_point) -> Row {
    auto cell = Cell {};
    cell.code_point = code_point;
    return Row::blank(1, cell);
}

static void add_rows() {
    auto scroll_back = ScrollBack(3);
    ASSERT(scroll_back.empty());
    ASSERT_EQ(scroll_back.limit(), 3u);

    for (auto code_point : "abcde"_sv) {
        scroll_back.add_row(make_row(code_point));
    }

    // The oldest rows are evicted first.
    ASSERT_EQ(scroll_back.total_rows(), 3u);
    ASSERT_EQ(scroll_back.absolute_row_start(), 2u);
    ASSERT_EQ(scroll_back.absolute_row_end(), 5u);
    ASSERT_EQ(scroll_back.row(0).text(), "c"_sv);
    ASSERT_EQ(scroll_back.row(1).text(), "d"_sv);
    ASSERT_EQ(scroll_back.row(2).text(), "e"_sv);
}

static void set_limit() {
    auto scroll_back = ScrollBack(5);
    for (auto code_point : "abcde"_sv) {
        scroll_back.add_row(make_row(code_point));
    }

    scroll_back.set_limit(2);
    ASSERT_EQ(scroll_back.total_rows(), 2u);
    ASSERT_EQ(scroll_back.absolute_row_start(), 3u);
    ASSERT_EQ(scroll_back.row(0).text(), "d"_sv);

    // Raising the limit keeps what is left.
    scroll_back.set_limit(10);
    scroll_back.add_row(make_row(U'f'));
    ASSERT_EQ(scroll_back.total_rows(), 3u);
    ASSERT_EQ(scroll_back.row(2).text(), "f"_sv);
}

static void disabled() {
    auto scroll_back = ScrollBack(0);
    scroll_back.add_row(make_row(U'a'));
    scroll_back.add_row(make_row(U'b'));

    ASSERT(scroll_back.empty());
    ASSERT_EQ(scroll_back.absolute_row_start(), 2u);

    // Setting the limit to 0 drops everything.
    auto other = ScrollBack {};
    ASSERT_EQ(other.limit(), ScrollBack::default_limit);
    other.add_row(make_row(U'a'));
    other.set_limit(0);
    ASSERT(other.empty());
    ASSERT_EQ(other.absolute_row_start(), 1u);
}

static void clear() {
    auto scroll_back = ScrollBack(5);
    for (auto code_point : "abc"_sv) {
        scroll_back.add_row(make_row(code_point));
    }

    scroll_back.clear();
    ASSERT(scroll_back.empty());
    ASSERT_EQ(scroll_back.absolute_row_start(), 3u);

    scroll_back.add_row(make_row(U'd'));
    ASSERT_EQ(scroll_back.row(0).text(), "d"_sv);
}

TEST(scroll_back, add_rows)
TEST(scroll_back, set_limit)
TEST(scroll_back, disabled)
TEST(scroll_back, clear)
}
