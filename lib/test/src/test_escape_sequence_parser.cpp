#include "di/test/prelude.h"
#include "vtcore/escape_sequence_parser.h"

namespace escape_sequence_parser {
using namespace vtcore;

static void check(di::StringView input, di::Span<ParserResult const> expected) {
    auto parser = EscapeSequenceParser {};
    auto actual = parser.parse(input);

    for (auto const& [ex, ac] : di::zip(expected, actual)) {
        ASSERT_EQ(ex, ac);
    }
    ASSERT_EQ(expected.size(), actual.size());
}

static void editor_startup() {
    constexpr auto input =
        "\x1b[?1049h\x1b[22;0;0t\x1b=\x1b[H\x1b[2J\x1b[0m\x1b[4:3m\x1bP$qm\x1b\\\x1b[c\x1b[?25h"_sv;

    auto expected = di::Array {
        ParserResult { CSI("?"_s, { { 1049 } }, 'h') },
        ParserResult { CSI(""_s, { { 22 }, { 0 }, { 0 } }, 't') },
        ParserResult { Escape(""_s, '=') },
        ParserResult { CSI(""_s, {}, 'H') },
        ParserResult { CSI(""_s, { { 2 } }, 'J') },
        ParserResult { CSI(""_s, { { 0 } }, 'm') },
        ParserResult { CSI(""_s, { { 4, 3 } }, 'm') },
        ParserResult { DCS("$"_s, {}, "$"_s, 'q', "m"_s) },
        ParserResult { CSI(""_s, {}, 'c') },
        ParserResult { CSI("?"_s, { { 25 } }, 'h') },
    };
    check(input, expected.span());
}

static void empty_params() {
    constexpr auto input = "\033[1;2;;3x\033[1;2;3::4;5x"_sv;

    auto expected = di::Array {
        ParserResult { CSI(""_s, { { 1 }, { 2 }, {}, { 3 } }, 'x') },
        ParserResult { CSI(""_s, { { 1 }, { 2 }, { 3, {}, 4 }, { 5 } }, 'x') },
    };
    check(input, expected.span());
}

static void large_params() {
    constexpr auto input = "\033[99999999999999;5H\033[1;2;3;4;5;6;7;8;9;10;11;12;13;14;15;16;17;18;19;20;21;22;23;24;25;26;"
                           "27;28;29;30;31;32;33;34m"_sv;

    auto many = Params {};
    for (auto i : di::range(1u, 33u)) {
        many.add_param(i);
    }

    auto expected = di::Array {
        ParserResult { CSI(""_s, { { 65535 }, { 5 } }, 'H') },
        ParserResult { CSI(""_s, di::move(many), 'm') },
    };
    check(input, expected.span());
}

static void osc() {
    constexpr auto input = "\033]52;;asdf\a\033]0;title\033\\\xc2\x9d"
                           "2;eight bit\xc2\x9c"_sv;

    auto expected = di::Array {
        ParserResult { OSC { "52;;asdf"_s, "\a"_sv } },
        ParserResult { OSC { "0;title"_s, "\033\\"_sv } },
        ParserResult { OSC { "2;eight bit"_s, "\033\\"_sv } },
    };
    check(input, expected.span());
}

static void dcs_passthrough() {
    constexpr auto input = "\033P0;0;0q#0;2;0;0;0~-\033\\"_sv;

    auto parser = EscapeSequenceParser {};
    auto actual = parser.parse(input);
    ASSERT_EQ(actual.size(), 1);

    auto const* dcs = di::get_if<DCS>(actual[0]);
    ASSERT(dcs);
    ASSERT_EQ(dcs->raw_params, "0;0;0"_sv);
    ASSERT_EQ(dcs->terminator, U'q');
    ASSERT_EQ(dcs->data, "#0;2;0;0;0~-"_sv);
    ASSERT_EQ(dcs->params, Params({ { 0 }, { 0 }, { 0 } }));
    ASSERT_EQ(dcs->payload(), "0;0;0q#0;2;0;0;0~-"_sv);
    ASSERT_EQ(dcs->serialize(), input);
}

static void eight_bit_controls() {
    // CSI 5 A, DCS q #1 ST, NEL
    constexpr auto input = "\xc2\x9b"
                           "5A\xc2\x90q#1\xc2\x9c\xc2\x85"_sv;

    auto expected = di::Array {
        ParserResult { CSI(""_s, { { 5 } }, 'A') },
        ParserResult { DCS(""_s, {}, ""_s, 'q', "#1"_s) },
        ParserResult { ControlCharacter(0x85, false) },
    };
    check(input, expected.span());
}

static void split_input() {
    auto parser = EscapeSequenceParser {};
    auto first = parser.parse("ab\033[3"_sv);
    ASSERT_EQ(first.size(), 2);
    ASSERT(!parser.in_ground_state());

    auto second = parser.parse("8;5;1m"_sv);
    ASSERT_EQ(second.size(), 1);
    ASSERT_EQ(second[0], ParserResult { CSI(""_s, { { 38 }, { 5 }, { 1 } }, 'm') });
    ASSERT(parser.in_ground_state());
}

static void malformed() {
    // CAN aborts the sequence, and a private marker after parameters causes the sequence to be ignored.
    constexpr auto input = "\033[1;2\x18"
                           "A\033[1?2hX\033]0;never terminated\x1a"
                           "B"_sv;

    auto expected = di::Array {
        ParserResult { ControlCharacter(0x18, true) },
        ParserResult { PrintableCharacter('A') },
        ParserResult { PrintableCharacter('X') },
        ParserResult { ControlCharacter(0x1a, true) },
        ParserResult { PrintableCharacter('B') },
    };
    check(input, expected.span());
}

static void cancelled_dcs() {
    // The sixel is dropped, and the parser is back in the ground state.
    constexpr auto input = "\033Pq#0~\x18"
                           "a\033P1$qm\x1a"
                           "b"_sv;

    auto expected = di::Array {
        ParserResult { ControlCharacter(0x18, true) },
        ParserResult { PrintableCharacter('a') },
        ParserResult { ControlCharacter(0x1a, true) },
        ParserResult { PrintableCharacter('b') },
    };
    check(input, expected.span());

    // The next string is unaffected.
    auto parser = EscapeSequenceParser {};
    (void) parser.parse("\033Pq#0~\x18"_sv);
    auto actual = parser.parse("\033Pq#1\033\\"_sv);
    ASSERT_EQ(actual.size(), 1);
    ASSERT_EQ(actual[0], ParserResult { DCS(""_s, {}, ""_s, 'q', "#1"_s) });
    ASSERT(parser.in_ground_state());
}

static void escape_sequences() {
    constexpr auto input = "\0337\033#8\033(B\0338"_sv;

    auto expected = di::Array {
        ParserResult { Escape(""_s, '7') },
        ParserResult { Escape("#"_s, '8') },
        ParserResult { Escape("("_s, 'B') },
        ParserResult { Escape(""_s, '8') },
    };
    check(input, expected.span());
}

TEST(escape_sequence_parser, editor_startup)
TEST(escape_sequence_parser, empty_params)
TEST(escape_sequence_parser, large_params)
TEST(escape_sequence_parser, osc)
TEST(escape_sequence_parser, dcs_passthrough)
TEST(escape_sequence_parser, eight_bit_controls)
TEST(escape_sequence_parser, split_input)
TEST(escape_sequence_parser, malformed)
TEST(escape_sequence_parser, cancelled_dcs)
TEST(escape_sequence_parser, escape_sequences)
}
