#include "di/container/view/range.h"
#include "di/vocab/array/to_array.h"
#include "di/vocab/span/as_bytes.h"
#include "di/test/prelude.h"
#include "vtcore/input_decoder.h"

namespace input_decoder {
static void utf8_segmentation() {
    // This string contains code points of all lengths (1,2,3,4).
    auto s = u8"$¢€\U00010348"_sv;
    auto as_bytes = di::as_bytes(s.span());

    // Every split point must decode to the same string.
    auto decoder = vtcore::InputDecoder {};
    for (auto i : di::range(s.size_bytes() + 1)) {
        auto s1 = decoder.decode(as_bytes.subspan(0, i).value_or({}));
        auto s2 = decoder.decode(as_bytes.subspan(i).value_or({}));

        s1.append(di::move(s2));
        ASSERT_EQ(s1, s);
    }
}

static void utf8_errors() {
    // Substitution of Maximal Subparts: https://www.unicode.org/versions/Unicode16.0.0/core-spec/chapter-3/#G66453
    auto decoder = vtcore::InputDecoder {};

    struct Case {
        c8 const* input { nullptr };
        di::Vector<c32> expected;
    };

    constexpr auto r = vtcore::InputDecoder::replacement_character;
    auto cases = di::to_array<Case>({
        { u8"\xC0\xAF\xE0\x80\xBF\xF0\x81\x82\x41", { r, r, r, r, r, r, r, r, 0x41 } },
        { u8"\xED\xA0\x80\xED\xBF\xBF\xED\xAF\x41", { r, r, r, r, r, r, r, r, 0x41 } },
        { u8"\xF4\x91\x92\x93\xFF\x41\x80\xBF\x42", { r, r, r, r, r, 0x41, r, r, 0x42 } },
        { u8"\xE1\x80\xE2\xF0\x91\x92\xF1\xBF\x41", { r, r, r, r, 0x41 } },
    });

    for (auto const& [input, expected] : cases) {
        auto input_span = di::Span(input, input + di::distance(di::ZC8CString(input)));
        auto actual = decoder.decode(di::as_bytes(input_span));
        actual.append(decoder.flush());

        ASSERT_EQ(actual, expected | di::to<di::String>());
    }
}

static void eight_bit() {
    auto decoder = vtcore::InputDecoder(vtcore::InputEncoding::EightBit);

    auto input = di::to_array<byte>({ 0x41_b, 0x9B_b, 0x32_b, 0x4A_b, 0xE9_b });
    auto actual = decoder.decode(input.span());

    auto expected = di::Vector<c32> { U'A', 0x9B, U'2', U'J', 0xE9 } | di::to<di::String>();
    ASSERT_EQ(actual, expected);
    ASSERT(decoder.flush().empty());
}

TEST(input_decoder, utf8_segmentation)
TEST(input_decoder, utf8_errors)
TEST(input_decoder, eight_bit)
}
