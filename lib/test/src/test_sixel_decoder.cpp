#include "di/container/view/prelude.h"
#include "di/test/prelude.h"
#include "vtcore/image/sixel_decoder.h"

namespace sixel_decoder {
using namespace vtcore::image;

static void basic() {
    auto decoder = SixelDecoder {};

    // Two columns of a full sixel in red.
    auto result = decoder.decode("q#1;2;100;0;0~~"_sv);
    ASSERT(result);
    ASSERT(!result->transparent);
    ASSERT_EQ(result->image.width, 2_u32);
    ASSERT_EQ(result->image.height, 6_u32);
    for (auto y : di::range(6_u32)) {
        ASSERT_EQ(result->image.pixel(0, y), argb(255, 0, 0));
        ASSERT_EQ(result->image.pixel(1, y), argb(255, 0, 0));
    }

    // Only the bits which are set get painted. The height ends at the last painted row.
    result = decoder.decode("0;0;0q#2;2;0;100;0A-#3;2;0;0;100@"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 1_u32);
    ASSERT_EQ(result->image.height, 7_u32);
    ASSERT_EQ(result->image.pixel(0, 0), argb(0, 0, 0));
    ASSERT_EQ(result->image.pixel(0, 1), argb(0, 255, 0));
    ASSERT_EQ(result->image.pixel(0, 2), argb(0, 0, 0));
    ASSERT_EQ(result->image.pixel(0, 6), argb(0, 0, 255));

    // Carriage return overlays a second color onto the same band.
    result = decoder.decode("q#1;2;100;0;0@@$#2;2;0;100;0?A"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 2_u32);
    ASSERT_EQ(result->image.pixel(0, 0), argb(255, 0, 0));
    ASSERT_EQ(result->image.pixel(1, 0), argb(255, 0, 0));
    ASSERT_EQ(result->image.pixel(1, 1), argb(0, 255, 0));
}

static void colors() {
    auto decoder = SixelDecoder {};

    // Default VT340 registers.
    auto result = decoder.decode("q#1~#2~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.pixel(0, 0), argb(0x33, 0x33, 0xcc));
    ASSERT_EQ(result->image.pixel(1, 0), argb(0xcc, 0x23, 0x23));

    // HLS puts blue at 0 degrees and red at 120.
    result = decoder.decode("q#1;1;0;50;100~#2;1;120;50;100~#3;1;0;50;0~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.pixel(0, 0), argb(0, 0, 255));
    ASSERT_EQ(result->image.pixel(1, 0), argb(255, 0, 0));
    ASSERT_EQ(result->image.pixel(2, 0), argb(128, 128, 128));

    // Registers keep their value across images.
    (void) decoder.decode("q#5;2;0;0;100"_sv);
    ASSERT_EQ(decoder.palette().get(5), 0x0000ff_u32);
    result = decoder.decode("q#5~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.pixel(0, 0), argb(0, 0, 255));

    // The CGA palette is available as an alternative.
    auto cga = SixelDecoder(SixelPalette::create(SixelPaletteKind::CGA));
    result = cga.decode("q#4~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.pixel(0, 0), argb(0, 0, 0xa8));

    // Percentages above 100 are clamped.
    result = decoder.decode("q#7;2;200;0;0~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.pixel(0, 0), argb(255, 0, 0));
}

static void repeat() {
    auto decoder = SixelDecoder {};

    auto result = decoder.decode("q!10~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 10_u32);

    // A zero count means 1.
    result = decoder.decode("q!0~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 1_u32);

    // Repeats are clipped to the maximum width.
    result = decoder.decode("q!99999~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, SixelDecoder::max_width);
    ASSERT_EQ(result->image.height, 6_u32);
}

static void raster() {
    auto decoder = SixelDecoder {};

    // Raster attributes size the image even when fewer pixels are painted.
    auto result = decoder.decode("q\"1;1;10;20#1~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 10_u32);
    ASSERT_EQ(result->image.height, 20_u32);
    ASSERT_EQ(result->image.pixel(0, 0), argb(0x33, 0x33, 0xcc));
    ASSERT_EQ(result->image.pixel(5, 10), argb(0, 0, 0));

    // Painting beyond the raster size grows the image.
    result = decoder.decode("q\"1;1;2;2!4~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 4_u32);
    ASSERT_EQ(result->image.height, 6_u32);

    // Non square pixels are not supported, so the raster size is ignored.
    result = decoder.decode("q\"2;1;10;20~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 1_u32);
    ASSERT_EQ(result->image.height, 6_u32);

    // A raster size alone is not an image.
    ASSERT(!decoder.decode("q\"1;1;3;4"_sv));

    // Empty sixels still count, so the raster size applies.
    result = decoder.decode("q\"1;1;3;4?"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 3_u32);
    ASSERT_EQ(result->image.height, 4_u32);
}

static void raster_without_sixels() {
    auto decoder = SixelDecoder {};

    // The largest raster size must not produce an image when nothing is painted.
    ASSERT(!decoder.decode("q\"1;1;3840;6480"_sv));
    ASSERT(!decoder.decode("0;0;0q\"1;1;3840;6480#1;2;100;0;0#1$-$-"_sv));

    // A later image is sized by its own contents.
    auto result = decoder.decode("q#1~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 1_u32);
    ASSERT_EQ(result->image.height, 6_u32);
}

static void transparency() {
    auto background = argb(0x10, 0x20, 0x30);

    // Background select 1 leaves unpainted pixels transparent.
    auto decoder = SixelDecoder(SixelPalette::create(SixelPaletteKind::VT340), background, true);
    auto result = decoder.decode("0;1;0q\"1;1;2;6#1~"_sv);
    ASSERT(result);
    ASSERT(result->transparent);
    ASSERT_EQ(result->image.pixel(0, 0), argb(0x33, 0x33, 0xcc));
    ASSERT_EQ(result->image.pixel(1, 0), 0_u32);

    // Otherwise they get the background color.
    result = decoder.decode("0;0;0q\"1;1;2;6#1~"_sv);
    ASSERT(result);
    ASSERT(!result->transparent);
    ASSERT_EQ(result->image.pixel(1, 0), background);

    // Transparency must be allowed by the configuration.
    auto opaque = SixelDecoder(SixelPalette::create(SixelPaletteKind::VT340), background, false);
    result = opaque.decode("0;1;0q\"1;1;2;6#1~"_sv);
    ASSERT(result);
    ASSERT(!result->transparent);
    ASSERT_EQ(result->image.pixel(1, 0), background);
}

static void truncated() {
    auto decoder = SixelDecoder {};

    // Nothing painted and no size: no image at all.
    ASSERT(!decoder.decode("q#1;2;100"_sv));
    ASSERT(!decoder.decode(""_sv));

    // Whatever was decoded before the data ends is kept.
    auto result = decoder.decode("q#1;2;100;0;0~~-"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 2_u32);
    ASSERT_EQ(result->image.height, 6_u32);

    // A pending repeat count without a sixel paints nothing.
    result = decoder.decode("q~!5"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 1_u32);

    // Unknown bytes are skipped.
    result = decoder.decode("q~\x01 \r\n~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 2_u32);
}

static void oversized() {
    auto decoder = SixelDecoder {};

    auto payload = "q"_s;
    for (auto _ : di::range(1100)) {
        payload += "~-"_sv;
    }
    auto result = decoder.decode(payload);
    ASSERT(result);
    ASSERT_EQ(result->image.width, 1_u32);
    ASSERT_EQ(result->image.height, SixelDecoder::max_height);

    // Raster attributes can't ask for more than the maximum either.
    result = decoder.decode("q\"1;1;99999;10~"_sv);
    ASSERT(result);
    ASSERT_EQ(result->image.width, SixelDecoder::max_width);
    ASSERT_EQ(result->image.height, 10_u32);
}

TEST(sixel_decoder, basic)
TEST(sixel_decoder, colors)
TEST(sixel_decoder, repeat)
TEST(sixel_decoder, raster)
TEST(sixel_decoder, raster_without_sixels)
TEST(sixel_decoder, transparency)
TEST(sixel_decoder, truncated)
TEST(sixel_decoder, oversized)
}
