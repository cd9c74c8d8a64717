#include "di/container/view/prelude.h"
#include "di/test/prelude.h"
#include "dius/thread.h"
#include "vtcore/image/hq_sixel_encoder.h"
#include "vtcore/image/simple_sixel_encoder.h"
#include "vtcore/image/sixel_decoder.h"

namespace sixel_encoder {
using namespace vtcore::image;

static auto decode(EncodedSixel const& encoded, bool allow_transparent = false) -> DecodedSixel {
    // Strip the DCS introducer and string terminator.
    auto const& data = encoded.data;
    ASSERT(data.starts_with("\033P"_sv));
    ASSERT(data.ends_with("\033\\"_sv));
    auto body = data | di::drop(2) | di::take(data.size_bytes() - 4) | di::to<di::String>();

    auto decoder = SixelDecoder(SixelPalette::create(SixelPaletteKind::VT340), argb(0, 0, 0), allow_transparent);
    auto result = decoder.decode(body);
    ASSERT(result);
    return di::move(result).value();
}

static auto quadrant_image() -> Image {
    auto image = Image::create(16, 12);
    for (auto y : di::range(12_u32)) {
        for (auto x : di::range(16_u32)) {
            auto left = x < 8;
            auto top = y < 6;
            auto color = top ? (left ? argb(255, 0, 0) : argb(0, 255, 0)) : (left ? argb(0, 0, 255) : argb(255, 255, 255));
            image.set_pixel(x, y, color);
        }
    }
    return image;
}

static auto gradient_image() -> Image {
    auto image = Image::create(32, 18);
    for (auto y : di::range(18_u32)) {
        for (auto x : di::range(32_u32)) {
            image.set_pixel(x, y, argb(u8(x * 8), u8(y * 14), 128));
        }
    }
    return image;
}

static auto channel_difference(u32 a, u32 b) -> u32 {
    auto difference = [](u8 x, u8 y) -> u32 {
        return x > y ? x - y : y - x;
    };
    return difference(red(a), red(b)) + difference(green(a), green(b)) + difference(blue(a), blue(b));
}

// Counts "#Pc;2;..." color register definitions.
static auto count_color_registers(di::StringView data) -> u32 {
    auto chars = data | di::to<di::Vector>();
    auto result = 0_u32;
    for (auto i : di::range(chars.size())) {
        if (chars[i] != U'#') {
            continue;
        }
        auto j = i + 1;
        while (j < chars.size() && chars[j] >= U'0' && chars[j] <= U'9') {
            j++;
        }
        if (j + 2 < chars.size() && chars[j] == U';' && chars[j + 1] == U'2' && chars[j + 2] == U';') {
            result++;
        }
    }
    return result;
}

static void bands() {
    auto used = di::Vector<u8> {};
    used.push_back(0);
    used.push_back(0);

    // Runs of 3 or more are compressed.
    auto indices = di::repeat(u16(0), 24zu) | di::to<di::Vector>();
    auto result = write_sixel_bands(indices.span(), 4, 6, used.span());
    ASSERT_EQ(result, "$#0!4~"_sv);
    ASSERT(used[0]);
    ASSERT(!used[1]);

    // Empty sixels at the end of the line are dropped, and unpainted pixels are skipped.
    indices = di::repeat(sixel_transparent_index, 12zu) | di::to<di::Vector>();
    indices[1] = 1;
    indices[5] = 1;
    result = write_sixel_bands(indices.span(), 4, 3, used.span());
    ASSERT_EQ(result, "$#1?B"_sv);
    ASSERT(used[1]);

    // Bands are separated by a graphics new line.
    indices = di::repeat(u16(0), 14zu) | di::to<di::Vector>();
    result = write_sixel_bands(indices.span(), 2, 7, used.span());
    ASSERT_EQ(result, "$#0~~-$#0@@"_sv);
}

static void header() {
    auto palette = di::Vector<u32> {};
    palette.push_back(sixel_rgb(100, 0, 0));
    palette.push_back(sixel_rgb(0, 50, 0));
    auto used = di::Vector<u8> {};
    used.push_back(0);
    used.push_back(1);

    auto result = write_sixel(4, 6, palette.span(), used.span(), "$#1!4~"_sv, { 0, 0, 3, 4 });
    ASSERT_EQ(result.data, "\033P0;1;0q\"1;1;4;6#1;2;0;50;0$#1!4~\033\\"_sv);
    ASSERT_EQ(result.rows, 2_u32);
    ASSERT_EQ(result.columns, 2_u32);

    // Without a cell size the covered cells are unknown.
    result = write_sixel(4, 6, palette.span(), used.span(), ""_sv, {});
    ASSERT_EQ(result.rows, 0_u32);
    ASSERT_EQ(result.columns, 0_u32);
}

static void simple_round_trip() {
    auto encoder = SimpleSixelEncoder {};
    auto image = quadrant_image();

    auto encoded = encoder.encode(image, SixelEncoder::default_color_count, { 0, 0, 8, 16 });
    ASSERT(encoded.data.starts_with("\033P0;1;0q\"1;1;16;12"_sv));
    ASSERT_EQ(encoded.rows, 1_u32);
    ASSERT_EQ(encoded.columns, 2_u32);

    // Pure colors are part of every color cube.
    auto decoded = decode(encoded);
    ASSERT_EQ(decoded.image, image);

    // Other colors are within half a cube step.
    image = gradient_image();
    decoded = decode(encoder.encode(image));
    ASSERT_EQ(decoded.image.width, image.width);
    ASSERT_EQ(decoded.image.height, image.height);
    for (auto i : di::range(image.pixels.size())) {
        ASSERT_LT_EQ(channel_difference(image.pixels[i], decoded.image.pixels[i]), 3 * 40_u32);
    }
}

static void simple_color_count() {
    auto encoder = SimpleSixelEncoder {};

    // With 8 colors only the corners of the cube remain.
    auto image = Image::create(2, 1, argb(200, 60, 130));
    auto decoded = decode(encoder.encode(image, 8));
    ASSERT_EQ(decoded.image.pixel(0, 0), argb(255, 0, 255));
}

static void simple_small_color_count() {
    auto encoder = SimpleSixelEncoder {};
    auto image = gradient_image();

    for (auto color_count : di::Array { 0_u32, 1_u32, 2_u32, 4_u32, 7_u32 }) {
        auto encoded = encoder.encode(image, color_count);
        ASSERT_LT_EQ(count_color_registers(encoded.data), di::max(color_count, 2_u32));
        ASSERT_EQ(decode(encoded).image.width, image.width);
    }
    ASSERT_GT(count_color_registers(encoder.encode(image, 4).data), 2_u32);

    // Two colors are black and white, split by brightness.
    auto decoded = decode(encoder.encode(quadrant_image(), 2));
    ASSERT_EQ(decoded.image.pixel(0, 0), argb(0, 0, 0));
    ASSERT_EQ(decoded.image.pixel(8, 0), argb(255, 255, 255));
    ASSERT_EQ(decoded.image.pixel(0, 6), argb(0, 0, 0));
    ASSERT_EQ(decoded.image.pixel(8, 6), argb(255, 255, 255));
}

static void hq_round_trip() {
    auto encoder = HqSixelEncoder {};
    auto image = quadrant_image();

    // Few enough colors are used directly.
    auto decoded = decode(encoder.encode(image));
    ASSERT_EQ(decoded.image, image);

    // Dithering keeps the average error low.
    image = gradient_image();
    decoded = decode(encoder.encode(image));
    ASSERT_EQ(decoded.image.width, image.width);
    ASSERT_EQ(decoded.image.height, image.height);
    auto total = 0_u64;
    for (auto i : di::range(image.pixels.size())) {
        total += channel_difference(image.pixels[i], decoded.image.pixels[i]);
    }
    ASSERT_LT_EQ(total / (image.pixels.size() * 3), 16_u64);
}

static void hq_palette_size() {
    ASSERT_EQ(HqSixelEncoder::palette_size_for(0), 2_u32);
    ASSERT_EQ(HqSixelEncoder::palette_size_for(3), 2_u32);
    ASSERT_EQ(HqSixelEncoder::palette_size_for(128), 128_u32);
    ASSERT_EQ(HqSixelEncoder::palette_size_for(200), 128_u32);
    ASSERT_EQ(HqSixelEncoder::palette_size_for(5000), 2048_u32);

    // Near black and near white entries are snapped.
    auto image = Image::create(8, 6, argb(4, 4, 4));
    for (auto y : di::range(3_u32)) {
        for (auto x : di::range(8_u32)) {
            image.set_pixel(x, y, argb(250, 250, 250));
        }
    }
    auto encoder = HqSixelEncoder {};
    auto decoded = decode(encoder.encode(gradient_image(), 2));
    ASSERT_EQ(decoded.image.width, 32_u32);

    decoded = decode(encoder.encode(image, 2));
    ASSERT_EQ(decoded.image.pixel(0, 0), argb(255, 255, 255));
    ASSERT_EQ(decoded.image.pixel(0, 5), argb(0, 0, 0));
}

static void transparency() {
    auto image = quadrant_image();
    for (auto y : di::range(6_u32, 12_u32)) {
        for (auto x : di::range(16_u32)) {
            image.set_pixel(x, y, argb(255, 255, 255, 0));
        }
    }

    auto simple = SimpleSixelEncoder(true);
    auto decoded = decode(simple.encode(image), true);
    ASSERT(decoded.transparent);
    ASSERT_EQ(decoded.image.height, 12_u32);
    ASSERT_EQ(decoded.image.pixel(0, 0), argb(255, 0, 0));
    ASSERT_EQ(decoded.image.pixel(0, 11), 0_u32);

    auto hq = HqSixelEncoder(true);
    decoded = decode(hq.encode(image), true);
    ASSERT_EQ(decoded.image.height, 12_u32);
    ASSERT_EQ(decoded.image.pixel(15, 0), argb(0, 255, 0));
    ASSERT_EQ(decoded.image.pixel(15, 11), 0_u32);

    // When transparency is not allowed the pixels become black.
    auto opaque = HqSixelEncoder(false);
    decoded = decode(opaque.encode(image), true);
    ASSERT_EQ(decoded.image.pixel(15, 11), argb(0, 0, 0));
}

static void concurrent_encode() {
    auto encoder = HqSixelEncoder(false, 3);
    auto image = gradient_image();
    auto expected = encoder.encode(image);

    // A single encoder can be shared between threads.
    constexpr auto thread_count = 4zu;
    auto results = di::Vector<EncodedSixel> {};
    for (auto _ : di::range(thread_count)) {
        results.push_back({});
    }
    auto threads = di::Vector<dius::Thread> {};
    for (auto i : di::range(thread_count)) {
        auto thread = dius::Thread::create([&encoder, &image, &result = results[i]] {
            result = encoder.encode(image);
        });
        ASSERT(thread);
        threads.push_back(di::move(thread).value());
    }
    for (auto& thread : threads) {
        (void) thread.join();
    }

    for (auto const& result : results) {
        ASSERT_EQ(result.data, expected.data);
    }
}

TEST(sixel_encoder, bands)
TEST(sixel_encoder, header)
TEST(sixel_encoder, simple_round_trip)
TEST(sixel_encoder, simple_color_count)
TEST(sixel_encoder, simple_small_color_count)
TEST(sixel_encoder, hq_round_trip)
TEST(sixel_encoder, hq_palette_size)
TEST(sixel_encoder, transparency)
TEST(sixel_encoder, concurrent_encode)
}
