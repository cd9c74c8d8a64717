#include "vtcore/image/simple_sixel_encoder.h"

#include "di/container/view/prelude.h"
#include "di/math/prelude.h"
#include "di/vocab/array/prelude.h"

namespace vtcore::image {
// Levels per channel, chosen as the largest cube which fits the color count.
static auto cube_levels(u32 color_count) -> di::Array<u32, 3> {
    constexpr auto max_levels = di::Array<u32, 3> { 6, 7, 6 };
    constexpr auto growth_order = di::Array<usize, 3> { 1, 0, 2 };

    auto levels = di::Array<u32, 3> { 2, 2, 2 };
    for (auto grew = true; grew;) {
        grew = false;
        for (auto channel : growth_order) {
            if (levels[channel] == max_levels[channel]) {
                continue;
            }
            auto next = levels;
            next[channel]++;
            if (next[0] * next[1] * next[2] <= color_count) {
                levels = next;
                grew = true;
            }
        }
    }
    return levels;
}

static auto quantize(u8 value, u32 levels) -> u32 {
    return (u32(value) * (levels - 1) + 127) / 255;
}

static auto percent(u32 level, u32 levels) -> u32 {
    return (level * 100 + (levels - 1) / 2) / (levels - 1);
}

static auto luma(u32 pixel) -> u8 {
    return u8((u32(red(pixel)) * 299 + u32(green(pixel)) * 587 + u32(blue(pixel)) * 114) / 1000);
}

auto SimpleSixelEncoder::encode(Image const& image, u32 color_count, Size const& cell_size) const -> EncodedSixel {
    if (image.empty()) {
        return {};
    }

    // Too few colors for the smallest cube get a ramp of grays instead.
    auto gray_levels = color_count < min_cube_colors ? di::max(color_count, 2_u32) : 0_u32;
    auto levels = cube_levels(color_count);

    auto palette = di::Vector<u32> {};
    if (gray_levels) {
        for (auto level : di::range(gray_levels)) {
            auto value = percent(level, gray_levels);
            palette.push_back(sixel_rgb(value, value, value));
        }
    } else {
        for (auto r : di::range(levels[0])) {
            for (auto g : di::range(levels[1])) {
                for (auto b : di::range(levels[2])) {
                    palette.push_back(sixel_rgb(percent(r, levels[0]), percent(g, levels[1]), percent(b, levels[2])));
                }
            }
        }
    }

    auto indices = di::Vector<u16> {};
    indices.reserve(image.pixels.size());
    for (auto pixel : image.pixels) {
        if (alpha(pixel) < sixel_alpha_threshold) {
            if (m_allow_transparent) {
                indices.push_back(sixel_transparent_index);
                continue;
            }
            pixel = argb(0, 0, 0);
        }
        if (gray_levels) {
            indices.push_back(u16(quantize(luma(pixel), gray_levels)));
            continue;
        }
        auto r = quantize(red(pixel), levels[0]);
        auto g = quantize(green(pixel), levels[1]);
        auto b = quantize(blue(pixel), levels[2]);
        indices.push_back(u16((r * levels[1] + g) * levels[2] + b));
    }

    auto used = di::repeat(u8(0), palette.size()) | di::to<di::Vector>();
    auto bands = write_sixel_bands(indices.span(), image.width, image.height, used.span());
    return write_sixel(image.width, image.height, palette.span(), used.span(), bands, cell_size);
}
}
