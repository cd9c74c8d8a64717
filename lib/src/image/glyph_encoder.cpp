#include "vtcore/image/glyph_encoder.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/tree/tree_map.h"
#include "di/container/view/prelude.h"
#include "di/format/prelude.h"
#include "di/math/prelude.h"
#include "di/vocab/array/prelude.h"

namespace vtcore::image {
namespace {
struct Region {
    u32 x0 { 0 };
    u32 y0 { 0 };
    u32 x1 { 0 };
    u32 y1 { 0 };

    auto area() const -> u32 { return (x1 - x0) * (y1 - y0); }
};

constexpr auto quadrant_glyphs = di::Array<c32, 16> {
    U' ',    U'▘', U'▝', U'▀', U'▖', U'▌', U'▞', U'▛',
    U'▗', U'▚', U'▐', U'▜', U'▄', U'▙', U'▟', U'█',
};

constexpr auto channel(u32 color, u32 shift) -> i32 {
    return i32((color >> shift) & 0xff);
}

constexpr auto rgb(i32 r, i32 g, i32 b) -> u32 {
    return (u32(r) << 16) | (u32(g) << 8) | u32(b);
}

// Anything not fully opaque is drawn as black.
constexpr auto opaque_color(u32 pixel) -> u32 {
    return alpha(pixel) == 0xff ? pixel & 0xffffff : 0;
}

auto average(Image const& cell, Region const& region) -> u32 {
    if (region.area() == 0) {
        return 0;
    }
    auto totals = di::Array<u64, 3> {};
    for (auto y : di::range(region.y0, region.y1)) {
        for (auto x : di::range(region.x0, region.x1)) {
            auto color = opaque_color(cell.pixel(x, y));
            totals[0] += u64(channel(color, 16));
            totals[1] += u64(channel(color, 8));
            totals[2] += u64(channel(color, 0));
        }
    }
    auto count = u64(region.area());
    return rgb(i32(totals[0] / count), i32(totals[1] / count), i32(totals[2] / count));
}

auto squared_error(Image const& cell, Region const& region, u32 color) -> u64 {
    auto result = 0_u64;
    for (auto y : di::range(region.y0, region.y1)) {
        for (auto x : di::range(region.x0, region.x1)) {
            auto pixel = opaque_color(cell.pixel(x, y));
            for (auto shift : di::Array { 16_u32, 8_u32, 0_u32 }) {
                auto delta = i64(channel(pixel, shift) - channel(color, shift));
                result += u64(delta * delta);
            }
        }
    }
    return result;
}

// Split the colors of the cell in two by median cut along the widest channel.
auto two_colors(Image const& cell) -> di::Array<u32, 2> {
    auto counts = di::TreeMap<u32, u32> {};
    for (auto pixel : cell.pixels) {
        auto color = opaque_color(pixel);
        if (auto count = counts.at(color); count.has_value()) {
            ++count.value();
        } else {
            counts.insert_or_assign(color, 1_u32);
        }
    }

    struct Entry {
        u32 color;
        u32 count;
    };
    auto entries = di::Vector<Entry> {};
    for (auto const& [color, count] : counts) {
        entries.push_back({ color, count });
    }

    auto widest = 0_u32;
    auto widest_range = -1;
    for (auto shift : di::Array { 16_u32, 8_u32, 0_u32 }) {
        auto min = 255;
        auto max = 0;
        for (auto const& entry : entries) {
            min = di::min(min, channel(entry.color, shift));
            max = di::max(max, channel(entry.color, shift));
        }
        if (max - min > widest_range) {
            widest = shift;
            widest_range = max - min;
        }
    }
    di::sort(entries, di::compare, [&](Entry const& entry) {
        return channel(entry.color, widest);
    });

    auto average_of = [&](usize start, usize end) -> u32 {
        auto totals = di::Array<u64, 3> {};
        auto total_count = 0_u64;
        for (auto i : di::range(start, end)) {
            auto const& entry = entries[i];
            totals[0] += u64(entry.count) * u64(channel(entry.color, 16));
            totals[1] += u64(entry.count) * u64(channel(entry.color, 8));
            totals[2] += u64(entry.count) * u64(channel(entry.color, 0));
            total_count += entry.count;
        }
        if (total_count == 0) {
            return 0;
        }
        return rgb(i32(totals[0] / total_count), i32(totals[1] / total_count), i32(totals[2] / total_count));
    };

    auto half = entries.size() / 2;
    return { average_of(0, half), average_of(half, entries.size()) };
}

// Map every pixel to one of the 2 colors with error diffusion. A pixel is set in the
// result when it maps to the second color.
auto dither(Image const& cell, di::Array<u32, 2> const& colors) -> di::Vector<u8> {
    auto width = cell.width;
    auto height = cell.height;

    auto work = di::Vector<i32> {};
    work.reserve(cell.pixels.size() * 3);
    for (auto pixel : cell.pixels) {
        auto color = opaque_color(pixel);
        work.push_back(channel(color, 16));
        work.push_back(channel(color, 8));
        work.push_back(channel(color, 0));
    }

    auto diffuse = [&](u32 x, u32 y, di::Array<i32, 3> const& error, i32 weight) {
        auto i = (usize(y) * width + x) * 3;
        for (auto c : di::range(3zu)) {
            work[i + c] += error[c] * weight / 16;
        }
    };

    auto result = di::repeat(u8(0), cell.pixels.size()) | di::to<di::Vector>();
    for (auto y : di::range(height)) {
        for (auto x : di::range(width)) {
            auto i = usize(y) * width + x;
            auto r = di::clamp(work[i * 3], 0, 255);
            auto g = di::clamp(work[i * 3 + 1], 0, 255);
            auto b = di::clamp(work[i * 3 + 2], 0, 255);

            auto distance = [&](u32 color) {
                auto dr = r - channel(color, 16);
                auto dg = g - channel(color, 8);
                auto db = b - channel(color, 0);
                return dr * dr + dg * dg + db * db;
            };
            auto index = distance(colors[1]) < distance(colors[0]) ? 1 : 0;
            result[i] = u8(index);

            auto chosen = colors[index];
            auto error = di::Array { r - channel(chosen, 16), g - channel(chosen, 8), b - channel(chosen, 0) };
            if (x + 1 < width) {
                diffuse(x + 1, y, error, 7);
            }
            if (y + 1 < height) {
                if (x > 0) {
                    diffuse(x - 1, y + 1, error, 3);
                }
                diffuse(x, y + 1, error, 5);
                if (x + 1 < width) {
                    diffuse(x + 1, y + 1, error, 1);
                }
            }
        }
    }
    return result;
}

// A region counts as foreground when more than half of its pixels are set.
auto covered(di::Vector<u8> const& bitmap, u32 width, Region const& region) -> bool {
    auto count = 0_u32;
    for (auto y : di::range(region.y0, region.y1)) {
        for (auto x : di::range(region.x0, region.x1)) {
            count += bitmap[usize(y) * width + x];
        }
    }
    return count * 2 > region.area();
}

// Bits are: top left 1, top right 2, bottom left 4, bottom right 8.
auto quadrant_mask(di::Vector<u8> const& bitmap, u32 width, u32 height) -> u32 {
    auto mx = width / 2;
    auto my = height / 2;
    auto mask = 0_u32;
    mask |= covered(bitmap, width, { 0, 0, mx, my }) ? 1 : 0;
    mask |= covered(bitmap, width, { mx, 0, width, my }) ? 2 : 0;
    mask |= covered(bitmap, width, { 0, my, mx, height }) ? 4 : 0;
    mask |= covered(bitmap, width, { mx, my, width, height }) ? 8 : 0;
    return mask;
}

// The 6 dot regions, in row major order: top left, top right, middle left, middle
// right, bottom left, bottom right.
auto dot_coverage(di::Vector<u8> const& bitmap, u32 width, u32 height) -> di::Array<bool, 6> {
    auto mx = width / 2;
    auto y1 = height / 3;
    auto y2 = height * 2 / 3;
    return {
        covered(bitmap, width, { 0, 0, mx, y1 }),      covered(bitmap, width, { mx, 0, width, y1 }),
        covered(bitmap, width, { 0, y1, mx, y2 }),     covered(bitmap, width, { mx, y1, width, y2 }),
        covered(bitmap, width, { 0, y2, mx, height }), covered(bitmap, width, { mx, y2, width, height }),
    };
}

auto sextant_glyph(di::Array<bool, 6> const& dots) -> c32 {
    // Sextant numbering follows reading order.
    auto value = 0_u32;
    for (auto i : di::range(6_u32)) {
        if (dots[i]) {
            value |= 1 << i;
        }
    }

    // The sextant block skips the patterns which already exist as half blocks.
    switch (value) {
        case 0:
            return U' ';
        case 21:
            return U'▌';
        case 42:
            return U'▐';
        case 63:
            return U'█';
        default:
            return c32(0x1fb00 + value - 1 - (value > 21 ? 1 : 0) - (value > 42 ? 1 : 0));
    }
}

auto braille_glyph(di::Array<bool, 6> const& dots) -> c32 {
    // Braille dots 1-3 are the left column, and 4-6 the right column.
    constexpr auto dot_bits = di::Array<u32, 6> { 0x01, 0x08, 0x02, 0x10, 0x04, 0x20 };
    auto value = 0_u32;
    for (auto i : di::range(6zu)) {
        if (dots[i]) {
            value |= dot_bits[i];
        }
    }
    return c32(0x2800 + value);
}

auto half_glyph(Image const& cell) -> GlyphCell {
    auto width = cell.width;
    auto height = cell.height;
    auto all = Region { 0, 0, width, height };

    auto full_color = average(cell, all);
    auto best = GlyphCell { U'█', full_color, full_color };
    auto best_error = squared_error(cell, all, full_color);

    auto consider = [&](c32 code_point, Region const& foreground, Region const& background) {
        auto fg = average(cell, foreground);
        auto bg = average(cell, background);
        auto error = squared_error(cell, foreground, fg) + squared_error(cell, background, bg);
        if (error < best_error) {
            best = { code_point, fg, bg };
            best_error = error;
        }
    };

    consider(U'▌', { 0, 0, width / 2, height }, { width / 2, 0, width, height });
    consider(U'▀', { 0, 0, width, height / 2 }, { 0, height / 2, width, height });
    return best;
}
}

auto encode_glyph(Image const& cell, GlyphSet glyph_set) -> GlyphCell {
    if (cell.empty()) {
        return {};
    }

    if (glyph_set == GlyphSet::Solid) {
        auto color = average(cell, { 0, 0, cell.width, cell.height });
        return { U' ', color, color };
    }
    if (glyph_set == GlyphSet::Halves) {
        return half_glyph(cell);
    }

    auto colors = two_colors(cell);
    auto bitmap = dither(cell, colors);

    switch (glyph_set) {
        case GlyphSet::Quadrants:
            return { quadrant_glyphs[quadrant_mask(bitmap, cell.width, cell.height)], colors[1], colors[0] };
        case GlyphSet::Sextants:
            return { sextant_glyph(dot_coverage(bitmap, cell.width, cell.height)), colors[1], colors[0] };
        case GlyphSet::Braille: {
            auto mixed = rgb((channel(colors[0], 16) + channel(colors[1], 16)) / 2,
                             (channel(colors[0], 8) + channel(colors[1], 8)) / 2,
                             (channel(colors[0], 0) + channel(colors[1], 0)) / 2);
            return { braille_glyph(dot_coverage(bitmap, cell.width, cell.height)), mixed, 0 };
        }
        case GlyphSet::SolidBraille:
            return { braille_glyph(dot_coverage(bitmap, cell.width, cell.height)), colors[1], colors[0] };
        default:
            return {};
    }
}

auto encode_glyphs(Image const& image, GlyphSet glyph_set, u32 cell_width, u32 cell_height) -> GlyphImage {
    if (image.empty() || cell_width == 0 || cell_height == 0) {
        return {};
    }

    auto result = GlyphImage {};
    result.columns = di::divide_round_up(image.width, cell_width);
    result.rows = di::divide_round_up(image.height, cell_height);
    result.cells.reserve(usize(result.rows) * result.columns);

    for (auto row : di::range(result.rows)) {
        for (auto col : di::range(result.columns)) {
            auto x0 = col * cell_width;
            auto y0 = row * cell_height;
            auto width = di::min(cell_width, image.width - x0);
            auto height = di::min(cell_height, image.height - y0);

            // Edge cells are padded with black to the full cell size.
            auto cell = Image::create(cell_width, cell_height, argb(0, 0, 0));
            for (auto y : di::range(height)) {
                for (auto x : di::range(width)) {
                    cell.set_pixel(x, y, image.pixel(x0 + x, y0 + y));
                }
            }
            result.cells.push_back(encode_glyph(cell, glyph_set));
        }
    }
    return result;
}

auto GlyphImage::to_ansi() const -> di::String {
    auto result = ""_s;
    for (auto row : di::range(rows)) {
        if (row > 0) {
            result += "\033[m\n"_sv;
        }
        for (auto col : di::range(columns)) {
            auto const& glyph = cell(row, col);
            result += *di::present("\033[48;2;{};{};{}m\033[38;2;{};{};{}m"_sv, channel(glyph.background, 16),
                                   channel(glyph.background, 8), channel(glyph.background, 0),
                                   channel(glyph.foreground, 16), channel(glyph.foreground, 8),
                                   channel(glyph.foreground, 0));
            result.push_back(glyph.code_point);
        }
    }
    return result;
}
}
