#include "vtcore/image/hq_sixel_encoder.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/tree/tree_map.h"
#include "di/container/view/prelude.h"
#include "di/math/prelude.h"
#include "di/vocab/array/prelude.h"
#include "dius/thread.h"

namespace vtcore::image {
namespace {
// Colors in this file are 0xRRGGBB with each channel in the sixel 0-100 range.
constexpr auto sixel_black = sixel_rgb(0, 0, 0);
constexpr auto sixel_white = sixel_rgb(100, 100, 100);

// Squared distance from black or white below which a palette entry is snapped to it.
constexpr auto snap_distance = 1000;

constexpr auto max_distance = i32(0x7fffffff);

// Pixels sampled from each stride of the image when building the palette.
constexpr auto sample_run = 4_usize;

constexpr auto channel(u32 color, u32 shift) -> i32 {
    return i32((color >> shift) & 0xff);
}

constexpr auto distance_squared(u32 color, i32 r, i32 g, i32 b) -> i32 {
    auto dr = channel(color, 16) - r;
    auto dg = channel(color, 8) - g;
    auto db = channel(color, 0) - b;
    return dr * dr + dg * dg + db * db;
}

struct ColorCount {
    u32 color { 0 };
    u32 count { 0 };
};

struct Bucket {
    di::Vector<ColorCount> colors;

    auto widest_channel() const -> u32 {
        auto widest = 0_u32;
        auto widest_range = -1;
        for (auto shift : di::Array { 16_u32, 8_u32, 0_u32 }) {
            auto min = 255;
            auto max = 0;
            for (auto const& entry : colors) {
                min = di::min(min, channel(entry.color, shift));
                max = di::max(max, channel(entry.color, shift));
            }
            if (max - min > widest_range) {
                widest = shift;
                widest_range = max - min;
            }
        }
        return widest;
    }

    // Sort along the widest channel and move the upper half into a new bucket.
    auto split() -> Bucket {
        auto shift = widest_channel();
        di::sort(colors, di::compare, [&](ColorCount const& entry) {
            return channel(entry.color, shift);
        });

        auto result = Bucket {};
        auto half = colors.size() / 2;
        for (auto i : di::range(half, colors.size())) {
            result.colors.push_back(colors[i]);
        }
        while (colors.size() > half) {
            (void) colors.pop_back();
        }
        return result;
    }

    auto average() const -> u32 {
        auto totals = di::Array<u64, 3> {};
        auto count = 0_u64;
        for (auto const& entry : colors) {
            totals[0] += u64(entry.count) * u64(channel(entry.color, 16));
            totals[1] += u64(entry.count) * u64(channel(entry.color, 8));
            totals[2] += u64(entry.count) * u64(channel(entry.color, 0));
            count += entry.count;
        }
        if (count == 0) {
            return sixel_black;
        }
        return sixel_rgb(u32(totals[0] / count), u32(totals[1] / count), u32(totals[2] / count));
    }
};

// Nearest color search over a palette sorted by its projection onto the first
// principal component. Since projecting onto an axis never increases distances,
// the search stops once the projected distance alone exceeds the best match.
class PaletteSearch {
public:
    explicit PaletteSearch(di::Vector<u32> const& palette) {
        compute_axis(palette);
        for (auto i : di::range(palette.size())) {
            auto color = palette[i];
            m_entries.push_back({ project(channel(color, 16), channel(color, 8), channel(color, 0)), u16(i), color });
        }
        di::sort(m_entries, di::compare, &Entry::projection);
    }

    auto nearest(i32 r, i32 g, i32 b) const -> u16 {
        auto projection = project(r, g, b);
        auto const* start = di::lower_bound(m_entries, projection, di::compare, &Entry::projection);
        auto start_index = usize(start - m_entries.data());

        auto best_index = u16(0);
        auto best_distance = max_distance;
        auto visit = [&](Entry const& entry) -> bool {
            auto delta = entry.projection - projection;
            if (delta * delta > m_axis_length_squared * double(best_distance)) {
                return false;
            }
            auto distance = distance_squared(entry.color, r, g, b);
            if (distance < best_distance) {
                best_distance = distance;
                best_index = entry.index;
            }
            return true;
        };

        for (auto i = start_index; i < m_entries.size(); i++) {
            if (!visit(m_entries[i])) {
                break;
            }
        }
        for (auto i = start_index; i > 0; i--) {
            if (!visit(m_entries[i - 1])) {
                break;
            }
        }
        return best_index;
    }

private:
    struct Entry {
        double projection { 0 };
        u16 index { 0 };
        u32 color { 0 };
    };

    auto project(i32 r, i32 g, i32 b) const -> double {
        return m_axis[0] * r + m_axis[1] * g + m_axis[2] * b;
    }

    // Find the dominant eigenvector of the color covariance matrix by power iteration.
    void compute_axis(di::Vector<u32> const& palette) {
        auto mean = di::Array<double, 3> {};
        for (auto color : palette) {
            mean[0] += channel(color, 16);
            mean[1] += channel(color, 8);
            mean[2] += channel(color, 0);
        }
        for (auto& value : mean) {
            value /= double(palette.size());
        }

        auto covariance = di::Array<di::Array<double, 3>, 3> {};
        for (auto color : palette) {
            auto centered = di::Array<double, 3> { channel(color, 16) - mean[0], channel(color, 8) - mean[1],
                                                   channel(color, 0) - mean[2] };
            for (auto i : di::range(3zu)) {
                for (auto j : di::range(3zu)) {
                    covariance[i][j] += centered[i] * centered[j];
                }
            }
        }

        auto axis = di::Array<double, 3> { 1.0, 1.0, 1.0 };
        for (auto _ : di::range(32)) {
            auto next = di::Array<double, 3> {};
            for (auto i : di::range(3zu)) {
                for (auto j : di::range(3zu)) {
                    next[i] += covariance[i][j] * axis[j];
                }
            }
            auto largest = 0.0;
            for (auto value : next) {
                largest = di::max(largest, value < 0 ? -value : value);
            }
            if (largest == 0.0) {
                break;
            }
            for (auto i : di::range(3zu)) {
                axis[i] = next[i] / largest;
            }
        }

        m_axis = axis;
        m_axis_length_squared = axis[0] * axis[0] + axis[1] * axis[1] + axis[2] * axis[2];
    }

    di::Vector<Entry> m_entries;
    di::Array<double, 3> m_axis { 1.0, 1.0, 1.0 };
    double m_axis_length_squared { 3.0 };
};

struct BandGroup {
    u32 first_row { 0 };
    u32 rows { 0 };
    di::String text;
    di::Vector<u8> used;
};

// The input pixels converted to the sixel color space. Transparent pixels are marked
// separately so that no error is diffused into them.
struct SixelPixels {
    u32 width { 0 };
    u32 height { 0 };
    di::Vector<u32> colors;
    di::Vector<u8> transparent;
};

auto build_palette(SixelPixels const& pixels, u32 palette_size) -> di::Vector<u32> {
    // Sample runs of pixels spread uniformly through the image.
    auto total = pixels.colors.size();
    auto stride = total > sample_run * palette_size ? total / palette_size : 0;

    auto counts = di::TreeMap<u32, u32> {};
    for (auto start = 0zu; start < total; start += stride ? stride : total) {
        auto end = stride ? di::min(start + sample_run, total) : total;
        for (auto i : di::range(start, end)) {
            if (pixels.transparent[i]) {
                continue;
            }
            auto color = pixels.colors[i];
            if (auto count = counts.at(color); count.has_value()) {
                ++count.value();
            } else {
                counts.insert_or_assign(color, 1_u32);
            }
        }
    }

    auto bucket = Bucket {};
    for (auto const& [color, count] : counts) {
        bucket.colors.push_back({ color, count });
    }

    // Every color was seen and they all fit, so use them directly.
    if (stride == 0 && bucket.colors.size() <= palette_size) {
        auto result = di::Vector<u32> {};
        for (auto const& entry : bucket.colors) {
            result.push_back(entry.color);
        }
        if (result.empty()) {
            result.push_back(sixel_black);
        }
        return result;
    }

    auto buckets = di::Vector<Bucket> {};
    buckets.push_back(di::move(bucket));
    while (buckets.size() < palette_size) {
        auto count = buckets.size();
        for (auto i : di::range(count)) {
            auto upper = buckets[i].split();
            buckets.push_back(di::move(upper));
        }
    }

    auto result = di::Vector<u32> {};
    auto darkest = di::Optional<usize> {};
    auto darkest_magnitude = max_distance;
    auto lightest = di::Optional<usize> {};
    auto lightest_distance = max_distance;
    for (auto const& entry : buckets) {
        if (entry.colors.empty()) {
            continue;
        }
        auto color = entry.average();
        auto magnitude = distance_squared(color, 0, 0, 0);
        auto from_white = distance_squared(color, 100, 100, 100);
        if (magnitude < snap_distance && magnitude < darkest_magnitude) {
            darkest = result.size();
            darkest_magnitude = magnitude;
        } else if (from_white < snap_distance && from_white < lightest_distance) {
            lightest = result.size();
            lightest_distance = from_white;
        }
        result.push_back(color);
    }
    if (darkest.has_value()) {
        result[darkest.value()] = sixel_black;
    }
    if (lightest.has_value()) {
        result[lightest.value()] = sixel_white;
    }
    if (result.empty()) {
        result.push_back(sixel_black);
    }
    return result;
}

// Map the rows of one band group to palette indices, diffusing the quantization error
// of each pixel into its unvisited neighbors within the group.
void dither_and_encode(SixelPixels const& pixels, PaletteSearch const& search, di::Vector<u32> const& palette,
                       BandGroup& group) {
    auto width = pixels.width;
    auto offset = usize(group.first_row) * width;
    auto count = usize(group.rows) * width;

    auto work = di::Vector<i32> {};
    work.reserve(count * 3);
    for (auto i : di::range(offset, offset + count)) {
        work.push_back(channel(pixels.colors[i], 16));
        work.push_back(channel(pixels.colors[i], 8));
        work.push_back(channel(pixels.colors[i], 0));
    }

    auto indices = di::repeat(sixel_transparent_index, count) | di::to<di::Vector>();
    auto diffuse = [&](u32 x, u32 y, di::Array<i32, 3> const& error, i32 weight) {
        auto i = usize(y) * width + x;
        if (pixels.transparent[offset + i]) {
            return;
        }
        for (auto c : di::range(3zu)) {
            work[i * 3 + c] += error[c] * weight / 16;
        }
    };

    for (auto y : di::range(group.rows)) {
        for (auto x : di::range(width)) {
            auto i = usize(y) * width + x;
            if (pixels.transparent[offset + i]) {
                continue;
            }

            auto r = di::clamp(work[i * 3], 0, 100);
            auto g = di::clamp(work[i * 3 + 1], 0, 100);
            auto b = di::clamp(work[i * 3 + 2], 0, 100);
            auto index = search.nearest(r, g, b);
            indices[i] = index;

            auto chosen = palette[index];
            auto error = di::Array { r - channel(chosen, 16), g - channel(chosen, 8), b - channel(chosen, 0) };
            if (x + 1 < width) {
                diffuse(x + 1, y, error, 7);
            }
            if (y + 1 < group.rows) {
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

    group.used = di::repeat(u8(0), palette.size()) | di::to<di::Vector>();
    group.text = write_sixel_bands(indices.span(), width, group.rows, group.used.span());
}
}

auto HqSixelEncoder::palette_size_for(u32 color_count) -> u32 {
    auto target = di::clamp(color_count, min_palette_size, max_palette_size);
    auto result = min_palette_size;
    while (result * 2 <= target) {
        result *= 2;
    }
    return result;
}

auto HqSixelEncoder::encode(Image const& image, u32 color_count, Size const& cell_size) const -> EncodedSixel {
    if (image.empty()) {
        return {};
    }

    auto pixels = SixelPixels { image.width, image.height, {}, {} };
    pixels.colors.reserve(image.pixels.size());
    pixels.transparent.reserve(image.pixels.size());
    for (auto pixel : image.pixels) {
        auto transparent = alpha(pixel) < sixel_alpha_threshold;
        if (transparent && !m_allow_transparent) {
            pixel = argb(0, 0, 0);
            transparent = false;
        }
        pixels.colors.push_back(
            sixel_rgb(to_sixel_channel(red(pixel)), to_sixel_channel(green(pixel)), to_sixel_channel(blue(pixel))));
        pixels.transparent.push_back(transparent ? 1 : 0);
    }

    auto palette = build_palette(pixels, palette_size_for(color_count));
    auto search = PaletteSearch(palette);

    // Split the image into groups of whole bands, one per worker.
    auto bands = di::divide_round_up(image.height, 6_u32);
    auto group_count = di::min(m_worker_count, bands);
    auto bands_per_group = di::divide_round_up(bands, group_count);

    auto groups = di::Vector<BandGroup> {};
    for (auto first_band = 0_u32; first_band < bands; first_band += bands_per_group) {
        auto first_row = first_band * 6;
        auto rows = di::min(bands_per_group * 6, image.height - first_row);
        groups.push_back({ first_row, rows, {}, {} });
    }

    // The calling thread handles the first group. If a worker can't be started, its
    // group is handled on the calling thread as well.
    auto threads = di::Vector<dius::Thread> {};
    auto inline_groups = di::Vector<usize> {};
    inline_groups.push_back(0);
    for (auto i : di::range(1zu, groups.size())) {
        auto thread = dius::Thread::create([&pixels, &search, &palette, &group = groups[i]] {
            dither_and_encode(pixels, search, palette, group);
        });
        if (!thread.has_value()) {
            inline_groups.push_back(i);
            continue;
        }
        threads.push_back(di::move(thread).value());
    }
    for (auto i : inline_groups) {
        dither_and_encode(pixels, search, palette, groups[i]);
    }
    for (auto& thread : threads) {
        (void) thread.join();
    }

    auto used = di::repeat(u8(0), palette.size()) | di::to<di::Vector>();
    auto text = ""_s;
    for (auto const& group : groups) {
        if (group.first_row > 0) {
            text.push_back(U'-');
        }
        text += group.text;
        for (auto i : di::range(used.size())) {
            used[i] |= group.used[i];
        }
    }
    return write_sixel(image.width, image.height, palette.span(), used.span(), text, cell_size);
}
}
