#include "vtcore/image/sixel_encoder.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/view/prelude.h"
#include "di/format/prelude.h"
#include "di/math/prelude.h"

namespace vtcore::image {
static void write_run(di::String& output, u32 data, u32 count) {
    auto ch = c32(data + 63);
    if (count >= 3) {
        output += *di::present("!{}"_sv, count);
        output.push_back(ch);
        return;
    }
    for (auto _ : di::range(count)) {
        output.push_back(ch);
    }
}

auto write_sixel_bands(di::Span<u16 const> indices, u32 width, u32 rows, di::Span<u8> used) -> di::String {
    auto output = ""_s;
    auto data = di::repeat(0_u32, width) | di::to<di::Vector>();

    for (auto band_start = 0_u32; band_start < rows; band_start += 6) {
        if (band_start > 0) {
            output.push_back(U'-');
        }
        auto band_rows = di::min(6_u32, rows - band_start);

        // Find the colors present in this band.
        auto colors = di::Vector<u16> {};
        for (auto y : di::range(band_start, band_start + band_rows)) {
            for (auto x : di::range(width)) {
                auto index = indices[usize(y) * width + x];
                if (index != sixel_transparent_index && !di::contains(colors, index)) {
                    colors.push_back(index);
                }
            }
        }

        for (auto color : colors) {
            used[color] = 1;

            for (auto& value : data) {
                value = 0;
            }
            for (auto dy : di::range(band_rows)) {
                auto const* row = &indices[usize(band_start + dy) * width];
                for (auto x : di::range(width)) {
                    if (row[x] == color) {
                        data[x] |= 1 << dy;
                    }
                }
            }

            // Return to the start of the band and select the color.
            output += *di::present("$#{}"_sv, color);

            // Runs of empty sixels at the end of the line are dropped.
            auto end = width;
            while (end > 0 && data[end - 1] == 0) {
                end--;
            }

            auto run_data = 0_u32;
            auto run_count = 0_u32;
            for (auto x : di::range(end)) {
                if (run_count > 0 && data[x] == run_data) {
                    run_count++;
                    continue;
                }
                write_run(output, run_data, run_count);
                run_data = data[x];
                run_count = 1;
            }
            write_run(output, run_data, run_count);
        }
    }
    return output;
}

auto write_sixel(u32 width, u32 height, di::Span<u32 const> palette, di::Span<u8 const> used,
                 di::StringView bands, Size const& cell_size) -> EncodedSixel {
    // Selecting background mode 1 leaves unpainted pixels transparent.
    auto output = "\033P0;1;0q"_s;
    output += *di::present("\"1;1;{};{}"_sv, width, height);
    for (auto i : di::range(palette.size())) {
        if (!used[i]) {
            continue;
        }
        auto color = palette[i];
        output += *di::present("#{};2;{};{};{}"_sv, i, (color >> 16) & 0xff, (color >> 8) & 0xff, color & 0xff);
    }
    output += bands;
    output += "\033\\"_sv;

    auto rows = cell_size.ypixels ? di::divide_round_up(height, cell_size.ypixels) : 0;
    auto columns = cell_size.xpixels ? di::divide_round_up(width, cell_size.xpixels) : 0;
    return { di::move(output), rows, columns };
}
}
