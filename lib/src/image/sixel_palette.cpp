#include "vtcore/image/sixel_palette.h"

#include "di/container/view/prelude.h"

namespace vtcore::image {
// Colors as measured on a real VT340.
constexpr auto vt340_colors = di::Array<u32, 16> {
    0x000000, 0x3333cc, 0xcc2323, 0x33cc33, 0xcc33cc, 0x33cccc, 0xcccc33, 0x777777,
    0x444444, 0x565699, 0x994444, 0x569956, 0x995699, 0x569999, 0x999956, 0xcccccc,
};

constexpr auto cga_colors = di::Array<u32, 16> {
    0x000000, 0xa80000, 0x00a800, 0xa85400, 0x0000a8, 0xa800a8, 0x00a8a8, 0xa8a8a8,
    0x545454, 0xfc5454, 0x54fc54, 0xfcfc54, 0x5454fc, 0xfc54fc, 0x54fcfc, 0xfcfcfc,
};

auto SixelPalette::create(SixelPaletteKind kind) -> SixelPalette {
    auto const& colors = kind == SixelPaletteKind::CGA ? cga_colors : vt340_colors;
    auto result = SixelPalette {};
    for (auto i : di::range(colors.size())) {
        result.registers[i] = colors[i];
    }
    return result;
}
}
