#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "di/vocab/array/prelude.h"

namespace vtcore::image {
enum class SixelPaletteKind {
    VT340,
    CGA,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SixelPaletteKind>) {
    using enum SixelPaletteKind;
    return di::make_enumerators<"SixelPaletteKind">(di::enumerator<"VT340", VT340>, di::enumerator<"CGA", CGA>);
}

/// @brief Sixel color registers
///
/// Registers hold 0xRRGGBB values. Only the first 16 registers have defaults, the
/// rest start out black.
struct SixelPalette {
    constexpr static auto register_count = 1024zu;

    static auto create(SixelPaletteKind kind) -> SixelPalette;

    auto get(u32 index) const -> u32 { return index < register_count ? registers[index] : 0; }
    void set(u32 index, u32 rgb) {
        if (index < register_count) {
            registers[index] = rgb & 0xffffff;
        }
    }

    auto operator==(SixelPalette const&) const -> bool = default;

    di::Array<u32, register_count> registers {};
};
}
