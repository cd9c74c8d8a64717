#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "vtcore/image/image.h"

namespace vtcore::image {
/// @brief The set of glyphs used to approximate an image with text
enum class GlyphSet {
    Solid,        ///< A space with the average color as background
    Halves,       ///< Left, right, upper and lower half blocks
    Quadrants,    ///< Quadrant blocks, U+2596 - U+259F
    Sextants,     ///< Sextant blocks, U+1FB00 - U+1FB3B
    Braille,      ///< 6 dot braille in the average color on black
    SolidBraille, ///< 6 dot braille with both colors
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<GlyphSet>) {
    using enum GlyphSet;
    return di::make_enumerators<"GlyphSet">(di::enumerator<"Solid", Solid>, di::enumerator<"Halves", Halves>,
                                            di::enumerator<"Quadrants", Quadrants>,
                                            di::enumerator<"Sextants", Sextants>, di::enumerator<"Braille", Braille>,
                                            di::enumerator<"SolidBraille", SolidBraille>);
}

struct GlyphCell {
    c32 code_point { U' ' };
    u32 foreground { 0 }; ///< 0xRRGGBB
    u32 background { 0 }; ///< 0xRRGGBB

    auto operator==(GlyphCell const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<GlyphCell>) {
        return di::make_fields<"GlyphCell">(di::field<"code_point", &GlyphCell::code_point>,
                                            di::field<"foreground", &GlyphCell::foreground>,
                                            di::field<"background", &GlyphCell::background>);
    }
};

struct GlyphImage {
    u32 rows { 0 };
    u32 columns { 0 };
    di::Vector<GlyphCell> cells;

    auto cell(u32 row, u32 col) const -> GlyphCell const& { return cells[usize(row) * columns + col]; }

    // Text using true color SGR sequences. Attributes are reset before each line break.
    auto to_ansi() const -> di::String;
};

/// @brief Approximate the pixels of a single text cell with one glyph
///
/// Transparent pixels are treated as black. The result only depends on the pixels
/// and the glyph set.
auto encode_glyph(Image const& cell, GlyphSet glyph_set) -> GlyphCell;

/// @brief Approximate an image with one glyph per text cell
///
/// The image covers ceil(width / cell_width) by ceil(height / cell_height) cells.
/// Cells on the right and bottom edges are padded with black.
auto encode_glyphs(Image const& image, GlyphSet glyph_set, u32 cell_width, u32 cell_height) -> GlyphImage;
}
