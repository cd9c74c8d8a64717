#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/static_vector.h"
#include "di/reflect/prelude.h"
#include "di/types/integers.h"
#include "vtcore/graphics_rendition.h"

namespace vtcore::terminal {
/// @brief Reference from a cell to the part of a decoded image it displays
struct ImageTile {
    u32 image_id { 0 }; ///< Id of the image in the screen's image table
    u16 row { 0 };      ///< Row of the tile within the image, in cells
    u16 col { 0 };      ///< Column of the tile within the image, in cells

    auto operator==(ImageTile const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ImageTile>) {
        return di::make_fields<"ImageTile">(di::field<"image_id", &ImageTile::image_id>,
                                            di::field<"row", &ImageTile::row>, di::field<"col", &ImageTile::col>);
    }
};

/// @brief Represents a on-screen terminal cell
///
/// A glyph which is 2 columns wide occupies 2 adjacent cells. The left cell holds
/// the text and has `wide` set, while the right cell is a continuation cell with no
/// text of its own. The screen always creates, moves and erases both halves together.
struct Cell {
    constexpr static auto max_combining = 2zu;

    c32 code_point { 0 }; ///< 0 means the cell is blank
    di::StaticVector<c32, di::Constexpr<max_combining>> combining {};
    GraphicsRendition graphics_rendition {};
    u16 hyperlink_id { 0 }; ///< 0 means none
    di::Optional<ImageTile> image {};
    bool wide { false };              ///< Left half of a 2 column glyph
    bool wide_continuation { false }; ///< Right half of a 2 column glyph
    bool protected_ { false };        ///< Set via DECSCA, and skipped by selective erase

    auto is_blank() const -> bool { return code_point == 0 && !wide_continuation; }
    auto is_wide_half() const -> bool { return wide || wide_continuation; }
    auto width() const -> u32 { return wide_continuation ? 0 : wide ? 2 : 1; }

    // Text of the cell, with blank cells rendered as a single space.
    auto text() const -> di::String;

    auto operator==(Cell const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Cell>) {
        return di::make_fields<"Cell">(
            di::field<"code_point", &Cell::code_point>, di::field<"combining", &Cell::combining>,
            di::field<"graphics_rendition", &Cell::graphics_rendition>,
            di::field<"hyperlink_id", &Cell::hyperlink_id>, di::field<"image", &Cell::image>,
            di::field<"wide", &Cell::wide>, di::field<"wide_continuation", &Cell::wide_continuation>,
            di::field<"protected", &Cell::protected_>);
    }
};
}
