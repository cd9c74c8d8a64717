#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "vtcore/image/sixel_palette.h"
#include "vtcore/input_decoder.h"
#include "vtcore/size.h"
#include "vtcore/terminal/scroll_back.h"

namespace vtcore {
/// @brief Settings used to create an engine
///
/// Every field has a usable default, so `EngineConfig {}` describes an 80x24
/// UTF-8 terminal with 10000 rows of scroll back.
struct EngineConfig {
    Size size { 24, 80 };
    usize scroll_back_limit { terminal::ScrollBack::default_limit }; ///< 0 disables the scroll back
    InputEncoding input_encoding { InputEncoding::Utf8 };
    bool telnet { false }; ///< Speak telnet to the host instead of passing bytes through
    image::SixelPaletteKind sixel_palette { image::SixelPaletteKind::VT340 };
    bool allow_transparent_sixel { true };

    // Pixel size of a text cell, used to map images onto cells when the
    // host did not report a pixel size.
    u32 cell_width { 10 };
    u32 cell_height { 20 };

    // Returns the pixel size of a cell, derived from the terminal size when possible.
    auto cell_size() const -> Size {
        if (size.xpixels != 0 && size.ypixels != 0 && !size.empty()) {
            return { 1, 1, size.xpixels / size.cols, size.ypixels / size.rows };
        }
        return { 1, 1, cell_width, cell_height };
    }

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<EngineConfig>) {
        return di::make_fields<"EngineConfig">(
            di::field<"size", &EngineConfig::size>, di::field<"scroll_back_limit", &EngineConfig::scroll_back_limit>,
            di::field<"input_encoding", &EngineConfig::input_encoding>, di::field<"telnet", &EngineConfig::telnet>,
            di::field<"sixel_palette", &EngineConfig::sixel_palette>,
            di::field<"allow_transparent_sixel", &EngineConfig::allow_transparent_sixel>,
            di::field<"cell_width", &EngineConfig::cell_width>, di::field<"cell_height", &EngineConfig::cell_height>);
    }
};
}
