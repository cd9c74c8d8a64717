#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "vtcore/graphics_rendition.h"

namespace vtcore::terminal {
/// @brief Represents the current cursor position of the terminal.
struct Cursor {
    u32 row { 0 };                   ///< Row (y coordinate)
    u32 col { 0 };                   ///< Column (x coordinate)
    bool overflow_pending { false }; ///< Signals that the previous text outputted reached the end of a row.
    bool hidden { false };           ///< Set via DECTCEM

    auto operator==(Cursor const&) const -> bool = default;
    auto operator<=>(Cursor const&) const = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Cursor>) {
        return di::make_fields<"Cursor">(di::field<"row", &Cursor::row>, di::field<"col", &Cursor::col>,
                                         di::field<"overflow_pending", &Cursor::overflow_pending>,
                                         di::field<"hidden", &Cursor::hidden>);
    }
};

/// @brief Whether or not auto-wrap (DEC mode 7) is enabled.
enum class AutoWrapMode {
    Disabled,
    Enabled,
};

/// @brief Whether or not origin mode (DEC mode 6) is enabled.
///
/// When origin mode is enabled, the cursor is constrained to be
/// within the scroll region of the screen. Additionally, all row
/// indicies are relative to the top of the scroll region when origin
/// is enabled.
enum class OriginMode {
    Disabled,
    Enabled,
};

/// @brief Represents the saved cursor state, which is used for save/restore cursor operations.
///
/// The attributes which are saved and restored are defined in the [manual](https://vt100.net/docs/vt510-rm/DECSC.html)
/// for the DECSC escape sequence.
struct SavedCursor {
    u32 row { 0 };                                   ///< Row (y coordinate)
    u32 col { 0 };                                   ///< Column (x coordinate)
    bool overflow_pending { false };                 ///< Signals that the previous text outputted reached the end of a row.
    GraphicsRendition graphics_rendition {};         ///< Active graphics rendition
    bool protected_ { false };                       ///< Active character protection attribute
    OriginMode origin_mode { OriginMode::Disabled }; ///< Origin mode

    auto operator==(SavedCursor const&) const -> bool = default;
};
}
