#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "dius/tty.h"

namespace vtcore {
/// @brief Terminal dimensions in cells and (optionally) pixels
struct Size {
    u32 rows { 0 };
    u32 cols { 0 };
    u32 xpixels { 0 };
    u32 ypixels { 0 };

    auto as_window_size() const -> dius::tty::WindowSize { return { rows, cols, xpixels, ypixels }; }

    auto empty() const -> bool { return rows == 0 || cols == 0; }

    auto operator==(Size const&) const -> bool = default;
    auto operator<=>(Size const&) const = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Size>) {
        return di::make_fields<"Size">(di::field<"rows", &Size::rows>, di::field<"cols", &Size::cols>,
                                       di::field<"xpixels", &Size::xpixels>, di::field<"ypixels", &Size::ypixels>);
    }
};
}
