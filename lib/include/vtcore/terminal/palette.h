#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/types/integers.h"
#include "di/vocab/array/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "vtcore/graphics_rendition.h"

namespace vtcore::terminal {
struct Rgb {
    u8 r { 0 };
    u8 g { 0 };
    u8 b { 0 };

    auto operator==(Rgb const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Rgb>) {
        return di::make_fields<"Rgb">(di::field<"r", &Rgb::r>, di::field<"g", &Rgb::g>, di::field<"b", &Rgb::b>);
    }
};

/// @brief Parse an X11 color specification
///
/// Accepts `rgb:R/G/B` where every channel has 1 to 4 hex digits, and the legacy
/// `#RGB` form with 1 to 4 hex digits per channel. Each channel is scaled to 16 bits
/// and then the most significant 8 bits are kept, so `f`, `ff`, `fff` and `ffff` all
/// map to 0xff and `5`, `55`, `555`, `5555` all map to 0x55. Any malformed channel
/// makes the whole specification invalid.
auto parse_color_spec(di::StringView spec) -> di::Optional<Rgb>;

/// @brief Format a color using the 16 bit per channel `rgb:RRRR/GGGG/BBBB` form.
auto format_color_spec(Rgb color) -> di::String;

/// @brief The 256 color palette and default colors of a single terminal
///
/// The palette persists across resizes and screen resets. Only RIS and OSC 104
/// (or explicit calls to reset()) restore the defaults.
class Palette {
public:
    constexpr static auto size = 256zu;

    constexpr static auto default_foreground = Rgb(0xe5, 0xe5, 0xe5);
    constexpr static auto default_background = Rgb(0x00, 0x00, 0x00);

    static auto default_color(u8 index) -> Rgb;

    Palette() { reset(); }

    auto get(u8 index) const -> Rgb { return m_colors[index]; }
    void set(u8 index, Rgb color) { m_colors[index] = color; }
    void reset(u8 index) { m_colors[index] = default_color(index); }
    void reset();

    auto foreground() const -> Rgb { return m_foreground; }
    auto background() const -> Rgb { return m_background; }
    void set_foreground(Rgb color) { m_foreground = color; }
    void set_background(Rgb color) { m_background = color; }
    void reset_foreground() { m_foreground = default_foreground; }
    void reset_background() { m_background = default_background; }

    // Indexed colors go through the palette, true color is returned as is, and the
    // default color maps to the default foreground or background.
    auto resolve(Color color, bool foreground) const -> Rgb;

    auto operator==(Palette const&) const -> bool = default;

private:
    di::Array<Rgb, size> m_colors {};
    Rgb m_foreground { default_foreground };
    Rgb m_background { default_background };
};
}
