#pragma once

#include "di/container/string/string_view.h"
#include "di/vocab/array/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "vtcore/image/image.h"
#include "vtcore/image/sixel_palette.h"

namespace vtcore::image {
struct DecodedSixel {
    Image image;
    bool transparent { false }; ///< Unpainted pixels have an alpha of 0
};

/// @brief Decoder for sixel graphics
///
/// The input is the body of a sixel DCS sequence: the optional `P1;P2;P3`
/// parameters, the `q` final byte, and the sixel data. Decoding never fails
/// outright. Unknown bytes are skipped, and truncated input or input describing an
/// image larger than the maximum size produces whatever was decoded up to that
/// point.
///
/// Color registers persist across calls to decode(), like they do on a real
/// terminal.
///
/// Reference: https://vt100.net/docs/vt3xx-gp/chapter14.html
class SixelDecoder {
public:
    constexpr static auto max_width = 3840_u32;
    constexpr static auto max_height = 6480_u32;
    constexpr static auto max_repeat = 32767_u32;

    explicit SixelDecoder(SixelPalette palette = SixelPalette::create(SixelPaletteKind::VT340),
                          u32 background = argb(0, 0, 0), bool allow_transparent = false)
        : m_palette(palette), m_background(background), m_allow_transparent(allow_transparent) {}

    /// @brief Decode a sixel payload
    ///
    /// @return The image, or an empty optional if the payload had no sixels.
    auto decode(di::StringView payload) -> di::Optional<DecodedSixel>;

    auto palette() const -> SixelPalette const& { return m_palette; }

private:
    enum class State {
        Init,
        Ground,
        Raster,
        Color,
        Repeat,
    };

    void reset();
    void consume(c32 code_point);
    void finish_command();
    void to_ground();
    void collect_param(c32 code_point);
    auto param(usize index, u32 fallback = 0) const -> u32;

    void parse_init();
    void parse_raster();
    void parse_color();
    void add_sixel(c32 code_point);
    void next_band();
    void reserve(u32 width, u32 height);

    auto fill_pixel() const -> u32;

    SixelPalette m_palette;
    u32 m_background { 0 };
    bool m_allow_transparent { false };

    State m_state { State::Init };
    di::Array<u32, 5> m_params {};
    usize m_param_count { 0 };
    di::Optional<u32> m_repeat;

    Image m_canvas;
    u32 m_color { 0 };
    u32 m_x { 0 };
    u32 m_band { 0 };
    u32 m_width { 0 };
    u32 m_last_row { 0 };
    u32 m_raster_width { 0 };
    u32 m_raster_height { 0 };
    bool m_transparent { false };
    bool m_done { false };
};
}
