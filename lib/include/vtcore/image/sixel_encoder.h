#pragma once

#include "di/container/string/prelude.h"
#include "di/vocab/span/prelude.h"
#include "vtcore/image/image.h"
#include "vtcore/size.h"

namespace vtcore::image {
struct EncodedSixel {
    di::String data;   ///< Complete DCS sequence, from `ESC P` to `ESC \`
    u32 rows { 0 };    ///< Text rows covered by the image
    u32 columns { 0 }; ///< Text columns covered by the image
};

/// @brief Interface shared by the sixel encoders
///
/// Encoders hold only their immutable configuration. Every call to encode() works on
/// its own state, so a single encoder can be used from any number of threads at once.
class SixelEncoder {
public:
    constexpr static auto default_color_count = 128_u32;

    virtual ~SixelEncoder() = default;

    /// @brief Encode an image as sixel graphics
    ///
    /// @param image The image to encode. Pixels with a low alpha are left unpainted.
    /// @param color_count The maximum number of color registers to use
    /// @param cell_size The pixel size of a text cell (xpixels and ypixels), used to
    ///                  report how many cells the image covers
    virtual auto encode(Image const& image, u32 color_count = default_color_count,
                        Size const& cell_size = {}) const -> EncodedSixel = 0;
};

// Palette index of a pixel which is left unpainted.
constexpr auto sixel_transparent_index = u16(0xffff);

// Pixels with an alpha below this are treated as transparent.
constexpr auto sixel_alpha_threshold = u8(0x66);

// Convert an 8 bit channel to the 0-100 range used by sixel color registers.
constexpr auto to_sixel_channel(u8 value) -> u32 {
    return (u32(value) * 100 + 127) / 255;
}

constexpr auto sixel_rgb(u32 r, u32 g, u32 b) -> u32 {
    return (r << 16) | (g << 8) | b;
}

/// @brief Emit the sixel data for consecutive bands of an indexed image
///
/// @param indices Palette index of every pixel, row major, starting at a band boundary
/// @param width Width of the image
/// @param rows Number of pixel rows in `indices`
/// @param used Flags for every palette entry, set for each color which is emitted
///
/// @return The band data, with bands separated by `-`
auto write_sixel_bands(di::Span<u16 const> indices, u32 width, u32 rows, di::Span<u8> used) -> di::String;

/// @brief Assemble a complete sixel sequence
///
/// @param palette Colors as 0xRRGGBB, with each channel in the 0-100 range
/// @param used Which palette entries are referenced by the bands
/// @param bands The band data from write_sixel_bands()
auto write_sixel(u32 width, u32 height, di::Span<u32 const> palette, di::Span<u8 const> used,
                 di::StringView bands, Size const& cell_size) -> EncodedSixel;
}
