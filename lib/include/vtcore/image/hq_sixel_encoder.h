#pragma once

#include "vtcore/image/sixel_encoder.h"

namespace vtcore::image {
/// @brief High quality sixel encoder
///
/// The palette is built from a sample of the image. When the image has no more
/// colors than the palette, the colors are used directly. Otherwise the palette is
/// chosen by median cut, and the darkest and lightest entries are snapped to pure
/// black and white. Nearest color search walks the palette sorted along its first
/// principal component, and quantization error is diffused Floyd-Steinberg style.
///
/// The image is split into horizontal groups of bands, which are dithered and
/// encoded by separate worker threads. Each call owns all of its working state.
class HqSixelEncoder final : public SixelEncoder {
public:
    constexpr static auto min_palette_size = 2_u32;
    constexpr static auto max_palette_size = 2048_u32;
    constexpr static auto default_worker_count = 4_u32;

    // Palette sizes are powers of 2, and other requests are rounded down.
    static auto palette_size_for(u32 color_count) -> u32;

    explicit HqSixelEncoder(bool allow_transparent = false, u32 worker_count = default_worker_count)
        : m_allow_transparent(allow_transparent), m_worker_count(worker_count ? worker_count : 1) {}

    auto encode(Image const& image, u32 color_count = default_color_count, Size const& cell_size = {}) const
        -> EncodedSixel override;

private:
    bool m_allow_transparent { false };
    u32 m_worker_count { default_worker_count };
};
}
