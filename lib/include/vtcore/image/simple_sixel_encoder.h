#pragma once

#include "vtcore/image/sixel_encoder.h"

namespace vtcore::image {
/// @brief Fast single pass sixel encoder
///
/// Colors are reduced to a fixed color cube of at most 6x7x6 levels, fitted to the
/// requested color count, and every pixel is mapped to its nearest cube entry. No
/// dithering is performed.
///
/// The smallest cube has 8 colors. Fewer colors produce a gray ramp with that many
/// levels, with a minimum of black and white.
class SimpleSixelEncoder final : public SixelEncoder {
public:
    constexpr static auto min_cube_colors = 8_u32;

    explicit SimpleSixelEncoder(bool allow_transparent = false) : m_allow_transparent(allow_transparent) {}

    auto encode(Image const& image, u32 color_count = default_color_count, Size const& cell_size = {}) const
        -> EncodedSixel override;

private:
    bool m_allow_transparent { false };
};
}
