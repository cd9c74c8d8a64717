#pragma once

#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"

namespace vtcore::image {
// Pixels are packed as 0xAARRGGBB.
constexpr auto argb(u8 r, u8 g, u8 b, u8 a = 0xff) -> u32 {
    return (u32(a) << 24) | (u32(r) << 16) | (u32(g) << 8) | u32(b);
}

constexpr auto alpha(u32 pixel) -> u8 {
    return u8(pixel >> 24);
}
constexpr auto red(u32 pixel) -> u8 {
    return u8(pixel >> 16);
}
constexpr auto green(u32 pixel) -> u8 {
    return u8(pixel >> 8);
}
constexpr auto blue(u32 pixel) -> u8 {
    return u8(pixel);
}

constexpr auto is_transparent(u32 pixel) -> bool {
    return alpha(pixel) == 0;
}

/// @brief A bitmap of ARGB pixels
///
/// Pixels are stored row major. A default constructed image is empty.
struct Image {
    u32 width { 0 };
    u32 height { 0 };
    di::Vector<u32> pixels;

    static auto create(u32 width, u32 height, u32 fill = 0) -> Image;

    auto empty() const -> bool { return width == 0 || height == 0; }

    auto pixel(u32 x, u32 y) const -> u32 { return pixels[usize(y) * width + x]; }
    void set_pixel(u32 x, u32 y, u32 value) { pixels[usize(y) * width + x] = value; }

    // Returns a copy of the image, cut or padded with fill to the requested size.
    auto resized(u32 new_width, u32 new_height, u32 fill = 0) const -> Image;

    auto clone() const -> Image { return { width, height, pixels.clone() }; }

    auto operator==(Image const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Image>) {
        return di::make_fields<"Image">(di::field<"width", &Image::width>, di::field<"height", &Image::height>);
    }
};
}
