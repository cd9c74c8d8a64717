#include "vtcore/image/image.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/view/prelude.h"

namespace vtcore::image {
auto Image::create(u32 width, u32 height, u32 fill) -> Image {
    return { width, height, di::repeat(fill, usize(width) * height) | di::to<di::Vector>() };
}

auto Image::resized(u32 new_width, u32 new_height, u32 fill) const -> Image {
    auto result = create(new_width, new_height, fill);
    auto copy_width = di::min(width, new_width);
    auto copy_height = di::min(height, new_height);
    for (auto y : di::range(copy_height)) {
        for (auto x : di::range(copy_width)) {
            result.set_pixel(x, y, pixel(x, y));
        }
    }
    return result;
}
}
