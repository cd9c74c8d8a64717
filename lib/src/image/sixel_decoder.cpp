#include "vtcore/image/sixel_decoder.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/view/prelude.h"
#include "di/math/prelude.h"

namespace vtcore::image {
// The canvas grows in steps to avoid reallocating for every sixel.
constexpr static auto grow_step = 400_u32;

// Sixel HLS puts blue at a hue of 0 degrees, red at 120 and green at 240.
static auto hls_to_rgb(u32 hue, u32 lightness, u32 saturation) -> u32 {
    auto h = double((hue + 240) % 360) / 360.0;
    auto l = double(lightness) / 100.0;
    auto s = double(saturation) / 100.0;

    auto to_byte = [](double value) -> u32 {
        return u32(di::clamp(value, 0.0, 1.0) * 255.0 + 0.5);
    };

    if (s == 0.0) {
        auto v = to_byte(l);
        return (v << 16) | (v << 8) | v;
    }

    auto q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
    auto p = 2.0 * l - q;
    auto channel = [&](double t) -> u32 {
        if (t < 0.0) {
            t += 1.0;
        }
        if (t > 1.0) {
            t -= 1.0;
        }
        if (t < 1.0 / 6.0) {
            return to_byte(p + (q - p) * 6.0 * t);
        }
        if (t < 1.0 / 2.0) {
            return to_byte(q);
        }
        if (t < 2.0 / 3.0) {
            return to_byte(p + (q - p) * (2.0 / 3.0 - t) * 6.0);
        }
        return to_byte(p);
    };
    return (channel(h + 1.0 / 3.0) << 16) | (channel(h) << 8) | channel(h - 1.0 / 3.0);
}

static auto percent_to_byte(u32 percent) -> u32 {
    return di::min(percent, 100_u32) * 255 / 100;
}

auto SixelDecoder::decode(di::StringView payload) -> di::Optional<DecodedSixel> {
    reset();
    for (auto code_point : payload) {
        if (m_done) {
            break;
        }
        consume(code_point);
    }
    if (!m_done) {
        finish_command();
    }

    // The raster size only pads an image which has sixels. Nothing is allocated for
    // a size which is declared but never painted.
    if (m_width == 0) {
        return {};
    }

    auto height = m_last_row + 1;
    auto final_width = di::min(di::max(m_width, m_raster_width), max_width);
    auto final_height = di::min(di::max(height, m_raster_height), max_height);
    if (final_width == 0 || final_height == 0) {
        return {};
    }
    return DecodedSixel { m_canvas.resized(final_width, final_height, fill_pixel()), m_transparent };
}

void SixelDecoder::reset() {
    m_state = State::Init;
    m_params = {};
    m_param_count = 0;
    m_repeat = {};
    m_canvas = {};
    m_color = 0;
    m_x = 0;
    m_band = 0;
    m_width = 0;
    m_last_row = 0;
    m_raster_width = 0;
    m_raster_height = 0;
    m_transparent = false;
    m_done = false;
}

auto SixelDecoder::fill_pixel() const -> u32 {
    if (m_transparent) {
        return 0;
    }
    return m_background | 0xff000000;
}

auto SixelDecoder::param(usize index, u32 fallback) const -> u32 {
    if (index > m_param_count) {
        return fallback;
    }
    return m_params[index];
}

void SixelDecoder::to_ground() {
    m_params = {};
    m_param_count = 0;
    m_repeat = {};
    m_state = State::Ground;
}

// Complete the parameterized command in progress, if any.
void SixelDecoder::finish_command() {
    switch (m_state) {
        case State::Init:
            parse_init();
            break;
        case State::Raster:
            parse_raster();
            break;
        case State::Color:
            parse_color();
            break;
        case State::Ground:
        case State::Repeat:
            return;
    }
    to_ground();
}

void SixelDecoder::collect_param(c32 code_point) {
    if (code_point >= U'0' && code_point <= U'9') {
        auto& value = m_params[m_param_count];
        value = di::min(value * 10 + u32(code_point - U'0'), 999999_u32);
    } else if (code_point == U';') {
        if (m_param_count < m_params.size() - 1) {
            m_param_count++;
        }
    }
}

void SixelDecoder::consume(c32 code_point) {
    if (code_point == U'q' && m_state == State::Init) {
        finish_command();
        return;
    }

    if (code_point >= 63 && code_point < 127) {
        // A repeat count is consumed by the sixel which follows it.
        if (m_state != State::Repeat) {
            finish_command();
        }
        add_sixel(code_point);
        to_ground();
        return;
    }

    switch (code_point) {
        case U'#':
            finish_command();
            m_state = State::Color;
            return;
        case U'!':
            finish_command();
            m_state = State::Repeat;
            return;
        case U'"':
            finish_command();
            m_state = State::Raster;
            return;
        case U'-':
            finish_command();
            next_band();
            return;
        case U'$':
            finish_command();
            m_x = 0;
            return;
        default:
            break;
    }

    switch (m_state) {
        case State::Init:
        case State::Raster:
        case State::Color:
            collect_param(code_point);
            return;
        case State::Repeat:
            if (code_point >= U'0' && code_point <= U'9') {
                m_repeat = di::min(m_repeat.value_or(0) * 10 + u32(code_point - U'0'), 999999_u32);
            }
            return;
        case State::Ground:
            return;
    }
}

void SixelDecoder::parse_init() {
    // P1 (aspect ratio) and P3 (grid size) are ignored.
    m_transparent = param(1) == 1 && m_allow_transparent;
}

void SixelDecoder::parse_raster() {
    auto pan = param(0);
    auto pad = param(1);
    auto width = param(2);
    auto height = param(3);

    // Only square pixels are supported. Other aspect ratios keep the image unsized.
    if (pan != pad || width == 0 || height == 0) {
        return;
    }

    m_raster_width = di::min(width, max_width);
    m_raster_height = di::min(height, max_height);
}

void SixelDecoder::parse_color() {
    auto index = param(0);

    // A lone register number selects the color.
    if (m_param_count == 0) {
        m_color = m_palette.get(index);
        return;
    }

    auto type = param(1);
    if (type == 1) {
        m_palette.set(index, hls_to_rgb(di::min(param(2), 360_u32), di::min(param(3), 100_u32),
                                         di::min(param(4), 100_u32)));
    } else if (type == 2) {
        m_palette.set(index, (percent_to_byte(param(2)) << 16) | (percent_to_byte(param(3)) << 8) |
                                 percent_to_byte(param(4)));
    } else {
        return;
    }
    m_color = m_palette.get(index);
}

void SixelDecoder::reserve(u32 width, u32 height) {
    width = di::min(width, max_width);
    height = di::min(height, max_height);
    if (width <= m_canvas.width && height <= m_canvas.height) {
        return;
    }

    auto new_width = m_canvas.width;
    while (new_width < width) {
        new_width = di::min(new_width + grow_step, max_width);
    }
    auto new_height = m_canvas.height;
    while (new_height < height) {
        new_height = di::min(new_height + grow_step, max_height);
    }
    m_canvas = m_canvas.resized(new_width, new_height, fill_pixel());
}

void SixelDecoder::next_band() {
    m_band += 6;
    m_x = 0;
    if (m_band >= max_height) {
        m_done = true;
    }
}

void SixelDecoder::add_sixel(c32 code_point) {
    auto bits = u32(code_point - 63);
    auto count = di::clamp(m_repeat.value_or(1), 1_u32, max_repeat);

    // Clip runs which go past the right edge, and stop decoding once nothing more fits.
    if (m_x >= max_width) {
        m_done = true;
        return;
    }
    count = di::min(count, max_width - m_x);

    reserve(m_x + count, m_band + 6);

    if (bits != 0) {
        auto color = m_color | 0xff000000;
        for (auto x : di::range(m_x, m_x + count)) {
            for (auto bit : di::range(6_u32)) {
                auto y = m_band + bit;
                if (!(bits & (1 << bit)) || y >= max_height) {
                    continue;
                }
                m_canvas.set_pixel(x, y, color);
                m_last_row = di::max(m_last_row, y);
            }
        }
    }

    m_x += count;
    m_width = di::max(m_width, m_x);
}
}
