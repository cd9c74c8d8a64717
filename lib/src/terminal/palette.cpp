#include "vtcore/terminal/palette.h"

#include "di/container/algorithm/prelude.h"
#include "di/format/prelude.h"

namespace vtcore::terminal {
static auto hex_value(c32 code_point) -> di::Optional<u32> {
    if (code_point >= '0' && code_point <= '9') {
        return code_point - '0';
    }
    if (code_point >= 'a' && code_point <= 'f') {
        return code_point - 'a' + 10;
    }
    if (code_point >= 'A' && code_point <= 'F') {
        return code_point - 'A' + 10;
    }
    return {};
}

// Scale a channel of 1 to 4 hex digits to 8 bits. The value is first scaled to the full
// 16 bit range and then the high byte is taken.
static auto parse_channel(di::StringView digits) -> di::Optional<u8> {
    auto count = 0u;
    auto value = 0u;
    for (auto code_point : digits) {
        auto digit = hex_value(code_point);
        if (!digit || ++count > 4) {
            return {};
        }
        value = (value << 4) | *digit;
    }
    if (count == 0) {
        return {};
    }

    auto max_value = (1u << (4 * count)) - 1;
    auto scaled = value * 0xFFFFu / max_value;
    return u8(scaled >> 8);
}

auto parse_color_spec(di::StringView spec) -> di::Optional<Rgb> {
    if (spec.starts_with("rgb:"_sv)) {
        auto channels = spec.substr(spec.find(U':').end()) | di::split(U'/') | di::to<di::Vector>();
        if (channels.size() != 3) {
            return {};
        }
        auto r = parse_channel(channels[0]);
        auto g = parse_channel(channels[1]);
        auto b = parse_channel(channels[2]);
        if (!r || !g || !b) {
            return {};
        }
        return Rgb(*r, *g, *b);
    }

    if (spec.starts_with("#"_sv)) {
        auto digits = spec.substr(di::next(spec.begin()));
        auto length = usize(di::distance(digits));
        if (length == 0 || length % 3 != 0 || length > 12) {
            return {};
        }

        auto per_channel = length / 3;
        auto channels = di::Array<di::String, 3> {};
        auto i = 0_usize;
        for (auto code_point : digits) {
            channels[i++ / per_channel].push_back(code_point);
        }
        auto r = parse_channel(channels[0]);
        auto g = parse_channel(channels[1]);
        auto b = parse_channel(channels[2]);
        if (!r || !g || !b) {
            return {};
        }
        return Rgb(*r, *g, *b);
    }
    return {};
}

auto format_color_spec(Rgb color) -> di::String {
    return *di::present("rgb:{:02x}{:02x}/{:02x}{:02x}/{:02x}{:02x}"_sv, u32(color.r), u32(color.r), u32(color.g),
                        u32(color.g), u32(color.b), u32(color.b));
}

// The first 16 colors match xterm, followed by the 6x6x6 color cube and a 24 step gray ramp.
auto Palette::default_color(u8 index) -> Rgb {
    constexpr auto base_colors = di::Array {
        Rgb(0x00, 0x00, 0x00), Rgb(0xcd, 0x00, 0x00), Rgb(0x00, 0xcd, 0x00), Rgb(0xcd, 0xcd, 0x00),
        Rgb(0x00, 0x00, 0xee), Rgb(0xcd, 0x00, 0xcd), Rgb(0x00, 0xcd, 0xcd), Rgb(0xe5, 0xe5, 0xe5),
        Rgb(0x7f, 0x7f, 0x7f), Rgb(0xff, 0x00, 0x00), Rgb(0x00, 0xff, 0x00), Rgb(0xff, 0xff, 0x00),
        Rgb(0x5c, 0x5c, 0xff), Rgb(0xff, 0x00, 0xff), Rgb(0x00, 0xff, 0xff), Rgb(0xff, 0xff, 0xff),
    };
    if (index < 16) {
        return base_colors[index];
    }
    if (index < 232) {
        auto level = [](u32 value) -> u8 {
            return value == 0 ? 0 : u8(55 + value * 40);
        };
        auto cube = u32(index - 16);
        return Rgb(level(cube / 36), level((cube / 6) % 6), level(cube % 6));
    }
    auto gray = u8(8 + (index - 232) * 10);
    return Rgb(gray, gray, gray);
}

void Palette::reset() {
    for (auto i : di::range(size)) {
        m_colors[i] = default_color(u8(i));
    }
    m_foreground = default_foreground;
    m_background = default_background;
}

auto Palette::resolve(Color color, bool foreground) const -> Rgb {
    switch (color.type) {
        case Color::Type::Palette:
            return get(color.palette_index());
        case Color::Type::Custom:
            return Rgb(color.r, color.g, color.b);
        case Color::Type::Default:
            break;
    }
    return foreground ? m_foreground : m_background;
}
}
