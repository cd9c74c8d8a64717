#include "vtcore/terminal/escapes/osc_4.h"

#include "di/format/prelude.h"
#include "di/parser/prelude.h"
#include "vtcore/terminal/palette.h"

namespace vtcore::terminal {
static auto parse_index(di::StringView view) -> di::Optional<u8> {
    auto index = di::parse<u32>(view).optional_value();
    if (!index || *index > 255) {
        return {};
    }
    return u8(*index);
}

auto OSC4::parse(di::StringView data) -> di::Optional<OSC4> {
    auto parts = data | di::split(U';') | di::to<di::Vector>();
    if (parts.size() < 2 || parts.size() % 2 != 0) {
        return {};
    }

    auto result = OSC4 {};
    for (auto i = 0zu; i < parts.size(); i += 2) {
        auto index = parse_index(parts[i]);
        if (!index) {
            continue;
        }
        if (parts[i + 1] == "?"_sv) {
            result.entries.push_back({ *index, {} });
            continue;
        }
        auto color = parse_color_spec(parts[i + 1]);
        if (!color) {
            continue;
        }
        result.entries.push_back({ *index, *color });
    }
    return result;
}

auto OSC4::serialize() const -> di::String {
    auto body = entries | di::transform([](Entry const& entry) -> di::String {
                    if (!entry.color) {
                        return *di::present("{};?"_sv, u32(entry.index));
                    }
                    return *di::present("{};{}"_sv, u32(entry.index), format_color_spec(*entry.color));
                }) |
                di::join_with(U';') | di::to<di::String>();
    return *di::present("\033]4;{}\033\\"_sv, body);
}

auto OSC104::parse(di::StringView data) -> di::Optional<OSC104> {
    auto result = OSC104 {};
    if (data.empty()) {
        return result;
    }
    if (!data.starts_with(";"_sv)) {
        return {};
    }

    for (auto part : data.substr(data.find(U';').end()) | di::split(U';')) {
        if (part.empty()) {
            continue;
        }
        auto index = parse_index(part);
        if (!index) {
            return {};
        }
        result.indices.push_back(*index);
    }
    return result;
}

auto OSC104::serialize() const -> di::String {
    if (indices.empty()) {
        return "\033]104\033\\"_s;
    }
    auto body = indices | di::transform([](u8 index) {
                    return di::to_string(u32(index));
                }) | di::join_with(U';') | di::to<di::String>();
    return *di::present("\033]104;{}\033\\"_sv, body);
}
}
