#include "vtcore/input/mouse_event_io.h"

#include "di/container/string/encoding.h"
#include "di/format/prelude.h"
#include "di/vocab/array/prelude.h"
#include "vtcore/input/modifiers.h"
#include "vtcore/input/mouse.h"

namespace vtcore::input {
static auto button_number(MouseButton button) -> u32 {
    switch (button) {
        case MouseButton::Left:
            return 0;
        case MouseButton::Middle:
            return 1;
        case MouseButton::Right:
            return 2;
        case MouseButton::ScrollUp:
            return 64;
        case MouseButton::ScrollDown:
            return 65;
        default:
            return 3;
    }
}

static auto modifiers_number(Modifiers modifiers) -> u32 {
    auto result = 0_u32;
    if (!!(modifiers & Modifiers::Shift)) {
        result |= 4;
    }
    if (!!(modifiers & Modifiers::Alt)) {
        result |= 8;
    }
    if (!!(modifiers & Modifiers::Control)) {
        result |= 16;
    }
    return result;
}

// The legacy encodings have no way to say which button was released, so releases
// are reported with button code 3.
static auto event_number(MouseEvent const& event, Modifiers modifiers, bool legacy_release) -> u32 {
    auto number = button_number(event.button) | modifiers_number(modifiers);
    if (event.type == MouseEventType::Move) {
        number |= 32;
    } else if (legacy_release && event.type == MouseEventType::Release) {
        number = 3 | modifiers_number(modifiers);
    }
    return number;
}

static auto to_transparent(di::StringView value) -> di::TransparentString {
    return value | di::transform([](c32 code_point) {
               return char(code_point);
           }) |
           di::to<di::TransparentString>();
}

static auto serialize_as_x10(u32 number, u32 row, u32 col) -> di::Optional<di::TransparentString> {
    // Each coordinate is a single byte offset by 33, so positions past 222 cannot be reported.
    if (col + 33 > 255 || row + 33 > 255) {
        return {};
    }

    // CSI M Cb Cx Cy
    auto result = ""_ts;
    result.append("\033[M"_tsv);
    result.push_back(char(number + 32));
    result.push_back(char(col + 33));
    result.push_back(char(row + 33));
    return result;
}

static auto serialize_as_utf8(u32 number, u32 row, u32 col) -> di::Optional<di::TransparentString> {
    if (col + 33 > 2047 || row + 33 > 2047) {
        return {};
    }

    // Same layout as X10, but coordinates above 127 are encoded as UTF-8.
    auto result = ""_ts;
    result.append("\033[M"_tsv);
    result.push_back(char(number + 32));
    for (auto value : di::Array { col + 33, row + 33 }) {
        for (auto byte : di::container::string::encoding::convert_to_code_units(di::String::Encoding {}, c32(value))) {
            result.push_back(char(byte));
        }
    }
    return result;
}

static auto serialize_as_sgr(MouseEventType type, u32 number, u32 row, u32 col) -> di::Optional<di::TransparentString> {
    // CSI < Cb ; Cx ; Cy M|m
    auto final_char = type == MouseEventType::Release ? U'm' : U'M';
    return to_transparent(*di::present("\033[<{};{};{}{}"_sv, number, col + 1, row + 1, final_char));
}

static auto reported_by_protocol(MouseEvent const& event, MouseProtocol protocol) -> bool {
    switch (protocol) {
        case MouseProtocol::None:
            return false;
        case MouseProtocol::X10:
            return event.type == MouseEventType::Press && !!(event.button & MouseButton::PrimaryButtons);
        case MouseProtocol::VT200:
            return event.type != MouseEventType::Move;
        case MouseProtocol::BtnEvent:
            return event.type != MouseEventType::Move || event.button != MouseButton::None;
        case MouseProtocol::AnyEvent:
            return true;
    }
    return false;
}

auto serialize_mouse_event(MouseEvent const& event, MouseProtocol protocol, MouseEncoding encoding,
                           di::Optional<MouseEvent const&> prev_event) -> di::Optional<di::TransparentString> {
    if (!reported_by_protocol(event, protocol)) {
        return {};
    }

    // Scroll wheels have no release.
    if (event.is_scroll() && event.type == MouseEventType::Release) {
        return {};
    }

    // Motion which stays within the same cell is not reported.
    if (event.type == MouseEventType::Move && prev_event.has_value() && prev_event.value().row == event.row &&
        prev_event.value().col == event.col) {
        return {};
    }

    // X10 mode never reports modifiers.
    auto modifiers = protocol == MouseProtocol::X10 ? Modifiers::None : event.modifiers;

    switch (encoding) {
        case MouseEncoding::X10:
            return serialize_as_x10(event_number(event, modifiers, true), event.row, event.col);
        case MouseEncoding::UTF8:
            return serialize_as_utf8(event_number(event, modifiers, true), event.row, event.col);
        case MouseEncoding::SGR:
            return serialize_as_sgr(event.type, event_number(event, modifiers, false), event.row, event.col);
    }
    return {};
}
}
