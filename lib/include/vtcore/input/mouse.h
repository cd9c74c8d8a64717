#pragma once

#include "di/reflect/enumerator.h"
#include "di/reflect/field.h"
#include "di/reflect/prelude.h"
#include "di/util/bitwise_enum.h"
#include "vtcore/input/modifiers.h"

// Mouse reference: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-Mouse-Tracking
namespace vtcore::input {
enum class MouseButton {
    None = 0,
    Left = 1 << 0,
    Middle = 1 << 1,
    Right = 1 << 2,
    ScrollUp = 1 << 3,
    ScrollDown = 1 << 4,

    PrimaryButtons = Left | Middle | Right,
    ScrollButtons = ScrollUp | ScrollDown,
};

DI_DEFINE_ENUM_BITWISE_OPERATIONS(MouseButton)

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MouseButton>) {
    using enum MouseButton;
    return di::make_enumerators<"MouseButton">(di::enumerator<"None", None>, di::enumerator<"Left", Left>,
                                               di::enumerator<"Middle", Middle>, di::enumerator<"Right", Right>,
                                               di::enumerator<"ScrollUp", ScrollUp>,
                                               di::enumerator<"ScrollDown", ScrollDown>);
}

enum class MouseEventType {
    Press = 1,
    Move = 2,
    Release = 3,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MouseEventType>) {
    using enum MouseEventType;
    return di::make_enumerators<"MouseEventType">(di::enumerator<"Press", Press>, di::enumerator<"Move", Move>,
                                                  di::enumerator<"Release", Release>);
}

/// @brief A mouse event reported by the rendering collaborator
///
/// Positions are 0 based cell coordinates.
struct MouseEvent {
    MouseEventType type { MouseEventType::Press };
    MouseButton button { MouseButton::None };
    u32 row { 0 };
    u32 col { 0 };
    Modifiers modifiers { Modifiers::None };

    constexpr static auto press(MouseButton button, u32 row, u32 col, Modifiers modifiers = Modifiers::None)
        -> MouseEvent {
        return { MouseEventType::Press, button, row, col, modifiers };
    }
    constexpr static auto release(MouseButton button, u32 row, u32 col, Modifiers modifiers = Modifiers::None)
        -> MouseEvent {
        return { MouseEventType::Release, button, row, col, modifiers };
    }
    constexpr static auto move(MouseButton button, u32 row, u32 col, Modifiers modifiers = Modifiers::None)
        -> MouseEvent {
        return { MouseEventType::Move, button, row, col, modifiers };
    }

    constexpr auto is_scroll() const -> bool { return !!(button & MouseButton::ScrollButtons); }

    auto operator==(MouseEvent const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MouseEvent>) {
        return di::make_fields<"MouseEvent">(di::field<"type", &MouseEvent::type>,
                                             di::field<"button", &MouseEvent::button>,
                                             di::field<"row", &MouseEvent::row>, di::field<"col", &MouseEvent::col>,
                                             di::field<"modifiers", &MouseEvent::modifiers>);
    }
};
}
