#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "vtcore/input/mouse.h"

// Mouse reference: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-Mouse-Tracking
namespace vtcore::input {
// Mouse protocol - determines which mouse events are forwarded to the application.
//   The enum values are the DEC private modes which enable them.
enum class MouseProtocol {
    None = 0,
    X10 = 9,
    VT200 = 1000,
    BtnEvent = 1002,
    AnyEvent = 1003,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MouseProtocol>) {
    using enum MouseProtocol;
    return di::make_enumerators<"MouseProtocol">(di::enumerator<"None", None>, di::enumerator<"X10", X10>,
                                                 di::enumerator<"VT200", VT200>, di::enumerator<"BtnEvent", BtnEvent>,
                                                 di::enumerator<"AnyEvent", AnyEvent>);
}

// Mouse encoding - determines the bytes sent to the application when an event is forwarded.
//   The enum values are the DEC private modes which enable them.
enum class MouseEncoding {
    X10 = 9,
    UTF8 = 1005,
    SGR = 1006,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MouseEncoding>) {
    using enum MouseEncoding;
    return di::make_enumerators<"MouseEncoding">(di::enumerator<"X10", X10>, di::enumerator<"UTF8", UTF8>,
                                                 di::enumerator<"SGR", SGR>);
}

/// @brief Encode a mouse event for the application
///
/// @param event The event to report
/// @param protocol The active mouse protocol, which filters which events are reported
/// @param encoding The active mouse encoding
/// @param prev_event The previously reported event, used to suppress motion within a cell
///
/// @return The bytes to send, or an empty optional if the event is not reported
auto serialize_mouse_event(MouseEvent const& event, MouseProtocol protocol, MouseEncoding encoding,
                           di::Optional<MouseEvent const&> prev_event = {}) -> di::Optional<di::TransparentString>;
}
