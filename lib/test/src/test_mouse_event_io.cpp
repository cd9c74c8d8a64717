#include "di/test/prelude.h"
#include "di/vocab/array/array.h"
#include "vtcore/input/modifiers.h"
#include "vtcore/input/mouse.h"
#include "vtcore/input/mouse_event_io.h"

namespace mouse_event_io {
using namespace vtcore::input;

static void protocols() {
    struct Case {
        MouseEvent event;
        MouseProtocol protocol;
        bool reported { false };
    };

    auto cases = di::Array {
        Case { MouseEvent::press(MouseButton::Left, 0, 0), MouseProtocol::None, false },

        // X10 only reports presses of the primary buttons.
        Case { MouseEvent::press(MouseButton::Left, 0, 0), MouseProtocol::X10, true },
        Case { MouseEvent::release(MouseButton::Left, 0, 0), MouseProtocol::X10, false },
        Case { MouseEvent::press(MouseButton::ScrollUp, 0, 0), MouseProtocol::X10, false },

        // Normal tracking reports presses and releases, but no motion.
        Case { MouseEvent::press(MouseButton::ScrollUp, 0, 0), MouseProtocol::VT200, true },
        Case { MouseEvent::release(MouseButton::Right, 0, 0), MouseProtocol::VT200, true },
        Case { MouseEvent::move(MouseButton::Left, 0, 0), MouseProtocol::VT200, false },

        // Button event tracking reports drags only.
        Case { MouseEvent::move(MouseButton::Left, 0, 0), MouseProtocol::BtnEvent, true },
        Case { MouseEvent::move(MouseButton::None, 0, 0), MouseProtocol::BtnEvent, false },

        Case { MouseEvent::move(MouseButton::None, 0, 0), MouseProtocol::AnyEvent, true },
    };

    for (auto const& [event, protocol, reported] : cases) {
        auto result = serialize_mouse_event(event, protocol, MouseEncoding::SGR);
        ASSERT_EQ(result.has_value(), reported);
    }
}

static void encodings() {
    struct Case {
        MouseEvent event;
        di::Optional<di::TransparentStringView> expected {};
        MouseEncoding encoding { MouseEncoding::SGR };
        MouseProtocol protocol { MouseProtocol::AnyEvent };
    };

    auto cases = di::Array {
        // X10 encoding
        Case { MouseEvent::press(MouseButton::Left, 0, 0), "\033[M !!"_tsv, MouseEncoding::X10 },
        Case { MouseEvent::press(MouseButton::Middle, 94, 94), "\033[M!\x7f\x7f"_tsv, MouseEncoding::X10 },
        Case { MouseEvent::press(MouseButton::Right, 222, 222), "\033[M\"\xff\xff"_tsv, MouseEncoding::X10 },
        Case { MouseEvent::press(MouseButton::ScrollUp, 0, 0), "\033[M`!!"_tsv, MouseEncoding::X10 },
        Case { MouseEvent::press(MouseButton::Left, 223, 0), {}, MouseEncoding::X10 },
        Case { MouseEvent::release(MouseButton::Left, 0, 0), "\033[M#!!"_tsv, MouseEncoding::X10 },
        Case { MouseEvent::press(MouseButton::Left, 0, 0, Modifiers::Control), "\033[M0!!"_tsv,
               MouseEncoding::X10 },
        Case { MouseEvent::press(MouseButton::Left, 0, 0, Modifiers::Control), "\033[M !!"_tsv, MouseEncoding::X10,
               MouseProtocol::X10 },

        // UTF-8 encoding
        Case { MouseEvent::press(MouseButton::Left, 0, 200), "\033[M \xc3\xa9!"_tsv, MouseEncoding::UTF8 },
        Case { MouseEvent::press(MouseButton::Left, 0, 2015), {}, MouseEncoding::UTF8 },

        // SGR encoding
        Case { MouseEvent::press(MouseButton::Left, 4, 9), "\033[<0;10;5M"_tsv },
        Case { MouseEvent::release(MouseButton::Left, 4, 9), "\033[<0;10;5m"_tsv },
        Case { MouseEvent::press(MouseButton::Right, 0, 0, Modifiers::Shift | Modifiers::Control),
               "\033[<22;1;1M"_tsv },
        Case { MouseEvent::press(MouseButton::ScrollDown, 299, 499), "\033[<65;500;300M"_tsv },
        Case { MouseEvent::release(MouseButton::ScrollDown, 0, 0), {} },
        Case { MouseEvent::move(MouseButton::Left, 1, 1), "\033[<32;2;2M"_tsv },
        Case { MouseEvent::move(MouseButton::None, 1, 1, Modifiers::Alt), "\033[<43;2;2M"_tsv },
    };

    for (auto const& test_case : cases) {
        auto result = serialize_mouse_event(test_case.event, test_case.protocol, test_case.encoding);
        ASSERT_EQ(result, test_case.expected);
    }
}

static void motion_within_cell() {
    auto prev = MouseEvent::move(MouseButton::None, 3, 3);

    auto same = serialize_mouse_event(MouseEvent::move(MouseButton::None, 3, 3), MouseProtocol::AnyEvent,
                                      MouseEncoding::SGR, prev);
    ASSERT(!same.has_value());

    auto moved = serialize_mouse_event(MouseEvent::move(MouseButton::None, 3, 4), MouseProtocol::AnyEvent,
                                       MouseEncoding::SGR, prev);
    ASSERT(moved.has_value());
    ASSERT_EQ(moved.value(), "\033[<35;5;4M"_tsv);
}

TEST(mouse_event_io, protocols)
TEST(mouse_event_io, encodings)
TEST(mouse_event_io, motion_within_cell)
}
