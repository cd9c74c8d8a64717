#pragma once

#include "di/reflect/enumerator.h"
#include "di/reflect/reflect.h"
#include "di/util/bitwise_enum.h"

namespace vtcore::input {
// Modifier keys held while a mouse event was generated. Only the modifiers which
// mouse reports can carry are represented.
enum class Modifiers {
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Control = 1 << 2,
};

DI_DEFINE_ENUM_BITWISE_OPERATIONS(Modifiers)

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Modifiers>) {
    using enum Modifiers;
    return di::make_enumerators<"Modifiers">(di::enumerator<"None", None>, di::enumerator<"Shift", Shift>,
                                             di::enumerator<"Alt", Alt>, di::enumerator<"Control", Control>);
}
}
