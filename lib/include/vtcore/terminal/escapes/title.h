#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"

namespace vtcore::terminal {
enum class TitleTarget : u8 {
    IconAndWindow = 0,
    Icon = 1,
    Window = 2,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<TitleTarget>) {
    using enum TitleTarget;
    return di::make_enumerators<"TitleTarget">(di::enumerator<"IconAndWindow", IconAndWindow>,
                                               di::enumerator<"Icon", Icon>, di::enumerator<"Window", Window>);
}

/// @brief Represents OSC 0, OSC 1 and OSC 2, which set the icon and window title
struct TitleChange {
    constexpr static auto max_title_length = 4096zu;

    TitleTarget target { TitleTarget::IconAndWindow };
    di::String title;

    constexpr auto sets_window_title() const -> bool { return target != TitleTarget::Icon; }
    constexpr auto sets_icon_title() const -> bool { return target != TitleTarget::Window; }

    // Parses a complete OSC payload, including the leading number.
    static auto parse(di::StringView data) -> di::Optional<TitleChange>;

    auto serialize() const -> di::String;

    auto operator==(TitleChange const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<TitleChange>) {
        return di::make_fields<"TitleChange">(di::field<"target", &TitleChange::target>,
                                              di::field<"title", &TitleChange::title>);
    }
};
}
