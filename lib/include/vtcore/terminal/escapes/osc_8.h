#pragma once

#include "di/container/tree/tree_map.h"
#include "di/reflect/prelude.h"
#include "vtcore/terminal/hyperlink.h"

namespace vtcore::terminal {
/// @brief Represents a terminal hyperlink escape sequence
///
/// The sequence is `OSC 8 ; params ; URI ST`, where params is a ':' separated list
/// of key=value pairs. An empty URI ends the current hyperlink. This is specified
/// [here](https://gist.github.com/egmontkob/eb114294efbcd5adb1944c9f3cb5feda).
struct OSC8 {
    di::TreeMap<di::String, di::String> params;
    di::String uri;

    // Parses the data following "8;".
    static auto parse(di::StringView data) -> di::Optional<OSC8>;

    auto serialize() const -> di::String;

    // Returns an empty optional when this sequence ends the active hyperlink.
    auto to_hyperlink() const -> di::Optional<Hyperlink>;

    auto operator==(OSC8 const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OSC8>) {
        return di::make_fields<"OSC8">(di::field<"params", &OSC8::params>, di::field<"uri", &OSC8::uri>);
    }
};
}
