#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/util/clone.h"

namespace vtcore::terminal {
/// @brief Represents a hyperlink specified via OSC 8.
///
/// [Specification](https://gist.github.com/egmontkob/eb114294efbcd5adb1944c9f3cb5feda).
struct Hyperlink {
    /// The max URI for a hyperlink should be 2083 per the
    /// [spec](https://gist.github.com/egmontkob/eb114294efbcd5adb1944c9f3cb5feda#length-limits):
    constexpr static auto max_uri_length = 2083zu;

    /// Matches the id limit of VTE.
    constexpr static auto max_id_length = 250zu;

    di::String uri; ///< URI for the hyperlink
    di::String id;  ///< ID of hyperlink, for linking cells together. May be empty.

    auto clone() const -> Hyperlink {
        return {
            di::clone(uri),
            di::clone(id),
        };
    }

    auto operator==(Hyperlink const&) const -> bool = default;
    auto operator<=>(Hyperlink const&) const = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Hyperlink>) {
        return di::make_fields<"Hyperlink">(di::field<"uri", &Hyperlink::uri>, di::field<"id", &Hyperlink::id>);
    }
};
}
