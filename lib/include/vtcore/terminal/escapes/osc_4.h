#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "vtcore/terminal/palette.h"

namespace vtcore::terminal {
/// @brief Represents an OSC 4 sequence, which sets or queries palette entries
///
/// The payload is a list of `index;spec` pairs, where spec is either an X11 color
/// specification or `?` to query the current value. Pairs with an out of range
/// index or a malformed color are dropped, so the corresponding palette entry keeps
/// its previous value. The remaining pairs are still applied.
///
/// This is specified
/// [here](https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h4-Operating-System-Commands:OSC-Ps;Pt-ST:Ps-=-4.1E3F).
struct OSC4 {
    struct Entry {
        u8 index { 0 };
        di::Optional<Rgb> color {}; ///< Empty means this entry is a query

        auto operator==(Entry const&) const -> bool = default;

        constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Entry>) {
            return di::make_fields<"OSC4::Entry">(di::field<"index", &Entry::index>,
                                                  di::field<"color", &Entry::color>);
        }
    };

    di::Vector<Entry> entries;

    // Parses the data following "4;".
    static auto parse(di::StringView data) -> di::Optional<OSC4>;

    auto serialize() const -> di::String;

    auto operator==(OSC4 const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OSC4>) {
        return di::make_fields<"OSC4">(di::field<"entries", &OSC4::entries>);
    }
};

/// @brief Represents an OSC 104 sequence, which resets palette entries
///
/// An empty list of indices resets the entire palette.
struct OSC104 {
    di::Vector<u8> indices;

    // Parses the data following "104", including the optional leading ';'.
    static auto parse(di::StringView data) -> di::Optional<OSC104>;

    auto serialize() const -> di::String;

    auto operator==(OSC104 const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OSC104>) {
        return di::make_fields<"OSC104">(di::field<"indices", &OSC104::indices>);
    }
};
}
