#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/serialization/base64.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"

namespace vtcore::terminal {
/// @brief Represents an OSC 52 sequence, which sets or queries a selection buffer
///
/// The engine does not own a clipboard. Requests are validated here and then
/// handed to the embedding application, which decides what to do with them.
///
/// The selection parameter is a list of the characters "cpqs01234567". An empty
/// selection parameter means "s 0" per xterm. Invalid base64 data clears the
/// selection instead of being ignored, which is also what xterm does.
///
/// OSC 52 is specified
/// [here](https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h4-Operating-System-Commands:OSC-Ps;Pt-ST:Ps-=-5-2.101B).
struct OSC52 {
    constexpr static auto valid_selections = "cpqs01234567"_sv;

    di::String selections;
    di::Base64<> data;
    bool query { false };

    // Parses the data following "52;".
    static auto parse(di::StringView data) -> di::Optional<OSC52>;

    auto serialize() const -> di::String;

    // Decoded selection contents. Empty for queries and for requests clearing the selection.
    auto contents() const -> di::Span<byte const> { return data.container().span(); }

    // Answer to a query, which carries the selection contents back to the host.
    static auto serialize_reply(di::StringView selections, di::Span<byte const> contents) -> di::String;

    auto operator==(OSC52 const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OSC52>) {
        return di::make_fields<"OSC52">(di::field<"selections", &OSC52::selections>, di::field<"data", &OSC52::data>,
                                        di::field<"query", &OSC52::query>);
    }
};
}
