#include "vtcore/terminal/escapes/osc_52.h"

#include "di/format/prelude.h"
#include "di/parser/prelude.h"

namespace vtcore::terminal {
auto OSC52::parse(di::StringView data) -> di::Optional<OSC52> {
    auto semicolon = data.find(U';');
    if (!semicolon) {
        return {};
    }

    auto result = OSC52 {};
    for (auto ch : data.substr(data.begin(), semicolon.begin())) {
        if (!di::contains(valid_selections, ch)) {
            return {};
        }
        if (!di::contains(result.selections, ch)) {
            result.selections.push_back(ch);
        }
    }
    if (result.selections.empty()) {
        result.selections = "s0"_s;
    }

    auto payload = data.substr(semicolon.end());
    if (payload == "?"_sv) {
        result.query = true;
        return result;
    }

    result.data = di::parse<di::Base64<>>(payload).value_or(di::Base64<>());
    return result;
}

auto OSC52::serialize() const -> di::String {
    if (query) {
        return *di::present("\033]52;{};?\033\\"_sv, selections);
    }
    return *di::present("\033]52;{};{}\033\\"_sv, selections, data);
}

auto OSC52::serialize_reply(di::StringView selections, di::Span<byte const> contents) -> di::String {
    return *di::present("\033]52;{};{}\033\\"_sv, selections, di::Base64View(contents));
}
}
