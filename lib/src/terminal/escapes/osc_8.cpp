#include "vtcore/terminal/escapes/osc_8.h"

#include "di/format/prelude.h"
#include "vtcore/terminal/hyperlink.h"

namespace vtcore::terminal {
auto OSC8::parse(di::StringView data) -> di::Optional<OSC8> {
    auto semicolon = data.find(U';');
    if (!semicolon) {
        return {};
    }

    // The URI itself may contain ';', so only split on the first one.
    auto params_string = data.substr(data.begin(), semicolon.begin());
    auto uri = data.substr(semicolon.end());
    if (uri.size_bytes() > Hyperlink::max_uri_length) {
        return {};
    }

    auto result = OSC8 {};
    for (auto key_value : params_string | di::split(U':')) {
        if (key_value.empty()) {
            continue;
        }
        auto equal = key_value.find(U'=');
        if (!equal) {
            result.params.insert_or_assign(key_value.to_owned(), ""_s);
            continue;
        }
        result.params.insert_or_assign(key_value.substr(key_value.begin(), equal.begin()).to_owned(),
                                       key_value.substr(equal.end()).to_owned());
    }
    result.uri = uri.to_owned();
    return result;
}

auto OSC8::serialize() const -> di::String {
    auto params_string = params | di::transform([](auto const& pair) -> di::String {
                             auto const& [key, value] = pair;
                             return *di::present("{}={}"_sv, key, value);
                         }) |
                         di::join_with(U':') | di::to<di::String>();
    return *di::present("\033]8;{};{}\033\\"_sv, params_string, uri);
}

auto OSC8::to_hyperlink() const -> di::Optional<Hyperlink> {
    if (uri.empty()) {
        return {};
    }

    auto id = params.at("id"_sv)
                  .transform([](di::String const& id) {
                      return id.clone();
                  })
                  .value_or(""_s);
    if (id.size_bytes() > Hyperlink::max_id_length) {
        id.clear();
    }
    return Hyperlink { .uri = uri.clone(), .id = di::move(id) };
}
}
