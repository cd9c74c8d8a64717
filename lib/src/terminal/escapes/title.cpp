#include "vtcore/terminal/escapes/title.h"

#include "di/format/prelude.h"

namespace vtcore::terminal {
auto TitleChange::parse(di::StringView data) -> di::Optional<TitleChange> {
    auto semicolon = data.find(U';');
    if (!semicolon) {
        return {};
    }

    auto ps = data.substr(data.begin(), semicolon.begin());
    auto result = TitleChange {};
    if (ps == "0"_sv) {
        result.target = TitleTarget::IconAndWindow;
    } else if (ps == "1"_sv) {
        result.target = TitleTarget::Icon;
    } else if (ps == "2"_sv) {
        result.target = TitleTarget::Window;
    } else {
        return {};
    }

    auto title = data.substr(semicolon.end());
    if (title.size_bytes() > max_title_length) {
        return {};
    }
    result.title = title.to_owned();
    return result;
}

auto TitleChange::serialize() const -> di::String {
    return *di::present("\033]{};{}\033\\"_sv, u32(target), title);
}
}
