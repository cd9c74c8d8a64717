#include "di/test/prelude.h"
#include "vtcore/terminal/escapes/osc_8.h"
#include "vtcore/terminal/hyperlink.h"

namespace osc_8 {
using namespace vtcore;
using namespace vtcore::terminal;

static void parse() {
    struct Case {
        di::StringView input {};
        di::Optional<OSC8> expected {};
    };

    auto cases = di::Array {
        // Normal clear.
        Case {
            ";"_sv,
            { OSC8 {} },
        },
        // Invalid.
        Case {
            ""_sv,
            {},
        },
        // The URI may contain ';'.
        Case {
            ";https://example.com/a;b"_sv,
            { OSC8 { .params = {}, .uri = "https://example.com/a;b"_s } },
        },
        // Implicit id.
        Case {
            ";https://example.com"_sv,
            { OSC8 { .params = {}, .uri = "https://example.com"_s } },
        },
        // Parameters without a value.
        Case {
            "id=h1:flag:;https://example.com"_sv,
            { OSC8 { .params = di::Array { di::Tuple { "flag"_s, ""_s }, di::Tuple { "id"_s, "h1"_s } } |
                               di::as_rvalue | di::to<di::TreeMap>(),
                     .uri = "https://example.com"_s } },
        },
        // Extra params
        Case {
            "id=h1:foo=bar;https://example.com"_sv,
            { OSC8 { .params = di::Array { di::Tuple { "id"_s, "h1"_s }, di::Tuple { "foo"_s, "bar"_s } } |
                               di::as_rvalue | di::to<di::TreeMap>(),
                     .uri = "https://example.com"_s } },
        },
    };

    for (auto const& [input, expected] : cases) {
        auto result = OSC8::parse(input);
        ASSERT_EQ(expected, result);
    }

    // Overly long URIs are ignored.
    auto long_uri = ";https://"_s;
    for (auto _ : di::range(Hyperlink::max_uri_length)) {
        long_uri.push_back(U'a');
    }
    ASSERT(!OSC8::parse(long_uri.view()));
}

static void serialize() {
    struct Case {
        OSC8 input {};
        di::StringView expected {};
    };

    auto cases = di::Array {
        // Normal clear.
        Case {
            {},
            "\033]8;;\033\\"_sv,
        },
        // Normal
        Case {
            OSC8 { .params = di::Array { di::Tuple { "id"_s, "h1"_s } } | di::as_rvalue | di::to<di::TreeMap>(),
                   .uri = "https://example.com"_s },
            "\033]8;id=h1;https://example.com\033\\"_sv,
        },
    };

    for (auto const& [input, expected] : cases) {
        auto result = input.serialize();
        ASSERT_EQ(expected, result);
    }
}

static void to_hyperlink() {
    struct Case {
        OSC8 input {};
        di::Optional<Hyperlink> expected {};
    };

    auto cases = di::Array {
        // Normal clear.
        Case { {}, {} },
        // No id
        Case {
            OSC8 { .params = {}, .uri = "https://example.com"_s },
            Hyperlink { .uri = "https://example.com"_s, .id = ""_s },
        },
        // Explicit id
        Case {
            OSC8 { .params = di::Array { di::Tuple { "id"_s, "h1"_s } } | di::as_rvalue | di::to<di::TreeMap>(),
                   .uri = "https://example.com"_s },
            Hyperlink { .uri = "https://example.com"_s, .id = "h1"_s },
        },
        // Overly long id is dropped
        Case {
            OSC8 { .params = di::Array { di::Tuple { "id"_s, di::repeat(U'A', Hyperlink::max_id_length + 100) |
                                                                 di::to<di::String>() } } |
                             di::as_rvalue | di::to<di::TreeMap>(),
                   .uri = "https://example.com"_s },
            Hyperlink { .uri = "https://example.com"_s, .id = ""_s },
        },
    };

    for (auto const& [input, expected] : cases) {
        auto result = input.to_hyperlink();
        ASSERT_EQ(expected, result);
    }
}

TEST(osc_8, parse)
TEST(osc_8, serialize)
TEST(osc_8, to_hyperlink)
}
