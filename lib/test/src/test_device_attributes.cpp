#include "di/test/prelude.h"
#include "vtcore/escape_sequence_parser.h"
#include "vtcore/terminal/escapes/device_attributes.h"

namespace device_attributes {
using namespace vtcore;
using namespace vtcore::terminal;

static void parse_request() {
    struct Case {
        CSI input {};
        di::Optional<DeviceAttributesRequest> expected {};
    };

    auto cases = di::Array {
        Case {
            CSI { .terminator = 'c' },
            DeviceAttributesRequest { DeviceAttributesLevel::Primary },
        },
        Case {
            CSI { .params = { { 0 } }, .terminator = 'c' },
            DeviceAttributesRequest { DeviceAttributesLevel::Primary },
        },
        Case {
            CSI { .intermediate = ">"_s, .terminator = 'c' },
            DeviceAttributesRequest { DeviceAttributesLevel::Secondary },
        },
        // Replies from another terminal.
        Case {
            CSI { .intermediate = "?"_s, .params = { { 62 }, { 4 } }, .terminator = 'c' },
        },
        Case {
            CSI { .intermediate = ">"_s, .params = { { 1 }, { 10 }, { 0 } }, .terminator = 'c' },
        },
        Case {
            CSI { .params = { { 1 } }, .terminator = 'c' },
        },
        Case {
            CSI { .terminator = 'C' },
        },
    };

    for (auto const& [input, expected] : cases) {
        ASSERT_EQ(DeviceAttributesRequest::from_csi(input), expected);
    }
}

static void serialize() {
    ASSERT_EQ(PrimaryDeviceAttributes {}.serialize(), "\033[?c"_sv);
    ASSERT_EQ(PrimaryDeviceAttributes::engine_attributes().serialize(), "\033[?62;4;22c"_sv);

    ASSERT_EQ(SecondaryDeviceAttributes {}.serialize(), "\033[>1;10;0c"_sv);
    ASSERT_EQ((SecondaryDeviceAttributes { .terminal_type = 41, .version = 2 }.serialize()), "\033[>41;2;0c"_sv);
}

static void advertises_sixel() {
    ASSERT(PrimaryDeviceAttributes::engine_attributes().has_sixel());

    // The device class is never a feature flag.
    auto attributes = PrimaryDeviceAttributes {};
    attributes.attributes.push_back(4);
    ASSERT(!attributes.has_sixel());
    attributes.attributes.push_back(22);
    ASSERT(!attributes.has_sixel());
    attributes.attributes.push_back(4);
    ASSERT(attributes.has_sixel());
}

TEST(device_attributes, parse_request)
TEST(device_attributes, serialize)
TEST(device_attributes, advertises_sixel)
}
