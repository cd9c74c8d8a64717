#pragma once

#include "di/reflect/prelude.h"
#include "vtcore/escape_sequence_parser.h"

namespace vtcore::terminal {
enum class DeviceAttributesLevel {
    Primary,   ///< CSI c
    Secondary, ///< CSI > c
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<DeviceAttributesLevel>) {
    using enum DeviceAttributesLevel;
    return di::make_enumerators<"DeviceAttributesLevel">(di::enumerator<"Primary", Primary>,
                                                         di::enumerator<"Secondary", Secondary>);
}

/// @brief Device attributes request sent by the host
///
/// Only the forms with a missing or 0 parameter are requests. The others are
/// replies, which a terminal never receives.
struct DeviceAttributesRequest {
    DeviceAttributesLevel level { DeviceAttributesLevel::Primary };

    static auto from_csi(CSI const& csi) -> di::Optional<DeviceAttributesRequest>;

    auto operator==(DeviceAttributesRequest const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<DeviceAttributesRequest>) {
        return di::make_fields<"DeviceAttributesRequest">(di::field<"level", &DeviceAttributesRequest::level>);
    }
};

/// @brief Terminal primary device attributes
///
/// The reply to DA1, documented [here](https://vt100.net/docs/vt510-rm/DA1.html).
/// The first value is the device class, and the rest are feature flags. The engine
/// reports a VT220 class terminal with sixel graphics (4) and ANSI color (22).
struct PrimaryDeviceAttributes {
    di::Vector<u32> attributes;

    static auto engine_attributes() -> PrimaryDeviceAttributes;

    auto serialize() const -> di::String;

    auto has_sixel() const -> bool;
};

/// @brief Terminal secondary device attributes
///
/// The reply to DA2, documented [here](https://vt100.net/docs/vt510-rm/DA2.html).
struct SecondaryDeviceAttributes {
    u32 terminal_type { 1 }; ///< 1 is a VT220
    u32 version { 10 };

    auto serialize() const -> di::String;
};
}
