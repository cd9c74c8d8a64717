#include "vtcore/terminal/escapes/device_attributes.h"

#include "di/format/prelude.h"

namespace vtcore::terminal {
auto DeviceAttributesRequest::from_csi(CSI const& csi) -> di::Optional<DeviceAttributesRequest> {
    if (csi.terminator != U'c' || csi.params.size() > 1 || csi.params.get(0) != 0) {
        return {};
    }
    if (csi.intermediate.empty()) {
        return DeviceAttributesRequest { DeviceAttributesLevel::Primary };
    }
    if (csi.intermediate == ">"_sv) {
        return DeviceAttributesRequest { DeviceAttributesLevel::Secondary };
    }
    return {};
}

auto PrimaryDeviceAttributes::engine_attributes() -> PrimaryDeviceAttributes {
    auto result = PrimaryDeviceAttributes {};
    result.attributes.push_back(62);
    result.attributes.push_back(4);
    result.attributes.push_back(22);
    return result;
}

auto PrimaryDeviceAttributes::serialize() const -> di::String {
    auto attributes_string = attributes | di::transform(di::to_string) | di::join_with(U';') | di::to<di::String>();
    return *di::present("\033[?{}c"_sv, attributes_string);
}

auto PrimaryDeviceAttributes::has_sixel() const -> bool {
    return attributes.size() > 1 && di::contains(*attributes.subspan(1), 4u);
}

// The last value is the ROM cartridge number, which is always 0.
auto SecondaryDeviceAttributes::serialize() const -> di::String {
    return *di::present("\033[>{};{};0c"_sv, terminal_type, version);
}
}
