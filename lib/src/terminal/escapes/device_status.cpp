#include "vtcore/terminal/escapes/device_status.h"

#include "di/format/prelude.h"

namespace vtcore::terminal {
auto StatusRequest::from_csi(CSI const& csi) -> di::Optional<StatusRequest> {
    if (csi.terminator != 'n' || csi.params.size() != 1) {
        return {};
    }

    auto value = csi.params.get(0);
    if (csi.intermediate == "?"_sv) {
        if (value != 6) {
            return {};
        }
        return StatusRequest { StatusRequestType::ExtendedCursorPosition };
    }
    if (!csi.intermediate.empty()) {
        return {};
    }

    switch (value) {
        case 5:
            return StatusRequest { StatusRequestType::OperatingStatus };
        case 6:
            return StatusRequest { StatusRequestType::CursorPosition };
        default:
            return {};
    }
}

auto OperatingStatusReport::serialize() const -> di::String {
    return *di::present("\033[{}n"_sv, malfunction ? 3 : 0);
}

auto CursorPositionReport::serialize() const -> di::String {
    if (extended) {
        return *di::present("\033[?{};{};1R"_sv, row + 1, col + 1);
    }
    return *di::present("\033[{};{}R"_sv, row + 1, col + 1);
}

auto StatusStringResponse::for_scroll_region(ScrollRegion const& region) -> StatusStringResponse {
    return { *di::present("{};{}r"_sv, region.start_row + 1, region.end_row) };
}

// The reply is DCS Ps $ r Pt ST, where Ps is 1 for a valid request and 0 otherwise.
auto StatusStringResponse::serialize() const -> di::String {
    return *di::present("\033P{}$r{}\033\\"_sv, u32(response.has_value()),
                        response.transform(&di::String::view).value_or(""_sv));
}
}
