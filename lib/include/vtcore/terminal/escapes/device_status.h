#pragma once

#include "di/reflect/prelude.h"
#include "vtcore/escape_sequence_parser.h"
#include "vtcore/terminal/scroll_region.h"

namespace vtcore::terminal {
enum class StatusRequestType {
    OperatingStatus,        ///< CSI 5 n
    CursorPosition,         ///< CSI 6 n
    ExtendedCursorPosition, ///< CSI ? 6 n (DECXCPR)
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<StatusRequestType>) {
    using enum StatusRequestType;
    return di::make_enumerators<"StatusRequestType">(di::enumerator<"OperatingStatus", OperatingStatus>,
                                                     di::enumerator<"CursorPosition", CursorPosition>,
                                                     di::enumerator<"ExtendedCursorPosition", ExtendedCursorPosition>);
}

/// @brief Device status request sent by the host
///
/// See [DSR](https://vt100.net/docs/vt510-rm/DSR.html). Requests the engine does
/// not answer are rejected, so they can be ignored.
struct StatusRequest {
    StatusRequestType type { StatusRequestType::OperatingStatus };

    static auto from_csi(CSI const& csi) -> di::Optional<StatusRequest>;

    auto operator==(StatusRequest const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<StatusRequest>) {
        return di::make_fields<"StatusRequest">(di::field<"type", &StatusRequest::type>);
    }
};

/// @brief Operating status report
///
/// Reply to DSR 5, as specified [here](https://vt100.net/docs/vt510-rm/DSR-OS.html).
struct OperatingStatusReport {
    bool malfunction { false };

    auto serialize() const -> di::String;
};

/// @brief Cursor position report
///
/// Reply to DSR 6 and DECXCPR. Positions are stored 0-indexed and sent 1-indexed.
/// When origin mode is active, the row is relative to the top of the scroll region.
///
/// This is specified [here](https://vt100.net/docs/vt510-rm/DSR-CPR.html). The
/// extended form adds the page number, which is always 1.
struct CursorPositionReport {
    u32 row { 0 };
    u32 col { 0 };
    bool extended { false };

    auto serialize() const -> di::String;
};

/// @brief Reply to DECRQSS
///
/// The request is DCS $ q Pt ST. The engine answers for the graphics rendition
/// (Pt = m) and the scroll region (Pt = r). Anything else is reported as invalid,
/// as specified [here](https://vt100.net/docs/vt510-rm/DECRQSS.html).
struct StatusStringResponse {
    di::Optional<di::String> response;

    // The reply for DECSTBM, using 1-indexed inclusive rows.
    static auto for_scroll_region(ScrollRegion const& region) -> StatusStringResponse;

    auto serialize() const -> di::String;
};
}
