#pragma once

#include "di/container/string/string.h"
#include "di/container/string/string_view.h"
#include "di/function/container/function.h"
#include "di/reflect/prelude.h"
#include "di/vocab/variant/prelude.h"
#include "vtcore/params.h"

namespace vtcore {
struct PrintableCharacter {
    c32 code_point = 0;

    auto operator==(PrintableCharacter const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<PrintableCharacter>) {
        return di::make_fields<"PrintableCharacter">(di::field<"code_point", &PrintableCharacter::code_point>);
    }
};

/// @brief Device control string
///
/// The payload is never tokenized. `raw_params` holds every byte between the
/// DCS introducer and the final byte exactly as received (private markers,
/// parameters and intermediates), `terminator` is the final byte, and `data`
/// is everything up to the string terminator. Together they reproduce the
/// original sequence body, which is what sixel consumers need.
struct DCS {
    di::String intermediate;
    Params params;
    di::String raw_params;
    c32 terminator = 0;
    di::String data;

    /// @brief The sequence body, without the introducer and string terminator.
    auto payload() const -> di::String;

    /// @brief The full sequence, using 7-bit introducer and terminator.
    auto serialize() const -> di::String;

    auto operator==(DCS const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<DCS>) {
        return di::make_fields<"DCS">(di::field<"intermediate", &DCS::intermediate>, di::field<"params", &DCS::params>,
                                      di::field<"raw_params", &DCS::raw_params>,
                                      di::field<"terminator", &DCS::terminator>, di::field<"data", &DCS::data>);
    }
};

struct OSC {
    di::String data;
    di::StringView terminator { "\033\\"_sv };

    auto operator==(OSC const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OSC>) {
        return di::make_fields<"OSC">(di::field<"data", &OSC::data>, di::field<"terminator", &OSC::terminator>);
    }
};

struct CSI {
    di::String intermediate;
    Params params;
    c32 terminator = 0;

    auto operator==(CSI const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CSI>) {
        return di::make_fields<"CSI">(di::field<"intermediate", &CSI::intermediate>, di::field<"params", &CSI::params>,
                                      di::field<"terminator", &CSI::terminator>);
    }
};

struct Escape {
    di::String intermediate;
    c32 terminator = 0;

    auto operator==(Escape const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Escape>) {
        return di::make_fields<"Escape">(di::field<"intermediate", &Escape::intermediate>,
                                         di::field<"terminator", &Escape::terminator>);
    }
};

struct ControlCharacter {
    u32 code_point { 0 };         // Not a c32, so that it will be printed as a decimal.
    bool was_in_escape { false }; // This is true if the control character occurred in the middle of an escape sequence.

    auto operator==(ControlCharacter const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ControlCharacter>) {
        return di::make_fields<"ControlCharacter">(di::field<"code_point", &ControlCharacter::code_point>,
                                                   di::field<"was_in_escape", &ControlCharacter::was_in_escape>);
    }
};

using ParserResult = di::Variant<PrintableCharacter, DCS, OSC, CSI, Escape, ControlCharacter>;

/// @brief Incremental ECMA-48 parser
///
/// Input is a stream of already decoded code points. Both 7-bit (ESC based) and
/// 8-bit (C1 code points 0x80-0x9F) introducers are recognized. The parser never
/// fails: malformed sequences are dropped and parsing resumes in the ground state.
/// Partial sequences are kept across calls to parse().
class EscapeSequenceParser {
public:
    constexpr static auto max_params = 32zu;
    constexpr static auto max_osc_bytes = 1024zu * 1024zu;
    constexpr static auto max_dcs_bytes = 16zu * 1024zu * 1024zu;

    auto parse(di::StringView data) -> di::Vector<ParserResult>;

    auto in_ground_state() const -> bool { return m_next_state == State::Ground; }

private:
// VT500-Series parser states from https://vt100.net/emu/dec_ansi_parser
#define __ENUMERATE_STATES(M)                  \
    M(Ground, ground)                          \
    M(Escape, escape)                          \
    M(EscapeIntermediate, escape_intermediate) \
    M(CsiEntry, csi_entry)                     \
    M(CsiParam, csi_param)                     \
    M(CsiIntermediate, csi_intermediate)       \
    M(CsiIgnore, csi_ignore)                   \
    M(DcsEntry, dcs_entry)                     \
    M(DcsParam, dcs_param)                     \
    M(DcsIntermediate, dcs_intermediate)       \
    M(DcsPassthrough, dcs_passthrough)         \
    M(DcsIgnore, dcs_ignore)                   \
    M(OscString, osc_string)                   \
    M(SosPmApcString, sos_pm_apc_string)

    enum class State {
#define __ENUMERATE_STATE(N, n) N,
        __ENUMERATE_STATES(__ENUMERATE_STATE)
#undef __ENUMERATE_STATE
    };

#define __ENUMERATE_STATE(N, n) void n##_state(c32 code_point);
    __ENUMERATE_STATES(__ENUMERATE_STATE)
#undef __ENUMERATE_STATE

    void ignore(c32 code_point);
    void print(c32 code_point);
    void execute(c32 code_point);
    void clear();
    void collect(c32 code_point);
    void param(c32 code_point);
    void esc_dispatch(c32 code_point);
    void csi_dispatch(c32 code_point);
    void dcs_collect(c32 code_point);
    void hook(c32 code_point);
    void put(c32 code_point);
    void unhook();
    void osc_start();
    void osc_put(c32 code_point);
    void osc_end();

    void transition(State state);

    auto on_c1(c32 code_point) -> bool;
    void on_input(c32 code_point);

    void add_param(Param param);

    State m_next_state { State::Ground };
    bool m_entered { true };
    di::Function<void()> m_on_state_exit;

    di::String m_intermediate;
    di::String m_current_param;
    di::String m_dcs_raw_params;
    c32 m_dcs_terminator { 0 };
    di::String m_data;
    Params m_params;
    bool m_last_separator_was_colon { false };
    bool m_saw_legacy_string_terminator { false };
    di::Vector<ParserResult> m_result;
};
}
