#include "vtcore/escape_sequence_parser.h"

#include "di/format/prelude.h"
#include "di/parser/prelude.h"
#include "di/util/scope_exit.h"

#define STATE(state) void EscapeSequenceParser::state##_state([[maybe_unused]] c32 code_point)

// Entry actions run when the first code point is processed after a transition.
// A transition always re-arms the entry action, even when re-entering the same state.
#define ON_ENTRY_NOOP(state)                 \
    do {                                     \
        (void) State::state;                 \
        m_entered = true;                    \
    } while (0)

#define ON_ENTRY(state)                      \
    (void) State::state;                     \
    auto __did_transition = !m_entered;      \
    m_entered = true;                        \
    if (__did_transition)

namespace vtcore {
static inline auto is_printable(c32 code_point) -> bool {
    return (code_point >= 0x20 && code_point <= 0x7F) || (code_point >= 0xA0);
}

static inline auto is_executable(c32 code_point) -> bool {
    return code_point <= 0x17 || code_point == 0x19 || (code_point >= 0x1C && code_point <= 0x1F);
}

static inline auto is_c1(c32 code_point) -> bool {
    return code_point >= 0x80 && code_point <= 0x9F;
}

static inline auto is_csi_terminator(c32 code_point) -> bool {
    return code_point >= 0x40 && code_point <= 0x7E;
}

static inline auto is_param(c32 code_point) -> bool {
    // NOTE: this is modified from the reference to include ':' in addition to ';'.
    return (code_point >= 0x30 && code_point <= 0x39) || (code_point == 0x3B) || (code_point == 0x3A);
}

static inline auto is_private_marker(c32 code_point) -> bool {
    return code_point >= 0x3C && code_point <= 0x3F;
}

static inline auto is_intermediate(c32 code_point) -> bool {
    return code_point >= 0x20 && code_point <= 0x2F;
}

static inline auto is_string_terminator(c32 code_point) -> bool {
    // NOTE: BEL as a terminator is xterm specific. ESC \ and C1 ST are handled before
    // reaching the individual states.
    return code_point == '\a';
}

static inline auto is_dcs_terminator(c32 code_point) -> bool {
    return code_point >= 0x40 && code_point <= 0x7E;
}

static inline auto is_escape_terminator(c32 code_point) -> bool {
    return (code_point >= 0x30 && code_point <= 0x4F) || (code_point >= 0x51 && code_point <= 0x57) ||
           (code_point == 0x59) || (code_point == 0x5A) || (code_point == 0x5C) ||
           (code_point >= 0x60 && code_point <= 0x7E);
}

auto DCS::payload() const -> di::String {
    return *di::present("{}{}{}"_sv, raw_params, terminator, data);
}

auto DCS::serialize() const -> di::String {
    return *di::present("\033P{}\033\\"_sv, payload());
}

STATE(ground) {
    ON_ENTRY_NOOP(Ground);

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_printable(code_point)) {
        print(code_point);
        return;
    }
}

STATE(escape) {
    ON_ENTRY(Escape) {
        clear();
    }

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (code_point == 0x5B) {
        transition(State::CsiEntry);
        return;
    }

    if (is_escape_terminator(code_point)) {
        esc_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        transition(State::EscapeIntermediate);
        return;
    }

    if (code_point == 0x58 || code_point == 0x5E || code_point == 0x5F) {
        transition(State::SosPmApcString);
        return;
    }

    if (code_point == 0x5D) {
        transition(State::OscString);
        return;
    }

    if (code_point == 0x50) {
        transition(State::DcsEntry);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    // Anything else (non-ASCII input after ESC) cancels the sequence.
    transition(State::Ground);
}

STATE(escape_intermediate) {
    ON_ENTRY_NOOP(EscapeIntermediate);

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        return;
    }

    if (code_point >= 0x30 && code_point <= 0x7E) {
        esc_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    transition(State::Ground);
}

STATE(csi_entry) {
    ON_ENTRY(CsiEntry) {
        clear();
    }

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_csi_terminator(code_point)) {
        csi_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        transition(State::CsiIntermediate);
        return;
    }

    if (is_param(code_point)) {
        param(code_point);
        transition(State::CsiParam);
        return;
    }

    if (is_private_marker(code_point)) {
        collect(code_point);
        transition(State::CsiParam);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    transition(State::CsiIgnore);
}

STATE(csi_intermediate) {
    ON_ENTRY_NOOP(CsiIntermediate);

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        return;
    }

    if (is_csi_terminator(code_point)) {
        csi_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    transition(State::CsiIgnore);
}

STATE(csi_param) {
    ON_ENTRY(CsiParam) {
        m_on_state_exit = [this] {
            if (!m_current_param.empty()) {
                add_param(Param::parse(m_current_param.view()));
            }
        };
    }

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        transition(State::CsiIntermediate);
        return;
    }

    if (is_csi_terminator(code_point)) {
        transition(State::Ground);
        csi_dispatch(code_point);
        return;
    }

    if (is_param(code_point)) {
        param(code_point);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    transition(State::CsiIgnore);
}

STATE(csi_ignore) {
    ON_ENTRY_NOOP(CsiIgnore);

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_csi_terminator(code_point)) {
        transition(State::Ground);
        return;
    }

    ignore(code_point);
}

STATE(dcs_entry) {
    ON_ENTRY(DcsEntry) {
        clear();
    }

    if (is_executable(code_point) || code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        dcs_collect(code_point);
        collect(code_point);
        transition(State::DcsIntermediate);
        return;
    }

    if (is_param(code_point)) {
        dcs_collect(code_point);
        param(code_point);
        transition(State::DcsParam);
        return;
    }

    if (is_private_marker(code_point)) {
        dcs_collect(code_point);
        collect(code_point);
        transition(State::DcsParam);
        return;
    }

    if (is_dcs_terminator(code_point)) {
        hook(code_point);
        return;
    }

    transition(State::DcsIgnore);
}

STATE(dcs_param) {
    ON_ENTRY(DcsParam) {
        m_on_state_exit = [this] {
            if (!m_current_param.empty()) {
                add_param(Param::parse(m_current_param.view()));
            }
        };
    }

    if (is_executable(code_point) || code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    if (is_param(code_point)) {
        dcs_collect(code_point);
        param(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        dcs_collect(code_point);
        collect(code_point);
        transition(State::DcsIntermediate);
        return;
    }

    if (is_dcs_terminator(code_point)) {
        hook(code_point);
        return;
    }

    transition(State::DcsIgnore);
}

STATE(dcs_intermediate) {
    ON_ENTRY_NOOP(DcsIntermediate);

    if (is_executable(code_point) || code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        dcs_collect(code_point);
        collect(code_point);
        return;
    }

    if (is_dcs_terminator(code_point)) {
        hook(code_point);
        return;
    }

    transition(State::DcsIgnore);
}

STATE(dcs_passthrough) {
    ON_ENTRY_NOOP(DcsPassthrough);

    if (is_string_terminator(code_point)) {
        transition(State::Ground);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }

    put(code_point);
}

STATE(dcs_ignore) {
    ON_ENTRY_NOOP(DcsIgnore);

    if (is_string_terminator(code_point)) {
        transition(State::Ground);
        return;
    }

    ignore(code_point);
}

STATE(osc_string) {
    ON_ENTRY(OscString) {
        osc_start();
    }

    if (is_string_terminator(code_point)) {
        m_saw_legacy_string_terminator = true;
        transition(State::Ground);
        return;
    }

    if (is_executable(code_point)) {
        ignore(code_point);
        return;
    }

    if (is_printable(code_point)) {
        osc_put(code_point);
        return;
    }
}

STATE(sos_pm_apc_string) {
    ON_ENTRY_NOOP(SosPmApcString);

    if (is_string_terminator(code_point)) {
        transition(State::Ground);
        return;
    }

    ignore(code_point);
}

void EscapeSequenceParser::ignore(c32) {}

void EscapeSequenceParser::print(c32 code_point) {
    m_result.push_back(PrintableCharacter(code_point));
}

void EscapeSequenceParser::execute(c32 code_point) {
    m_result.push_back(ControlCharacter(code_point, m_next_state != State::Ground));
}

void EscapeSequenceParser::clear() {
    m_current_param.clear();
    m_params = {};
    m_last_separator_was_colon = false;
    m_intermediate.clear();
    m_dcs_raw_params.clear();
    m_dcs_terminator = 0;
    m_data.clear();
}

void EscapeSequenceParser::collect(c32 code_point) {
    m_intermediate.push_back(code_point);
}

void EscapeSequenceParser::param(c32 code_point) {
    if (code_point != ';' && code_point != ':') {
        // Anything longer than this can't fit in a u32 anyway, and will parse as an empty parameter.
        if (m_current_param.size_bytes() < 11) {
            m_current_param.push_back(code_point);
        }
        return;
    }

    auto _ = di::ScopeExit([&] {
        m_last_separator_was_colon = code_point == ':';
    });

    if (m_current_param.empty()) {
        add_param({});
        return;
    }

    add_param(Param::parse(m_current_param.view()));
    m_current_param.clear();
}

void EscapeSequenceParser::esc_dispatch(c32 code_point) {
    // Ignore string terminators (ESC \). These terminate OSC and DCS sequences,
    // but the state machine exits these states immediately upon hitting the
    // ESC, so the string has already been dispatched.
    if (code_point == '\\' && m_intermediate.empty()) {
        return;
    }
    m_result.push_back(Escape(di::move(m_intermediate), code_point));
}

void EscapeSequenceParser::csi_dispatch(c32 code_point) {
    m_result.push_back(CSI(di::move(m_intermediate), di::move(m_params), code_point));
}

void EscapeSequenceParser::dcs_collect(c32 code_point) {
    m_dcs_raw_params.push_back(code_point);
}

void EscapeSequenceParser::hook(c32 code_point) {
    m_dcs_terminator = code_point;
    transition(State::DcsPassthrough);

    m_data.clear();
    m_on_state_exit = [this] {
        unhook();
    };
}

void EscapeSequenceParser::put(c32 code_point) {
    if (m_data.size_bytes() >= max_dcs_bytes) {
        return;
    }
    m_data.push_back(code_point);
}

void EscapeSequenceParser::unhook() {
    m_result.push_back(DCS(di::move(m_intermediate), di::move(m_params), di::move(m_dcs_raw_params),
                           m_dcs_terminator, di::move(m_data)));
}

void EscapeSequenceParser::osc_start() {
    m_data.clear();
    m_saw_legacy_string_terminator = false;
    m_on_state_exit = [this] {
        osc_end();
    };
}

void EscapeSequenceParser::osc_put(c32 code_point) {
    if (m_data.size_bytes() >= max_osc_bytes) {
        return;
    }
    m_data.push_back(code_point);
}

void EscapeSequenceParser::osc_end() {
    auto terminator = m_saw_legacy_string_terminator ? "\a"_sv : "\033\\"_sv;
    m_result.push_back(OSC(di::move(m_data), terminator));
}

void EscapeSequenceParser::add_param(Param param) {
    if (m_params.size() >= max_params && !m_last_separator_was_colon) {
        m_last_separator_was_colon = false;
        return;
    }

    if (m_last_separator_was_colon) {
        m_params.add_subparam(param);
    } else {
        m_params.add_param(param);
    }
    m_last_separator_was_colon = false;
}

void EscapeSequenceParser::transition(State state) {
    if (m_on_state_exit) {
        m_on_state_exit();
    }
    m_on_state_exit = nullptr;
    m_next_state = state;
    m_entered = false;
}

// 8-bit controls. These are honored in any state, just like their 7-bit ESC equivalents.
auto EscapeSequenceParser::on_c1(c32 code_point) -> bool {
    if (!is_c1(code_point)) {
        return false;
    }

    switch (code_point) {
        case 0x90:
            transition(State::DcsEntry);
            return true;
        case 0x9B:
            transition(State::CsiEntry);
            return true;
        case 0x9C:
            // String terminator. Only meaningful when a string is active, otherwise this is a no-op.
            m_saw_legacy_string_terminator = false;
            transition(State::Ground);
            return true;
        case 0x9D:
            transition(State::OscString);
            return true;
        case 0x98:
        case 0x9E:
        case 0x9F:
            transition(State::SosPmApcString);
            return true;
        default:
            transition(State::Ground);
            execute(code_point);
            return true;
    }
}

void EscapeSequenceParser::on_input(c32 code_point) {
    if (code_point == 0x18 || code_point == 0x1A) {
        // A cancelled string is discarded instead of being dispatched.
        if (m_next_state == State::DcsPassthrough || m_next_state == State::OscString) {
            m_on_state_exit = nullptr;
        }
        execute(code_point);
        transition(State::Ground);
        return;
    }

    if (code_point == 0x1B) {
        transition(State::Escape);
        return;
    }

    if (on_c1(code_point)) {
        return;
    }

    switch (m_next_state) {
#define __ENUMERATE_STATE(N, n)       \
    case State::N:                    \
        return n##_state(code_point);
        __ENUMERATE_STATES(__ENUMERATE_STATE)
#undef __ENUMERATE_STATE
    }
}

auto EscapeSequenceParser::parse(di::StringView data) -> di::Vector<ParserResult> {
    for (auto code_point : data) {
        on_input(code_point);
    }

    auto result = di::move(m_result);
    m_result.clear();
    return result;
}
}
