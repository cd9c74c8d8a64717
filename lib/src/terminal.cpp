#include "vtcore/terminal.h"

#include "di/container/algorithm/contains.h"
#include "di/container/tree/tree_set.h"
#include "di/container/view/prelude.h"
#include "di/math/align_up.h"
#include "di/util/scope_exit.h"
#include "di/vocab/array/array.h"
#include "dius/print.h"
#include "vtcore/escape_sequence_parser.h"
#include "vtcore/graphics_rendition.h"
#include "vtcore/params.h"
#include "vtcore/terminal/escapes/device_attributes.h"
#include "vtcore/terminal/escapes/device_status.h"
#include "vtcore/terminal/escapes/osc_4.h"
#include "vtcore/terminal/escapes/osc_8.h"
#include "vtcore/terminal/screen.h"

namespace vtcore {
static auto make_sixel_decoder(EngineConfig const& config, terminal::Palette const& palette) -> image::SixelDecoder {
    auto background = palette.background();
    return image::SixelDecoder(image::SixelPalette::create(config.sixel_palette),
                               image::argb(background.r, background.g, background.b),
                               config.allow_transparent_sixel);
}

Terminal::Terminal(EngineConfig const& config)
    : m_config(config)
    , m_primary_screen(config.size, terminal::Screen::ScrollBackEnabled::Yes, config.scroll_back_limit)
    , m_sixel_decoder(make_sixel_decoder(config, m_palette)) {}

void Terminal::on_parser_results(di::Span<ParserResult const> results) {
    for (auto const& result : results) {
        di::visit(
            [&](auto const& r) {
                this->on_parser_result(r);
            },
            result);
    }
}

void Terminal::on_parser_result(PrintableCharacter const& printable_character) {
    if (printable_character.code_point < 0x7F || printable_character.code_point > 0x9F) {
        put_char(printable_character.code_point);
        m_last_graphics_character = printable_character.code_point;
    }
}

void Terminal::on_parser_result(DCS const& dcs) {
    if (dcs.intermediate == "$"_sv && dcs.terminator == U'q') {
        dcs_decrqss(dcs.data);
        return;
    }
    if (dcs.intermediate.empty() && dcs.terminator == U'q') {
        dcs_sixel(dcs);
        return;
    }
}

void Terminal::on_parser_result(OSC const& osc) {
    // OSC 104, 110 and 111 may appear without any data.
    auto ps_end = osc.data.find(';');
    auto ps = ps_end ? osc.data.substr(osc.data.begin(), ps_end.begin()) : osc.data.view();
    auto pt = ps_end ? osc.data.substr(ps_end.end()) : ""_sv;

    if (ps == "0"_sv || ps == "1"_sv || ps == "2"_sv) {
        osc_title(osc.data);
        return;
    }
    if (ps == "4"_sv) {
        osc_4(pt);
        return;
    }
    if (ps == "8"_sv) {
        osc_8(pt);
        return;
    }
    if (ps == "10"_sv) {
        osc_dynamic_color(10, pt);
        return;
    }
    if (ps == "11"_sv) {
        osc_dynamic_color(11, pt);
        return;
    }
    if (ps == "52"_sv) {
        osc_52(pt);
        return;
    }
    if (ps == "104"_sv) {
        osc_104(ps_end ? osc.data.substr(ps_end.begin()) : ""_sv);
        return;
    }
    if (ps == "110"_sv) {
        m_palette.reset_foreground();
        return;
    }
    if (ps == "111"_sv) {
        m_palette.reset_background();
        return;
    }
}

void Terminal::on_parser_result(ControlCharacter const& control_character) {
    switch (control_character.code_point) {
        case 8: {
            c0_bs();
            return;
        }
        case '\a':
            return;
        case '\t': {
            c0_ht();
            return;
        }
        case '\n': {
            c0_lf();
            return;
        }
        case '\v': {
            c0_vt();
            return;
        }
        case '\f': {
            c0_ff();
            return;
        }
        case '\r': {
            c0_cr();
            return;
        }
        // 8 bit control characters
        case 0x84: {
            c1_ind();
            return;
        }
        case 0x85: {
            c1_nel();
            return;
        }
        case 0x88: {
            c1_hts();
            return;
        }
        case 0x8D: {
            c1_ri();
            return;
        }
        default:
            return;
    }
}

void Terminal::on_parser_result(CSI const& csi) {
    struct Handler {
        di::StringView intermediate;
        c32 terminator { 0 };
        void (*handle)(Terminal&, CSI const&) { nullptr };
    };

#define VTCORE_CSI(intermediate, final_byte, name) \
    Handler { intermediate, final_byte, [](Terminal& self, CSI const& sequence) { self.name(sequence.params); } }
#define VTCORE_CSI_REQUEST(intermediate, final_byte, name) \
    Handler { intermediate, final_byte, [](Terminal& self, CSI const& sequence) { self.name(sequence); } }

    // Keyed by (intermediate, final byte). Anything not listed is ignored.
    constexpr static auto handlers = di::Array {
        VTCORE_CSI(""_sv, '@', csi_ich),           VTCORE_CSI(""_sv, 'A', csi_cuu),
        VTCORE_CSI(""_sv, 'B', csi_cud),           VTCORE_CSI(""_sv, 'C', csi_cuf),
        VTCORE_CSI(""_sv, 'D', csi_cub),           VTCORE_CSI(""_sv, 'E', csi_cnl),
        VTCORE_CSI(""_sv, 'F', csi_cpl),           VTCORE_CSI(""_sv, 'G', csi_cha),
        VTCORE_CSI(""_sv, 'H', csi_cup),           VTCORE_CSI(""_sv, 'J', csi_ed),
        VTCORE_CSI(""_sv, 'K', csi_el),            VTCORE_CSI(""_sv, 'L', csi_il),
        VTCORE_CSI(""_sv, 'M', csi_dl),            VTCORE_CSI(""_sv, 'P', csi_dch),
        VTCORE_CSI(""_sv, 'S', csi_su),            VTCORE_CSI(""_sv, 'T', csi_sd),
        VTCORE_CSI(""_sv, 'X', csi_ech),           VTCORE_CSI(""_sv, 'b', csi_rep),
        VTCORE_CSI_REQUEST(""_sv, 'c', csi_da),    VTCORE_CSI(""_sv, 'd', csi_vpa),
        VTCORE_CSI(""_sv, 'f', csi_hvp),           VTCORE_CSI(""_sv, 'g', csi_tbc),
        VTCORE_CSI(""_sv, 'm', csi_sgr),           VTCORE_CSI_REQUEST(""_sv, 'n', csi_dsr),
        VTCORE_CSI(""_sv, 'r', csi_decstbm),       VTCORE_CSI(""_sv, 's', csi_scosc),
        VTCORE_CSI(""_sv, 'u', csi_scorc),         VTCORE_CSI("?"_sv, 'J', csi_decsed),
        VTCORE_CSI("?"_sv, 'K', csi_decsel),       VTCORE_CSI("?"_sv, 'h', csi_decset),
        VTCORE_CSI("?"_sv, 'l', csi_decrst),       VTCORE_CSI_REQUEST("?"_sv, 'n', csi_dsr),
        VTCORE_CSI_REQUEST(">"_sv, 'c', csi_da),   VTCORE_CSI("\""_sv, 'q', csi_decsca),
        VTCORE_CSI("!"_sv, 'p', csi_decstr),
    };

#undef VTCORE_CSI
#undef VTCORE_CSI_REQUEST

    for (auto const& handler : handlers) {
        if (handler.terminator == csi.terminator && csi.intermediate == handler.intermediate) {
            handler.handle(*this, csi);
            return;
        }
    }
}

void Terminal::on_parser_result(Escape const& escape) {
    if (escape.intermediate == "#"_sv) {
        switch (escape.terminator) {
            case '8': {
                esc_decaln();
                return;
            }
            default:
                return;
        }
    }

    if (!escape.intermediate.empty()) {
        return;
    }

    switch (escape.terminator) {
        case '7': {
            esc_decsc();
            return;
        }
        case '8': {
            esc_decrc();
            return;
        }
        case 'c': {
            esc_ris();
            return;
        }
        // 8 bit control characters
        case 'D': {
            c1_ind();
            return;
        }
        case 'E': {
            c1_nel();
            return;
        }
        case 'H': {
            c1_hts();
            return;
        }
        case 'M': {
            c1_ri();
            return;
        }
        default:
            return;
    }
}

// Backspace - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void Terminal::c0_bs() {
    auto col = cursor_col();
    if (cursor_col() > 0) {
        active_screen().screen.set_cursor_col(col - 1);
    }
}

// Horizontal Tab - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void Terminal::c0_ht() {
    // Special case: if there are no tab stops, simulate having tab stops every 8 columns.
    if (m_tab_stops.empty()) {
        auto col = di::align_up(cursor_col() + 1, 8u);
        active_screen().screen.set_cursor_col(col);
        return;
    }

    for (auto tab_stop : m_tab_stops) {
        if (tab_stop > cursor_col()) {
            active_screen().screen.set_cursor_col(tab_stop);
            return;
        }
    }

    active_screen().screen.set_cursor_col(max_col_inclusive());
}

// Line Feed - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void Terminal::c0_lf() {
    auto& screen = active_screen().screen;
    if (cursor_row() + 1 == screen.scroll_region().end_row) {
        // Scrolling keeps the cursor where it is, including a pending wrap.
        auto save = screen.cursor();
        screen.scroll_up();
        screen.set_cursor(save.row, save.col, save.overflow_pending);
    } else if (cursor_row() + 1 < row_count()) {
        screen.set_cursor(cursor_row() + 1, cursor_col(), screen.cursor().overflow_pending);
    }
}

// Vertical Tab - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void Terminal::c0_vt() {
    c0_lf();
}

// Form Feed - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void Terminal::c0_ff() {
    c0_lf();
}

// Carriage Return - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void Terminal::c0_cr() {
    active_screen().screen.set_cursor_col(0);
}

// Index - https://vt100.net/docs/vt510-rm/IND.html
void Terminal::c1_ind() {
    c0_lf();
}

// Next Line - https://vt100.net/docs/vt510-rm/NEL.html
void Terminal::c1_nel() {
    c0_cr();
    c0_lf();
}

// Horizontal Tab Set - https://vt100.net/docs/vt510-rm/HTS.html
void Terminal::c1_hts() {
    if (di::contains(m_tab_stops, cursor_col())) {
        return;
    }

    auto index = 0_usize;
    for (; index < m_tab_stops.size(); index++) {
        if (cursor_col() < m_tab_stops[index]) {
            break;
        }
    }

    m_tab_stops.insert(m_tab_stops.begin() + index, cursor_col());
}

// Reverse Index - https://www.vt100.net/docs/vt100-ug/chapter3.html#RI
void Terminal::c1_ri() {
    if (cursor_row() == active_screen().screen.scroll_region().start_row) {
        // Scroll down.
        csi_sd({});
        return;
    }

    if (cursor_row() > 0) {
        active_screen().screen.set_cursor_row(cursor_row() - 1);
    }
}

// Request Status String - https://vt100.net/docs/vt510-rm/DECRQSS.html
void Terminal::dcs_decrqss(di::StringView data) {
    auto response = terminal::StatusStringResponse {};
    if (data == "m"_sv) {
        auto sgr_string = active_screen().screen.current_graphics_rendition().as_csi_params() |
                          di::transform(di::to_string) | di::join_with(U';') | di::to<di::String>();
        response.response = *di::present("{}m"_sv, sgr_string);
    } else if (data == "r"_sv) {
        response = terminal::StatusStringResponse::for_scroll_region(active_screen().screen.scroll_region());
    }
    reply(response.serialize());
}

// Sixel Graphics - https://vt100.net/docs/vt3xx-gp/chapter14.html
void Terminal::dcs_sixel(DCS const& dcs) {
    auto payload = dcs.payload();
    auto decoded = m_sixel_decoder.decode(payload);

    // The raw payload is always forwarded, so a backend with native sixel support can draw it.
    m_outgoing_events.push_back(ImagePassthrough { di::move(payload) });

    if (!decoded) {
        dius::eprintln("vtcore: dropping sixel image without any pixels"_sv);
        return;
    }

    auto width = decoded->image.width;
    auto height = decoded->image.height;
    auto id =
        active_screen().screen.put_image(di::move(decoded).value().image, m_config.cell_size(), !m_sixel_display_mode);
    m_outgoing_events.push_back(ImageDecoded { id, width, height });
}

// OSC 0, 1 and 2 - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-Operating-System-Commands
void Terminal::osc_title(di::StringView data) {
    auto change = terminal::TitleChange::parse(data);
    if (!change) {
        return;
    }

    if (change->sets_window_title()) {
        m_title = change->title.clone();
    }
    if (change->sets_icon_title()) {
        m_icon_title = change->title.clone();
    }
    m_outgoing_events.push_back(TitleChanged { di::move(change).value() });
}

// OSC 4 - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h4-Operating-System-Commands:OSC-Ps;Pt-ST:Ps-=-4.1E3F
void Terminal::osc_4(di::StringView data) {
    auto osc4 = terminal::OSC4::parse(data);
    if (!osc4) {
        return;
    }

    // Queries are answered with one reply per entry, in the order asked.
    for (auto const& entry : osc4->entries) {
        if (entry.color) {
            m_palette.set(entry.index, entry.color.value());
            continue;
        }

        auto response = terminal::OSC4 {};
        response.entries.push_back({ entry.index, m_palette.get(entry.index) });
        reply(response.serialize());
    }
}

// OSC 8 - https://gist.github.com/egmontkob/eb114294efbcd5adb1944c9f3cb5feda
void Terminal::osc_8(di::StringView data) {
    auto result = terminal::OSC8::parse(data);
    if (!result) {
        return;
    }

    auto hyperlink = result.value().to_hyperlink();
    active_screen().screen.set_current_hyperlink(hyperlink.transform(di::cref));
}

// OSC 10 and 11 - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-Operating-System-Commands
void Terminal::osc_dynamic_color(u32 ps, di::StringView data) {
    if (data == "?"_sv) {
        auto color = ps == 10 ? m_palette.foreground() : m_palette.background();
        reply(*di::present("\033]{};{}\033\\"_sv, ps, terminal::format_color_spec(color)));
        return;
    }

    auto color = terminal::parse_color_spec(data);
    if (!color) {
        return;
    }
    if (ps == 10) {
        m_palette.set_foreground(color.value());
    } else {
        m_palette.set_background(color.value());
    }
}

// OSC 52 - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h3-Operating-System-Commands
void Terminal::osc_52(di::StringView data) {
    auto request = terminal::OSC52::parse(data);
    if (!request) {
        return;
    }

    m_outgoing_events.push_back(SelectionRequested { di::move(request).value() });
}

// OSC 104 - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-Operating-System-Commands
void Terminal::osc_104(di::StringView data) {
    auto osc104 = terminal::OSC104::parse(data);
    if (!osc104) {
        return;
    }

    if (osc104->indices.empty()) {
        m_palette.reset();
        return;
    }
    for (auto index : osc104->indices) {
        m_palette.reset(index);
    }
}

// DEC Screen Alignment Pattern - https://vt100.net/docs/vt510-rm/DECALN.html
void Terminal::esc_decaln() {
    auto& screen = active_screen().screen;
    screen.set_scroll_region({ 0, screen.max_height() });
    screen.fill(U'E');
    screen.set_cursor(0, 0);
}

// DEC Save Cursor - https://vt100.net/docs/vt510-rm/DECSC.html
void Terminal::esc_decsc() {
    auto& screen_state = active_screen();
    screen_state.saved_cursor = screen_state.screen.save_cursor();
}

// DEC Restore Cursor - https://vt100.net/docs/vt510-rm/DECRC.html
void Terminal::esc_decrc() {
    auto& screen_state = active_screen();
    if (!screen_state.saved_cursor) {
        // Without a saved cursor, restore the defaults.
        screen_state.screen.restore_cursor({});
        return;
    }
    screen_state.screen.restore_cursor(screen_state.saved_cursor.value());
}

// Reset to Initial State - https://vt100.net/docs/vt510-rm/RIS.html
void Terminal::esc_ris() {
    full_reset();
}

// Insert Character - https://vt100.net/docs/vt510-rm/ICH.html
void Terminal::csi_ich(Params const& params) {
    auto chars = di::max(1u, params.get(0, 1));
    active_screen().screen.insert_blank_characters(chars);
}

// Cursor Up - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUU
void Terminal::csi_cuu(Params const& params) {
    auto delta_row = di::max(1u, params.get(0, 1));
    auto new_row = delta_row > cursor_row() ? 0 : cursor_row() - delta_row;
    active_screen().screen.set_cursor_row(new_row);
}

// Cursor Down - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUD
void Terminal::csi_cud(Params const& params) {
    auto delta_row = di::max(1u, params.get(0, 1));
    auto new_row = di::Checked(cursor_row()) + delta_row;
    active_screen().screen.set_cursor_row(new_row.value().value_or(di::NumericLimits<u32>::max));
}

// Cursor Forward - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUF
void Terminal::csi_cuf(Params const& params) {
    auto delta_col = di::max(1u, params.get(0, 1));
    auto new_col = di::Checked(cursor_col()) + delta_col;
    active_screen().screen.set_cursor_col(new_col.value().value_or(di::NumericLimits<u32>::max));
}

// Cursor Backward - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUB
void Terminal::csi_cub(Params const& params) {
    auto delta_col = di::max(1u, params.get(0, 1));
    auto new_col = delta_col > cursor_col() ? 0 : cursor_col() - delta_col;
    active_screen().screen.set_cursor_col(new_col);
}

// Cursor Next Line - https://vt100.net/docs/vt510-rm/CNL.html
void Terminal::csi_cnl(Params const& params) {
    auto delta_row = di::max(1u, params.get(0, 1));
    auto new_row = di::Checked(cursor_row()) + delta_row;
    active_screen().screen.set_cursor(new_row.value().value_or(di::NumericLimits<u32>::max), 0);
}

// Cursor Previous Line - https://vt100.net/docs/vt510-rm/CPL.html
void Terminal::csi_cpl(Params const& params) {
    auto delta_row = di::max(1u, params.get(0, 1));
    auto new_row = delta_row > cursor_row() ? 0 : cursor_row() - delta_row;
    active_screen().screen.set_cursor(new_row, 0);
}

// Cursor Position - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUP
void Terminal::csi_cup(Params const& params) {
    auto row = di::max(1u, params.get(0, 1)) - 1;
    auto col = di::max(1u, params.get(1, 1)) - 1;
    active_screen().screen.set_cursor_relative(row, col);
}

// Cursor Horizontal Absolute - https://vt100.net/docs/vt510-rm/CHA.html
void Terminal::csi_cha(Params const& params) {
    auto col = di::max(1u, params.get(0, 1)) - 1;
    active_screen().screen.set_cursor_col(col);
}

// Erase in Display - https://vt100.net/docs/vt510-rm/ED.html
void Terminal::csi_ed(Params const& params) {
    switch (params.get(0, 0)) {
        case 0: {
            active_screen().screen.clear_after_cursor();
            return;
        }
        case 1: {
            active_screen().screen.clear_before_cursor();
            return;
        }
        case 2: {
            clear();
            return;
        }
        case 3:
            // XTerm extension to clear scoll buffer
            active_screen().screen.clear_scroll_back();
            return;
        default:
            return;
    }
}

// Erase in Line - https://vt100.net/docs/vt510-rm/EL.html
void Terminal::csi_el(Params const& params) {
    switch (params.get(0, 0)) {
        case 0: {
            active_screen().screen.clear_row_after_cursor();
            return;
        }
        case 1: {
            active_screen().screen.clear_row_before_cursor();
            return;
        }
        case 2: {
            active_screen().screen.clear_row();
            return;
        }
        default:
            return;
    }
}

// Selective Erase in Display - https://vt100.net/docs/vt510-rm/DECSED.html
void Terminal::csi_decsed(Params const& params) {
    auto& screen = active_screen().screen;
    switch (params.get(0, 0)) {
        case 0:
            screen.clear_after_cursor(terminal::SelectiveErase::Yes);
            return;
        case 1:
            screen.clear_before_cursor(terminal::SelectiveErase::Yes);
            return;
        case 2:
            screen.clear(terminal::SelectiveErase::Yes);
            return;
        default:
            return;
    }
}

// Selective Erase in Line - https://vt100.net/docs/vt510-rm/DECSEL.html
void Terminal::csi_decsel(Params const& params) {
    auto& screen = active_screen().screen;
    switch (params.get(0, 0)) {
        case 0:
            screen.clear_row_after_cursor(terminal::SelectiveErase::Yes);
            return;
        case 1:
            screen.clear_row_before_cursor(terminal::SelectiveErase::Yes);
            return;
        case 2:
            screen.clear_row(terminal::SelectiveErase::Yes);
            return;
        default:
            return;
    }
}

// Insert Line - https://vt100.net/docs/vt510-rm/IL.html
void Terminal::csi_il(Params const& params) {
    u32 lines_to_insert = di::max(1u, params.get(0, 1));
    active_screen().screen.insert_blank_lines(lines_to_insert);
}

// Delete Line - https://vt100.net/docs/vt510-rm/DL.html
void Terminal::csi_dl(Params const& params) {
    u32 lines_to_delete = di::max(1u, params.get(0, 1));
    active_screen().screen.delete_lines(lines_to_delete);
}

// Delete Character - https://vt100.net/docs/vt510-rm/DCH.html
void Terminal::csi_dch(Params const& params) {
    u32 chars_to_delete = di::max(1u, params.get(0, 1));
    active_screen().screen.delete_characters(chars_to_delete);
}

// Pan Down - https://vt100.net/docs/vt510-rm/SU.html
void Terminal::csi_su(Params const& params) {
    u32 to_scroll = di::max(1u, params.get(0, 1));

    auto& screen = active_screen().screen;
    auto save = screen.cursor();
    auto _ = di::ScopeExit([&] {
        screen.set_cursor(save.row, save.col, save.overflow_pending);
    });

    screen.scroll_up(to_scroll);
}

// Pan Up - https://vt100.net/docs/vt510-rm/SD.html
void Terminal::csi_sd(Params const& params) {
    u32 to_scroll = di::max(1u, params.get(0, 1));

    auto& screen = active_screen().screen;
    auto save = screen.cursor();
    auto _ = di::ScopeExit([&] {
        screen.set_cursor(save.row, save.col, save.overflow_pending);
    });

    screen.scroll_down(to_scroll);
}

// Erase Character - https://vt100.net/docs/vt510-rm/ECH.html
void Terminal::csi_ech(Params const& params) {
    u32 chars_to_erase = di::max(1u, params.get(0, 1));
    active_screen().screen.erase_characters(chars_to_erase);
}

// Repeat Preceding Graphic Character - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html
void Terminal::csi_rep(Params const& params) {
    if (!m_last_graphics_character.has_value()) {
        return;
    }

    // Bound the repeat count by the screen area, which is enough to overwrite everything.
    auto n = di::min(di::max(1u, params.get(0, 1)), row_count() * col_count());
    for (auto _ : di::range(n)) {
        put_char(m_last_graphics_character.value());
    }
}

// Device Attributes - https://vt100.net/docs/vt510-rm/DA1.html and https://vt100.net/docs/vt510-rm/DA2.html
void Terminal::csi_da(CSI const& csi) {
    auto request = terminal::DeviceAttributesRequest::from_csi(csi);
    if (!request) {
        return;
    }

    switch (request->level) {
        case terminal::DeviceAttributesLevel::Primary:
            reply(terminal::PrimaryDeviceAttributes::engine_attributes().serialize());
            return;
        case terminal::DeviceAttributesLevel::Secondary:
            reply(terminal::SecondaryDeviceAttributes().serialize());
            return;
    }
}

// Vertical Line Position Absolute - https://vt100.net/docs/vt510-rm/VPA.html
void Terminal::csi_vpa(Params const& params) {
    auto row = di::max(1u, params.get(0, 1)) - 1;
    active_screen().screen.set_cursor_row_relative(row);
}

// Horizontal and Vertical Position - https://vt100.net/docs/vt510-rm/HVP.html
void Terminal::csi_hvp(Params const& params) {
    csi_cup(params);
}

// Tab Clear - https://vt100.net/docs/vt510-rm/TBC.html
void Terminal::csi_tbc(Params const& params) {
    switch (params.get(0, 0)) {
        case 0:
            di::erase_if(m_tab_stops, [this](auto x) {
                return x == cursor_col();
            });
            return;
        case 3:
            m_tab_stops.clear();
            return;
        default:
            return;
    }
}

// DEC Private Mode Set - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html
void Terminal::csi_decset(Params const& params) {
    for (auto i : di::range(di::max(params.size(), 1zu))) {
        switch (params.get(i, 0)) {
            case 6:
                // Origin Mode - https://vt100.net/docs/vt510-rm/DECOM.html
                // Unlike other modes, this one is per-screen, as this mode
                // is technically part of the cursor state.
                active_screen().screen.set_origin_mode(terminal::OriginMode::Enabled);
                break;
            case 7:
                // Autowrap mode - https://vt100.net/docs/vt510-rm/DECAWM.html
                m_auto_wrap_mode = terminal::AutoWrapMode::Enabled;
                break;
            case 9:
                m_mouse_protocol = input::MouseProtocol::X10;
                break;
            case 25:
                // Text Cursor Enable Mode - https://vt100.net/docs/vt510-rm/DECTCEM.html
                m_cursor_hidden = false;
                active_screen().screen.set_cursor_hidden(false);
                break;
            case 47:
            case 1047:
                set_use_alternate_screen_buffer(true);
                break;
            case 80:
                // Sixel Display Mode - https://vt100.net/docs/vt3xx-gp/chapter14.html#S14.2.1
                m_sixel_display_mode = true;
                break;
            case 1000:
                m_mouse_protocol = input::MouseProtocol::VT200;
                break;
            case 1002:
                m_mouse_protocol = input::MouseProtocol::BtnEvent;
                break;
            case 1003:
                m_mouse_protocol = input::MouseProtocol::AnyEvent;
                break;
            case 1005:
                m_mouse_encoding = input::MouseEncoding::UTF8;
                break;
            case 1006:
                m_mouse_encoding = input::MouseEncoding::SGR;
                break;
            case 1048:
                esc_decsc();
                break;
            case 1049:
                if (!in_alternate_screen_buffer()) {
                    esc_decsc();
                    set_use_alternate_screen_buffer(true);
                }
                break;
            default:
                break;
        }
    }
}

// DEC Private Mode Reset - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html
void Terminal::csi_decrst(Params const& params) {
    for (auto i : di::range(di::max(params.size(), 1zu))) {
        switch (params.get(i, 0)) {
            case 6:
                // Origin Mode - https://vt100.net/docs/vt510-rm/DECOM.html
                active_screen().screen.set_origin_mode(terminal::OriginMode::Disabled);
                break;
            case 7:
                // Autowrap mode - https://vt100.net/docs/vt510-rm/DECAWM.html
                m_auto_wrap_mode = terminal::AutoWrapMode::Disabled;
                break;
            case 9:
            case 1000:
            case 1002:
            case 1003:
                m_mouse_protocol = input::MouseProtocol::None;
                break;
            case 25:
                // Text Cursor Enable Mode - https://vt100.net/docs/vt510-rm/DECTCEM.html
                m_cursor_hidden = true;
                active_screen().screen.set_cursor_hidden(true);
                break;
            case 47:
            case 1047:
                set_use_alternate_screen_buffer(false);
                break;
            case 80:
                m_sixel_display_mode = false;
                break;
            case 1005:
            case 1006:
                m_mouse_encoding = input::MouseEncoding::X10;
                break;
            case 1048:
                esc_decrc();
                break;
            case 1049:
                if (in_alternate_screen_buffer()) {
                    set_use_alternate_screen_buffer(false);
                    esc_decrc();
                }
                break;
            default:
                break;
        }
    }
}

// Select Character Protection Attribute - https://vt100.net/docs/vt510-rm/DECSCA.html
void Terminal::csi_decsca(Params const& params) {
    switch (params.get(0, 0)) {
        case 0:
        case 2:
            active_screen().screen.set_current_protected(false);
            return;
        case 1:
            active_screen().screen.set_current_protected(true);
            return;
        default:
            return;
    }
}

// Select Graphics Rendition - https://vt100.net/docs/vt510-rm/SGR.html
void Terminal::csi_sgr(Params const& params) {
    // Delegate to graphics rendition class.
    auto rendition = active_screen().screen.current_graphics_rendition();
    rendition.update_with_csi_params(params);
    active_screen().screen.set_current_graphics_rendition(rendition);
}

// Device Status Report - https://vt100.net/docs/vt510-rm/DSR.html
void Terminal::csi_dsr(CSI const& csi) {
    auto request = terminal::StatusRequest::from_csi(csi);
    if (!request) {
        return;
    }

    switch (request->type) {
        case terminal::StatusRequestType::OperatingStatus:
            reply(terminal::OperatingStatusReport().serialize());
            return;
        case terminal::StatusRequestType::CursorPosition:
        case terminal::StatusRequestType::ExtendedCursorPosition: {
            auto report = terminal::CursorPositionReport {
                .row = active_screen().screen.cursor_row_relative(),
                .col = cursor_col(),
                .extended = request->type == terminal::StatusRequestType::ExtendedCursorPosition,
            };
            reply(report.serialize());
            return;
        }
    }
}

// DEC Set Top and Bottom Margins - https://www.vt100.net/docs/vt100-ug/chapter3.html#DECSTBM
void Terminal::csi_decstbm(Params const& params) {
    u32 new_scroll_start = di::min(di::max(params.get(0, 1), 1u) - 1, row_count() - 1);
    u32 new_scroll_end = di::min(di::max(params.get(1, row_count()), 1u) - 1, row_count() - 1);
    if (new_scroll_end < new_scroll_start || new_scroll_end - new_scroll_start < 1) {
        return;
    }

    // Internally the scroll end is exclusive, but the CSI is inclusive.
    auto& screen = active_screen().screen;
    screen.set_scroll_region({ new_scroll_start, new_scroll_end + 1 });
    screen.set_cursor_relative(0, 0);
}

// Save Current Cursor Position - https://vt100.net/docs/vt510-rm/SCOSC.html
void Terminal::csi_scosc(Params const&) {
    // Equivalent to DECSC (set cursor)
    esc_decsc();
}

// Restore Saved Cursor Position - https://vt100.net/docs/vt510-rm/SCORC.html
void Terminal::csi_scorc(Params const&) {
    // Equivalent to DECRC (restore cursor)
    esc_decrc();
}

// Soft Terminal Reset - https://vt100.net/docs/vt510-rm/DECSTR.html
void Terminal::csi_decstr(Params const&) {
    soft_reset();
}

auto Terminal::cell_at(u32 row, u32 col) const -> di::Optional<terminal::Cell const&> {
    if (row >= row_count() || col >= col_count()) {
        return {};
    }
    return active_screen().screen.cell_at(row, col);
}

void Terminal::resize(Size const& size) {
    if (size.empty()) {
        return;
    }

    m_config.size = size;
    m_primary_screen.screen.resize(size);
    if (m_alternate_screen) {
        m_alternate_screen->screen.resize(size);
    }
    di::erase_if(m_tab_stops, [&](u32 col) {
        return col >= size.cols;
    });
}

void Terminal::set_scroll_back_limit(usize limit) {
    m_config.scroll_back_limit = limit;
    m_primary_screen.screen.set_scroll_back_limit(limit);
}

auto Terminal::serialize_mouse_event(input::MouseEvent const& event) -> di::Optional<di::TransparentString> {
    if (event.row >= row_count() || event.col >= col_count()) {
        return {};
    }

    auto prev = m_last_mouse_event.transform(di::cref);
    auto result = input::serialize_mouse_event(event, m_mouse_protocol, m_mouse_encoding, prev);
    m_last_mouse_event = event;
    return result;
}

auto Terminal::capture_state() const -> terminal::Snapshot {
    auto const& screen = active_screen().screen;

    auto snapshot = terminal::Snapshot {};
    snapshot.size = screen.size();
    for (auto const& row : m_primary_screen.screen.scroll_back().rows()) {
        snapshot.scroll_back.push_back(row.clone());
    }
    for (auto const& row : screen.rows()) {
        snapshot.rows.push_back(row.clone());
    }
    snapshot.cursor = screen.cursor();
    snapshot.alternate_screen = in_alternate_screen_buffer();
    snapshot.title = m_title.clone();
    snapshot.icon_title = m_icon_title.clone();
    snapshot.mouse_protocol = m_mouse_protocol;
    snapshot.mouse_encoding = m_mouse_encoding;
    snapshot.palette = m_palette;
    snapshot.hyperlinks = screen.hyperlinks().clone();

    // Images which no captured cell shows anymore are not copied.
    auto referenced = di::TreeSet<u32> {};
    auto collect_images = [&](di::Vector<terminal::Row> const& rows) {
        for (auto const& row : rows) {
            for (auto const& cell : row.cells) {
                if (cell.image) {
                    referenced.insert(cell.image->image_id);
                }
            }
        }
    };
    collect_images(snapshot.scroll_back);
    collect_images(snapshot.rows);
    for (auto const& stored : screen.images()) {
        if (referenced.contains(stored.id)) {
            snapshot.images.push_back(stored.clone());
        }
    }
    return snapshot;
}

void Terminal::clear() {
    active_screen().screen.clear();
}

void Terminal::put_char(c32 c) {
    active_screen().screen.put_code_point(c, m_auto_wrap_mode);
}

void Terminal::set_use_alternate_screen_buffer(bool b) {
    if (in_alternate_screen_buffer() == b) {
        return;
    }

    if (b) {
        // The alternate screen inherits the current graphics state, but never has scroll back.
        auto const& primary = m_primary_screen.screen;
        m_alternate_screen = di::make_box<ScreenState>(size(), terminal::Screen::ScrollBackEnabled::No);
        auto& alternate = m_alternate_screen->screen;
        alternate.set_current_graphics_rendition(primary.current_graphics_rendition());
        alternate.set_current_protected(primary.current_protected());
        alternate.set_cursor(primary.cursor().row, primary.cursor().col);
        alternate.set_cursor_hidden(m_cursor_hidden);
    } else {
        ASSERT(m_alternate_screen);
        m_alternate_screen = {};
        m_primary_screen.screen.set_cursor_hidden(m_cursor_hidden);
    }
}

auto Terminal::active_screen() const -> ScreenState const& {
    if (m_alternate_screen) {
        return *m_alternate_screen;
    }
    return m_primary_screen;
}

void Terminal::soft_reset() {
    // The goal of this routine is to make the terminal usable again after a full-screen
    // application crashes without cleaning anything up. Autowrap stays enabled, even though
    // DECSTR disables it on a real VT510.
    active_screen().saved_cursor = {};

    auto& screen = active_screen().screen;
    auto cursor = screen.save_cursor();
    csi_decstbm({});
    screen.set_current_graphics_rendition({});
    screen.set_current_hyperlink({});
    screen.set_current_protected(false);
    cursor.origin_mode = terminal::OriginMode::Disabled;
    cursor.graphics_rendition = {};
    cursor.protected_ = false;
    screen.restore_cursor(cursor);

    m_auto_wrap_mode = terminal::AutoWrapMode::Enabled;
    m_mouse_encoding = input::MouseEncoding::X10;
    m_mouse_protocol = input::MouseProtocol::None;
    m_last_mouse_event = {};
    m_sixel_display_mode = false;
    m_cursor_hidden = false;
    screen.set_cursor_hidden(false);
}

void Terminal::full_reset() {
    set_use_alternate_screen_buffer(false);
    soft_reset();

    // The scroll back survives a reset, like it does in xterm.
    auto& screen = m_primary_screen.screen;
    screen.clear();
    screen.set_cursor(0, 0);
    m_primary_screen.saved_cursor = {};

    m_tab_stops.clear();
    m_last_graphics_character = {};
    m_title = {};
    m_icon_title = {};
    m_palette.reset();
    m_sixel_decoder = make_sixel_decoder(m_config, m_palette);
}
}
