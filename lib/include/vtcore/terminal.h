#pragma once

#include "di/container/string/prelude.h"
#include "di/vocab/pointer/box.h"
#include "di/vocab/variant/prelude.h"
#include "vtcore/engine_config.h"
#include "vtcore/escape_sequence_parser.h"
#include "vtcore/image/sixel_decoder.h"
#include "vtcore/input/mouse_event_io.h"
#include "vtcore/params.h"
#include "vtcore/size.h"
#include "vtcore/terminal/escapes/osc_52.h"
#include "vtcore/terminal/escapes/title.h"
#include "vtcore/terminal/palette.h"
#include "vtcore/terminal/screen.h"
#include "vtcore/terminal/snapshot.h"

namespace vtcore {
struct TitleChanged {
    terminal::TitleChange change;
};

// OSC 52 request. The engine owns no clipboard, so the embedding application decides.
struct SelectionRequested {
    terminal::OSC52 request;
};

// Raw sixel DCS body: parameters, final byte and data, exactly as received.
struct ImagePassthrough {
    di::String payload;
};

struct ImageDecoded {
    u32 image_id { 0 };
    u32 width { 0 };
    u32 height { 0 };
};

using TerminalEvent = di::Variant<TitleChanged, SelectionRequested, ImagePassthrough, ImageDecoded>;

/// @brief Interprets parsed escape sequences against the screen model
///
/// The terminal owns the primary and alternate screens, the color palette and all
/// mode state. It never touches any I/O: replies to queries and events for the
/// embedding application are queued and drained by the caller.
class Terminal {
    struct ScreenState {
        explicit ScreenState(Size const& size, terminal::Screen::ScrollBackEnabled scroll_back_enabled,
                             usize scroll_back_limit = terminal::ScrollBack::default_limit)
            : screen(size, scroll_back_enabled, scroll_back_limit) {}

        terminal::Screen screen;
        di::Optional<terminal::SavedCursor> saved_cursor;
    };

public:
    explicit Terminal(EngineConfig const& config);

    void on_parser_results(di::Span<ParserResult const> results);

    auto active_screen() const -> ScreenState const&;
    auto active_screen() -> ScreenState& {
        return const_cast<ScreenState&>(const_cast<Terminal const&>(*this).active_screen());
    }

    auto cursor() const -> terminal::Cursor { return active_screen().screen.cursor(); }
    auto cursor_row() const -> u32 { return active_screen().screen.cursor().row; }
    auto cursor_col() const -> u32 { return active_screen().screen.cursor().col; }
    auto cursor_hidden() const -> bool { return m_cursor_hidden; }

    auto row_count() const -> u32 { return active_screen().screen.max_height(); }
    auto col_count() const -> u32 { return active_screen().screen.max_width(); }
    auto size() const -> Size { return active_screen().screen.size(); }

    auto cell_at(u32 row, u32 col) const -> di::Optional<terminal::Cell const&>;

    auto palette() const -> terminal::Palette const& { return m_palette; }
    auto title() const -> di::StringView { return m_title; }
    auto icon_title() const -> di::StringView { return m_icon_title; }

    auto mouse_protocol() const -> input::MouseProtocol { return m_mouse_protocol; }
    auto mouse_encoding() const -> input::MouseEncoding { return m_mouse_encoding; }
    auto in_alternate_screen_buffer() const -> bool { return !!m_alternate_screen; }
    auto auto_wrap_mode() const -> terminal::AutoWrapMode { return m_auto_wrap_mode; }
    auto tab_stops() const -> di::Vector<u32> const& { return m_tab_stops; }

    void resize(Size const& size);
    void set_scroll_back_limit(usize limit);

    // Encodes a mouse event for the host, according to the current mouse modes.
    auto serialize_mouse_event(input::MouseEvent const& event) -> di::Optional<di::TransparentString>;

    auto capture_state() const -> terminal::Snapshot;

    auto outgoing_replies() -> di::String { return di::move(m_outgoing_replies); }
    auto outgoing_events() -> di::Vector<TerminalEvent> { return di::move(m_outgoing_events); }

private:
    void on_parser_result(PrintableCharacter const& printable_character);
    void on_parser_result(DCS const& dcs);
    void on_parser_result(OSC const& osc);
    void on_parser_result(CSI const& csi);
    void on_parser_result(Escape const& escape);
    void on_parser_result(ControlCharacter const& control);

    void reply(di::StringView data) { m_outgoing_replies += data; }

    void put_char(c32 c);
    void clear();

    auto max_col_inclusive() const -> u32 { return col_count() - 1; }

    void set_use_alternate_screen_buffer(bool b);

    void soft_reset();
    void full_reset();

    void esc_decaln();
    void esc_decsc();
    void esc_decrc();
    void esc_ris();

    void c0_bs();
    void c0_ht();
    void c0_lf();
    void c0_vt();
    void c0_ff();
    void c0_cr();

    void c1_ind();
    void c1_nel();
    void c1_hts();
    void c1_ri();

    void dcs_decrqss(di::StringView data);
    void dcs_sixel(DCS const& dcs);

    void osc_title(di::StringView data);
    void osc_4(di::StringView data);
    void osc_8(di::StringView data);
    void osc_dynamic_color(u32 ps, di::StringView data);
    void osc_52(di::StringView data);
    void osc_104(di::StringView data);

    void csi_ich(Params const& params);
    void csi_cuu(Params const& params);
    void csi_cud(Params const& params);
    void csi_cuf(Params const& params);
    void csi_cub(Params const& params);
    void csi_cnl(Params const& params);
    void csi_cpl(Params const& params);
    void csi_cup(Params const& params);
    void csi_cha(Params const& params);
    void csi_ed(Params const& params);
    void csi_el(Params const& params);
    void csi_decsed(Params const& params);
    void csi_decsel(Params const& params);
    void csi_il(Params const& params);
    void csi_dl(Params const& params);
    void csi_dch(Params const& params);
    void csi_su(Params const& params);
    void csi_sd(Params const& params);
    void csi_ech(Params const& params);
    void csi_rep(Params const& params);
    void csi_da(CSI const& csi);
    void csi_vpa(Params const& params);
    void csi_hvp(Params const& params);
    void csi_tbc(Params const& params);
    void csi_decset(Params const& params);
    void csi_decrst(Params const& params);
    void csi_decsca(Params const& params);
    void csi_sgr(Params const& params);
    void csi_dsr(CSI const& csi);
    void csi_decstbm(Params const& params);
    void csi_scosc(Params const& params);
    void csi_scorc(Params const& params);
    void csi_decstr(Params const& params);

    EngineConfig m_config;

    ScreenState m_primary_screen;
    di::Box<ScreenState> m_alternate_screen;

    terminal::Palette m_palette;
    image::SixelDecoder m_sixel_decoder;

    di::Vector<u32> m_tab_stops;
    bool m_cursor_hidden { false };
    bool m_sixel_display_mode { false };
    terminal::AutoWrapMode m_auto_wrap_mode { terminal::AutoWrapMode::Enabled };
    di::Optional<c32> m_last_graphics_character;

    input::MouseProtocol m_mouse_protocol { input::MouseProtocol::None };
    input::MouseEncoding m_mouse_encoding { input::MouseEncoding::X10 };
    di::Optional<input::MouseEvent> m_last_mouse_event;

    di::String m_title;
    di::String m_icon_title;

    di::String m_outgoing_replies;
    di::Vector<TerminalEvent> m_outgoing_events;
};
}
