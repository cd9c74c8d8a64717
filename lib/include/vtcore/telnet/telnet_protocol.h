#pragma once

#include "di/container/string/prelude.h"
#include "di/container/tree/tree_map.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "di/vocab/array/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "vtcore/size.h"

namespace vtcore::telnet {
// RFC 854 commands.
enum class Command : u8 {
    SE = 240,
    NOP = 241,
    DataMark = 242,
    Break = 243,
    InterruptProcess = 244,
    AbortOutput = 245,
    AreYouThere = 246,
    EraseCharacter = 247,
    EraseLine = 248,
    GoAhead = 249,
    SB = 250,
    WILL = 251,
    WONT = 252,
    DO = 253,
    DONT = 254,
    IAC = 255,
};

enum class Option : u8 {
    Binary = 0,
    Echo = 1,
    SuppressGoAhead = 3,
    TerminalType = 24,
    WindowSize = 31,
    TerminalSpeed = 32,
    NewEnvironment = 39,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Option>) {
    using enum Option;
    return di::make_enumerators<"Option">(
        di::enumerator<"BINARY", Binary>, di::enumerator<"ECHO", Echo>,
        di::enumerator<"SUPPRESS-GO-AHEAD", SuppressGoAhead>, di::enumerator<"TERMINAL-TYPE", TerminalType>,
        di::enumerator<"NAWS", WindowSize>, di::enumerator<"TERMINAL-SPEED", TerminalSpeed>,
        di::enumerator<"NEW-ENVIRON", NewEnvironment>);
}

/// @brief Bytes produced by feeding peer input through the protocol
struct TelnetOutput {
    di::Vector<byte> data;                 ///< Application data with all framing removed.
    di::Vector<byte> reply;                ///< Negotiation bytes which must be sent back to the peer.
    di::Optional<Size> window_size;        ///< Set when a NAWS report arrived.
    usize window_size_offset { 0 };        ///< Bytes of data which preceded the last NAWS report.
    bool terminal_type_changed { false };  ///< Set when a TERMINAL-TYPE IS report arrived.
};

/// @brief Server side of the telnet protocol (RFC 854)
///
/// This is a pure state machine: it performs no I/O. Bytes read from the peer go
/// through process(), and the returned reply must be written back to the peer.
/// Application data written to the peer goes through escape().
///
/// The server asks for an 8-bit clean channel (BINARY and SUPPRESS-GO-AHEAD in
/// both directions, server side ECHO) and for the client's terminal type, speed,
/// window size and environment. Options the client refuses stay at their default,
/// which is a non-binary, client echoing channel. Malformed framing is consumed
/// and never ends the session.
///
/// Option negotiation follows the loop avoidance rules of RFC 854: a request is
/// only acknowledged when it changes the option state, and an answer to one of our
/// own requests is never acknowledged.
class TelnetProtocol {
public:
    constexpr static auto max_subnegotiation_bytes = 4096zu;

    /// @brief Requests sent once when the connection is established
    auto initial_negotiation() -> di::Vector<byte>;

    auto process(di::Span<byte const> input) -> TelnetOutput;

    /// @brief Prepare application data for the peer
    ///
    /// IAC is doubled. Unless BINARY was negotiated for our side, a CR which is
    /// not followed by LF is sent as CR NUL.
    auto escape(di::Span<byte const> data) const -> di::Vector<byte>;

    auto local_enabled(Option option) const -> bool { return m_options[u8(option)].local; }
    auto remote_enabled(Option option) const -> bool { return m_options[u8(option)].remote; }

    auto binary() const -> bool { return local_enabled(Option::Binary) && remote_enabled(Option::Binary); }

    auto window_size() const -> di::Optional<Size> { return m_window_size; }
    auto terminal_type() const -> di::TransparentStringView { return m_terminal_type; }
    auto terminal_speed() const -> di::TransparentStringView { return m_terminal_speed; }
    auto environment() const -> di::TreeMap<di::TransparentString, di::TransparentString> const& {
        return m_environment;
    }

private:
    enum class State {
        Data,
        Iac,
        Command,
        Subnegotiation,
        SubnegotiationIac,
    };

    struct OptionState {
        bool local { false };
        bool remote { false };
        bool local_requested { false };
        bool remote_requested { false };
        bool local_announced { false };
        bool remote_announced { false };
    };

    static auto supported_locally(u8 option) -> bool;
    static auto supported_remotely(u8 option) -> bool;

    void request_local(di::Vector<byte>& reply, Option option);
    void request_remote(di::Vector<byte>& reply, Option option);

    void process_byte(TelnetOutput& output, u8 value);
    void process_command(TelnetOutput& output, u8 command, u8 option);
    void process_subnegotiation(TelnetOutput& output);
    void process_environment();
    void on_remote_enabled(TelnetOutput& output, u8 option);

    State m_state { State::Data };
    u8 m_command { 0 };
    bool m_pending_cr { false };
    di::Vector<byte> m_subnegotiation;
    di::Array<OptionState, 256> m_options {};

    di::Optional<Size> m_window_size;
    di::TransparentString m_terminal_type;
    di::TransparentString m_terminal_speed;
    di::TreeMap<di::TransparentString, di::TransparentString> m_environment;
};
}
