#include "vtcore/telnet/telnet_protocol.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/view/prelude.h"
#include "dius/print.h"

namespace vtcore::telnet {
namespace {
// Subnegotiation verbs shared by TERMINAL-TYPE, TERMINAL-SPEED and NEW-ENVIRON.
constexpr auto subnegotiation_is = u8(0);
constexpr auto subnegotiation_send = u8(1);

// NEW-ENVIRON (RFC 1572) tags.
constexpr auto environment_var = u8(0);
constexpr auto environment_value = u8(1);
constexpr auto environment_escape = u8(2);
constexpr auto environment_user_var = u8(3);

constexpr auto cr = u8('\r');
constexpr auto lf = u8('\n');
constexpr auto nul = u8(0);

void push(di::Vector<byte>& output, u8 value) {
    output.push_back(byte(value));
}

void push_command(di::Vector<byte>& output, Command command, u8 option) {
    push(output, u8(Command::IAC));
    push(output, u8(command));
    push(output, option);
}

void push_subnegotiation_send(di::Vector<byte>& output, Option option) {
    push(output, u8(Command::IAC));
    push(output, u8(Command::SB));
    push(output, u8(option));
    push(output, subnegotiation_send);
    push(output, u8(Command::IAC));
    push(output, u8(Command::SE));
}
}

auto TelnetProtocol::supported_locally(u8 option) -> bool {
    switch (Option(option)) {
        case Option::Binary:
        case Option::Echo:
        case Option::SuppressGoAhead:
            return true;
        default:
            return false;
    }
}

auto TelnetProtocol::supported_remotely(u8 option) -> bool {
    switch (Option(option)) {
        case Option::Binary:
        case Option::SuppressGoAhead:
        case Option::TerminalType:
        case Option::WindowSize:
        case Option::TerminalSpeed:
        case Option::NewEnvironment:
            return true;
        default:
            return false;
    }
}

void TelnetProtocol::request_local(di::Vector<byte>& reply, Option option) {
    auto& state = m_options[u8(option)];
    if (state.local || state.local_requested) {
        return;
    }
    state.local_requested = true;
    push_command(reply, Command::WILL, u8(option));
}

void TelnetProtocol::request_remote(di::Vector<byte>& reply, Option option) {
    auto& state = m_options[u8(option)];
    if (state.remote || state.remote_requested) {
        return;
    }
    state.remote_requested = true;
    push_command(reply, Command::DO, u8(option));
}

auto TelnetProtocol::initial_negotiation() -> di::Vector<byte> {
    auto reply = di::Vector<byte> {};

    // An 8-bit clean channel needs BINARY in both directions.
    request_remote(reply, Option::Binary);
    request_local(reply, Option::Binary);

    request_remote(reply, Option::SuppressGoAhead);
    request_local(reply, Option::SuppressGoAhead);

    // The server echoes, the client must not.
    request_local(reply, Option::Echo);

    request_remote(reply, Option::TerminalType);
    request_remote(reply, Option::TerminalSpeed);
    request_remote(reply, Option::WindowSize);
    request_remote(reply, Option::NewEnvironment);
    return reply;
}

auto TelnetProtocol::process(di::Span<byte const> input) -> TelnetOutput {
    auto output = TelnetOutput {};
    for (auto value : input) {
        process_byte(output, di::to_integer<u8>(value));
    }
    return output;
}

void TelnetProtocol::process_byte(TelnetOutput& output, u8 value) {
    switch (m_state) {
        case State::Data: {
            if (value == u8(Command::IAC)) {
                m_state = State::Iac;
                return;
            }

            // Without BINARY, the peer sends a bare carriage return as CR NUL.
            auto pending_cr = m_pending_cr;
            m_pending_cr = false;
            if (pending_cr && value == nul && !remote_enabled(Option::Binary)) {
                return;
            }
            m_pending_cr = value == cr;
            push(output.data, value);
            return;
        }
        case State::Iac:
            switch (Command(value)) {
                case Command::IAC:
                    // Escaped data byte.
                    m_state = State::Data;
                    m_pending_cr = false;
                    push(output.data, value);
                    return;
                case Command::WILL:
                case Command::WONT:
                case Command::DO:
                case Command::DONT:
                    m_command = value;
                    m_state = State::Command;
                    return;
                case Command::SB:
                    m_subnegotiation.clear();
                    m_state = State::Subnegotiation;
                    return;
                case Command::SE:
                    dius::eprintln("telnet: ignoring stray SE"_sv);
                    m_state = State::Data;
                    return;
                default:
                    // NOP, GA, AYT and friends carry no meaning for a terminal stream.
                    m_state = State::Data;
                    return;
            }
        case State::Command:
            m_state = State::Data;
            process_command(output, m_command, value);
            return;
        case State::Subnegotiation:
            if (value == u8(Command::IAC)) {
                m_state = State::SubnegotiationIac;
                return;
            }
            if (m_subnegotiation.size() < max_subnegotiation_bytes) {
                push(m_subnegotiation, value);
            }
            return;
        case State::SubnegotiationIac:
            switch (Command(value)) {
                case Command::IAC:
                    m_state = State::Subnegotiation;
                    if (m_subnegotiation.size() < max_subnegotiation_bytes) {
                        push(m_subnegotiation, value);
                    }
                    return;
                case Command::SE:
                    m_state = State::Data;
                    process_subnegotiation(output);
                    return;
                default:
                    // RFC 855 forbids any other command inside a subnegotiation. Drop what
                    // was collected and treat the byte as the start of a new command.
                    dius::eprintln("telnet: unterminated subnegotiation"_sv);
                    m_subnegotiation.clear();
                    m_state = State::Iac;
                    process_byte(output, value);
                    return;
            }
    }
}

void TelnetProtocol::process_command(TelnetOutput& output, u8 command, u8 option) {
    auto& state = m_options[option];
    switch (Command(command)) {
        case Command::WILL:
            if (supported_remotely(option)) {
                if (!state.remote) {
                    if (!state.remote_requested) {
                        push_command(output.reply, Command::DO, option);
                    }
                    state.remote = true;
                    on_remote_enabled(output, option);
                }
            } else if (!state.remote_announced) {
                push_command(output.reply, Command::DONT, option);
            }
            state.remote_announced = true;
            state.remote_requested = false;
            return;
        case Command::WONT:
            // Disabling an option must always be acknowledged, unless it was never on.
            if (state.remote) {
                push_command(output.reply, Command::DONT, option);
            }
            state.remote = false;
            state.remote_announced = true;
            state.remote_requested = false;
            return;
        case Command::DO:
            if (supported_locally(option)) {
                if (!state.local) {
                    if (!state.local_requested) {
                        push_command(output.reply, Command::WILL, option);
                    }
                    state.local = true;
                }
            } else if (!state.local_announced) {
                push_command(output.reply, Command::WONT, option);
            }
            state.local_announced = true;
            state.local_requested = false;
            return;
        case Command::DONT:
            if (state.local) {
                push_command(output.reply, Command::WONT, option);
            }
            state.local = false;
            state.local_announced = true;
            state.local_requested = false;
            return;
        default:
            return;
    }
}

void TelnetProtocol::on_remote_enabled(TelnetOutput& output, u8 option) {
    switch (Option(option)) {
        case Option::TerminalType:
        case Option::TerminalSpeed:
        case Option::NewEnvironment:
            push_subnegotiation_send(output.reply, Option(option));
            return;
        default:
            return;
    }
}

void TelnetProtocol::process_subnegotiation(TelnetOutput& output) {
    if (m_subnegotiation.empty()) {
        return;
    }

    auto bytes = m_subnegotiation | di::transform([](byte value) {
                     return di::to_integer<u8>(value);
                 }) |
                 di::to<di::Vector>();
    auto option = bytes[0];

    auto text_from = [&](usize offset) {
        auto result = ""_ts;
        for (auto value : bytes | di::drop(offset)) {
            result.push_back(char(value));
        }
        return result;
    };

    switch (Option(option)) {
        case Option::WindowSize: {
            // Width and height, each as a 16 bit big endian value.
            if (bytes.size() != 5) {
                dius::eprintln("telnet: malformed NAWS report of {} bytes"_sv, bytes.size() - 1);
                return;
            }
            auto cols = u32(bytes[1]) << 8 | u32(bytes[2]);
            auto rows = u32(bytes[3]) << 8 | u32(bytes[4]);

            // A client which does not know its size reports 0.
            if (rows == 0 || cols == 0) {
                return;
            }
            m_window_size = Size { rows, cols };
            output.window_size = m_window_size;
            output.window_size_offset = output.data.size();
            return;
        }
        case Option::TerminalType:
            if (bytes.size() >= 2 && bytes[1] == subnegotiation_is) {
                m_terminal_type = text_from(2);
                output.terminal_type_changed = true;
            }
            return;
        case Option::TerminalSpeed:
            if (bytes.size() >= 2 && bytes[1] == subnegotiation_is) {
                m_terminal_speed = text_from(2);
            }
            return;
        case Option::NewEnvironment:
            if (bytes.size() >= 2 && bytes[1] == subnegotiation_is) {
                process_environment();
            }
            return;
        default:
            return;
    }
}

void TelnetProtocol::process_environment() {
    // The payload is a list of (VAR|USERVAR) name [VALUE value] entries, where ESC
    // quotes the next byte.
    auto name = ""_ts;
    auto value = ""_ts;
    auto in_value = false;
    auto has_name = false;

    auto flush = [&] {
        if (has_name && !name.empty()) {
            m_environment.insert_or_assign(di::move(name), di::move(value));
        }
        name = ""_ts;
        value = ""_ts;
        in_value = false;
        has_name = false;
    };

    for (auto i = 2zu; i < m_subnegotiation.size(); i++) {
        auto c = di::to_integer<u8>(m_subnegotiation[i]);
        switch (c) {
            case environment_var:
            case environment_user_var:
                flush();
                has_name = true;
                continue;
            case environment_value:
                in_value = true;
                continue;
            case environment_escape:
                if (++i >= m_subnegotiation.size()) {
                    continue;
                }
                c = di::to_integer<u8>(m_subnegotiation[i]);
                break;
            default:
                break;
        }
        if (in_value) {
            value.push_back(char(c));
        } else {
            name.push_back(char(c));
        }
    }
    flush();
}

auto TelnetProtocol::escape(di::Span<byte const> data) const -> di::Vector<byte> {
    auto result = di::Vector<byte> {};
    result.reserve(data.size());

    auto binary = local_enabled(Option::Binary);
    for (auto i : di::range(data.size())) {
        auto value = di::to_integer<u8>(data[i]);
        push(result, value);
        if (value == u8(Command::IAC)) {
            push(result, value);
        } else if (value == cr && !binary) {
            auto next_is_lf = i + 1 < data.size() && di::to_integer<u8>(data[i + 1]) == lf;
            if (!next_is_lf) {
                push(result, nul);
            }
        }
    }
    return result;
}
}
