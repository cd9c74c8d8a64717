#include "vtcore/engine.h"

#include "di/container/algorithm/prelude.h"
#include "di/util/scope_exit.h"
#include "di/vocab/span/as_bytes.h"
#include "di/vocab/tuple/prelude.h"
#include "dius/print.h"
#include "vtcore/escape_sequence_parser.h"
#include "vtcore/input_decoder.h"

namespace vtcore {
auto Engine::create(EngineConfig const& config, di::Box<ByteStream> stream) -> di::Result<di::Box<Engine>> {
    if (config.size.empty()) {
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto result = di::make_box<Engine>(config, di::move(stream));
    if (config.telnet) {
        auto& telnet = result->m_telnet.get_assuming_no_concurrent_accesses();
        telnet = telnet::TelnetProtocol();
        auto negotiation = telnet.value().initial_negotiation();
        TRY(result->m_stream->write_exactly(negotiation.span()));
    }

    result->m_reader_thread = TRY(dius::Thread::create([&self = *result.get()] {
        self.reader_thread();
    }));
    return result;
}

auto Engine::create_for_command(EngineConfig const& config, di::Vector<di::TransparentString> command)
    -> di::Result<di::Box<Engine>> {
    auto stream = TRY(PtyByteStream::create(di::move(command), config.size));
    return create(config, di::move(stream));
}

Engine::Engine(EngineConfig const& config, di::Box<ByteStream> stream)
    : m_config(config), m_stream(di::move(stream)), m_terminal(di::in_place, config) {}

Engine::~Engine() {
    close();
}

auto Engine::capture_state() -> terminal::Snapshot {
    return m_terminal.with_lock([&](Terminal& terminal) {
        return terminal.capture_state();
    });
}

auto Engine::cell_at(u32 row, u32 col) -> di::Optional<terminal::Cell> {
    return m_terminal.with_lock([&](Terminal& terminal) -> di::Optional<terminal::Cell> {
        auto cell = terminal.cell_at(row, col);
        if (!cell) {
            return {};
        }
        return *cell;
    });
}

auto Engine::cursor() -> terminal::Cursor {
    return m_terminal.with_lock([&](Terminal& terminal) {
        return terminal.cursor();
    });
}

auto Engine::size() -> Size {
    return m_terminal.with_lock([&](Terminal& terminal) {
        return terminal.size();
    });
}

auto Engine::title() -> di::String {
    return m_terminal.with_lock([&](Terminal& terminal) {
        return terminal.title().to_owned();
    });
}

void Engine::resize(Size const& size) {
    if (is_closed() || size.empty()) {
        return;
    }

    m_terminal.with_lock([&](Terminal& terminal) {
        terminal.resize(size);
    });
    m_stream->set_window_size(size);
}

void Engine::set_scroll_back_limit(usize limit) {
    if (is_closed()) {
        return;
    }

    m_terminal.with_lock([&](Terminal& terminal) {
        terminal.set_scroll_back_limit(limit);
    });
}

auto Engine::send_mouse_event(input::MouseEvent const& event) -> bool {
    if (is_closed()) {
        return false;
    }

    auto serialized = m_terminal.with_lock([&](Terminal& terminal) {
        return terminal.serialize_mouse_event(event);
    });
    if (!serialized) {
        return false;
    }
    return write_to_host(di::as_bytes(serialized.value().span())).has_value();
}

auto Engine::write(di::Span<byte const> data) -> di::Result<> {
    if (is_closed() || data.empty()) {
        return {};
    }

    auto result = write_to_host(data);

    // A write racing with close() is still a no-op.
    if (!result && is_closed()) {
        return {};
    }
    return result;
}

auto Engine::write(di::StringView data) -> di::Result<> {
    return write(di::as_bytes(data.span()));
}

auto Engine::reply_to_selection_query(terminal::OSC52 const& request, di::Span<byte const> contents)
    -> di::Result<> {
    if (!request.query) {
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    auto reply = terminal::OSC52::serialize_reply(request.selections, contents);
    return write(reply.view());
}

auto Engine::wait_for_output(u64 since, dius::SteadyClock::TimePoint deadline) -> bool {
    for (;;) {
        if (output_generation() > since) {
            return true;
        }
        if (is_closed()) {
            return output_generation() > since;
        }

        auto now = dius::SteadyClock::now();
        if (now >= deadline) {
            return false;
        }
        dius::this_thread::sleep_until(di::min(now + poll_interval, deadline));
    }
}

auto Engine::poll_events() -> di::Vector<EngineEvent> {
    return m_events.with_lock([&](di::Ring<EngineEvent>& queue) {
        auto result = di::Vector<EngineEvent> {};
        while (!queue.empty()) {
            result.push_back(di::move(queue.front().value()));
            queue.pop_front();
        }
        return result;
    });
}

auto Engine::queued_event_count() -> usize {
    return m_events.with_lock([&](di::Ring<EngineEvent>& queue) {
        return queue.size();
    });
}

auto Engine::wait_for_events(dius::SteadyClock::TimePoint deadline) -> di::Vector<EngineEvent> {
    for (;;) {
        auto events = poll_events();
        if (!events.empty()) {
            return events;
        }

        auto now = dius::SteadyClock::now();
        if (now >= deadline) {
            return {};
        }
        dius::this_thread::sleep_until(di::min(now + poll_interval, deadline));
    }
}

void Engine::close() {
    // Concurrent callers block here until the first one has joined the reader.
    m_teardown_finished.with_lock([&](bool& finished) {
        if (finished) {
            return;
        }
        finished = true;

        m_closed.store(true, di::MemoryOrder::Release);
        m_stream->close();
        (void) m_reader_thread.join();
    });
}

auto Engine::telnet_terminal_type() -> di::Optional<di::TransparentString> {
    return m_telnet.with_lock([&](di::Optional<telnet::TelnetProtocol>& telnet) -> di::Optional<di::TransparentString> {
        if (!telnet || telnet->terminal_type().empty()) {
            return {};
        }
        return telnet->terminal_type().to_owned();
    });
}

void Engine::reader_thread() {
    auto _ = di::ScopeExit([&] {
        m_closed.store(true, di::MemoryOrder::Release);
        push_event(Closed {});
    });

    auto parser = EscapeSequenceParser();
    auto decoder = InputDecoder(m_config.input_encoding);

    auto process_text = [&](di::StringView text) {
        if (text.empty()) {
            return;
        }

        auto parser_result = parser.parse(text);
        auto [replies, events] = m_terminal.with_lock([&](Terminal& terminal) {
            terminal.on_parser_results(parser_result.span());
            return di::Tuple { terminal.outgoing_replies(), terminal.outgoing_events() };
        });

        if (!replies.empty()) {
            (void) write_to_host(di::as_bytes(replies.span()));
        }

        for (auto&& event : events) {
            di::visit(
                [&](auto&& ev) {
                    push_event(di::move(ev));
                },
                di::move(event));
        }

        // Only the reader thread updates the generation.
        auto generation = output_generation() + 1;
        m_output_generation.store(generation, di::MemoryOrder::Release);
        push_event(OutputProcessed { generation });
    };

    auto buffer = di::Vector<byte> {};
    buffer.resize(16384);

    while (!m_closed.load(di::MemoryOrder::Acquire)) {
        auto nread = m_stream->read_some(buffer.span());
        if (!nread.has_value()) {
            if (!m_closed.load(di::MemoryOrder::Acquire)) {
                dius::eprintln("vtcore: reader stopped after a failed read"_sv);
            }
            break;
        }

        // Whatever woke up a read during close() is not host output.
        if (nread.value() == 0 || m_closed.load(di::MemoryOrder::Acquire)) {
            break;
        }

        auto input = di::Span<byte const> { buffer.data(), nread.value() };

        auto telnet_output = m_telnet.with_lock(
            [&](di::Optional<telnet::TelnetProtocol>& telnet) -> di::Optional<telnet::TelnetOutput> {
                if (!telnet) {
                    return {};
                }
                auto output = telnet->process(input);
                if (!output.reply.empty()) {
                    (void) m_stream->write_exactly(output.reply.span());
                }
                return output;
            });

        if (!telnet_output) {
            process_text(decoder.decode(input));
            continue;
        }

        // Data which arrived before the NAWS report is laid out at the old size.
        auto data = telnet_output->data.span();
        if (auto size = telnet_output->window_size) {
            auto offset = telnet_output->window_size_offset;
            process_text(decoder.decode(*data.subspan(0, offset)));
            m_terminal.with_lock([&](Terminal& terminal) {
                terminal.resize(*size);
            });
            m_stream->set_window_size(*size);
            data = *data.subspan(offset);
        }
        process_text(decoder.decode(data));
    }

    if (!m_closed.load(di::MemoryOrder::Acquire)) {
        process_text(decoder.flush());
    }
}

auto Engine::write_to_host(di::Span<byte const> data) -> di::Result<> {
    // The telnet lock is held for plain streams too, so writes never interleave.
    return m_telnet.with_lock([&](di::Optional<telnet::TelnetProtocol>& telnet) -> di::Result<> {
        if (telnet) {
            auto escaped = telnet->escape(data);
            return m_stream->write_exactly(escaped.span());
        }
        return m_stream->write_exactly(data);
    });
}

void Engine::push_event(EngineEvent event) {
    m_events.with_lock([&](di::Ring<EngineEvent>& queue) {
        // Only the newest generation matters, so consecutive updates are merged.
        if (auto* processed = di::get_if<OutputProcessed>(event)) {
            if (!queue.empty()) {
                if (auto* last = di::get_if<OutputProcessed>(queue.back().value())) {
                    last->generation = processed->generation;
                    return;
                }
            }
        }

        queue.push_back(di::move(event));
        while (queue.size() > max_queued_events) {
            queue.pop_front();
        }
    });
}
}
