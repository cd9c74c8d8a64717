#pragma once

#include "di/container/ring/prelude.h"
#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/sync/atomic.h"
#include "di/sync/synchronized.h"
#include "di/vocab/error/result.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/pointer/box.h"
#include "di/vocab/variant/prelude.h"
#include "dius/steady_clock.h"
#include "dius/thread.h"
#include "vtcore/byte_stream.h"
#include "vtcore/engine_config.h"
#include "vtcore/input/mouse.h"
#include "vtcore/telnet/telnet_protocol.h"
#include "vtcore/terminal.h"
#include "vtcore/terminal/snapshot.h"

namespace vtcore {
// Bytes from the host were applied to the screen model.
struct OutputProcessed {
    u64 generation { 0 };
};

// The reader thread stopped, either because the stream ended or failed, or because
// close() was called. This is always the last event.
struct Closed {};

using EngineEvent =
    di::Variant<OutputProcessed, Closed, TitleChanged, SelectionRequested, ImagePassthrough, ImageDecoded>;

/// @brief A terminal connected to a host byte stream
///
/// A dedicated reader thread pulls bytes from the stream, and is the only thread
/// which modifies the terminal state. Every other method may be called from any
/// thread. Queries take the same lock as the reader, so they never see a partially
/// applied update.
///
/// Once closed, the engine keeps its final state: snapshots still work, while
/// writes, resizes and mouse events are silently ignored.
class Engine {
public:
    constexpr static auto max_queued_events = 1024zu;

    static auto create(EngineConfig const& config, di::Box<ByteStream> stream) -> di::Result<di::Box<Engine>>;

    /// @brief Run a command in a psuedo terminal of the configured size
    static auto create_for_command(EngineConfig const& config, di::Vector<di::TransparentString> command)
        -> di::Result<di::Box<Engine>>;

    explicit Engine(EngineConfig const& config, di::Box<ByteStream> stream);
    ~Engine();

    auto capture_state() -> terminal::Snapshot;
    auto cell_at(u32 row, u32 col) -> di::Optional<terminal::Cell>;
    auto cursor() -> terminal::Cursor;
    auto size() -> Size;
    auto title() -> di::String;

    void resize(Size const& size);
    void set_scroll_back_limit(usize limit);

    // Returns true if the event was reported to the host.
    auto send_mouse_event(input::MouseEvent const& event) -> bool;

    /// @brief Send input to the host
    ///
    /// In telnet mode the data is escaped before it is sent.
    auto write(di::Span<byte const> data) -> di::Result<>;
    auto write(di::StringView data) -> di::Result<>;

    /// @brief Answer an OSC 52 query with the contents of the selection
    auto reply_to_selection_query(terminal::OSC52 const& request, di::Span<byte const> contents) -> di::Result<>;

    /// @brief Number of reads applied to the screen so far
    auto output_generation() const -> u64 { return m_output_generation.load(di::MemoryOrder::Acquire); }

    /// @brief Wait until output newer than @p since was processed
    ///
    /// @return false if the deadline passed or the engine closed first.
    auto wait_for_output(u64 since, dius::SteadyClock::TimePoint deadline) -> bool;

    /// @brief Take every queued event
    ///
    /// Consecutive OutputProcessed events are merged into the newest one. When
    /// nobody polls, the oldest events are dropped once max_queued_events are queued.
    auto poll_events() -> di::Vector<EngineEvent>;
    auto queued_event_count() -> usize;

    // Waits until at least one event is queued or the deadline passes.
    auto wait_for_events(dius::SteadyClock::TimePoint deadline) -> di::Vector<EngineEvent>;

    /// @brief Stop the reader thread and release the stream
    ///
    /// Safe to call any number of times from any number of threads. Only the first
    /// call does anything, and every call returns once the reader has stopped.
    void close();

    auto is_closed() const -> bool { return m_closed.load(di::MemoryOrder::Acquire); }

    /// @brief Terminal type reported by a telnet client, if any
    auto telnet_terminal_type() -> di::Optional<di::TransparentString>;

private:
    constexpr static auto poll_interval = di::Milliseconds(1);

    void reader_thread();
    auto write_to_host(di::Span<byte const> data) -> di::Result<>;
    void push_event(EngineEvent event);

    EngineConfig m_config;
    di::Box<ByteStream> m_stream;
    di::Synchronized<Terminal> m_terminal;
    di::Synchronized<di::Optional<telnet::TelnetProtocol>> m_telnet;
    di::Synchronized<di::Ring<EngineEvent>> m_events;
    di::Atomic<u64> m_output_generation { 0 };
    di::Atomic<bool> m_closed { false };
    di::Synchronized<bool> m_teardown_finished { di::in_place, false };

    // Declared last, so the thread is joined before anything it uses is destroyed.
    dius::Thread m_reader_thread;
};
}
