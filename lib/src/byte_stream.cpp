#include "vtcore/byte_stream.h"

#include "di/container/view/prelude.h"
#include "di/vocab/array/array.h"
#include "di/vocab/span/as_bytes.h"
#include "dius/tty.h"

namespace vtcore {
static auto spawn_child(di::Vector<di::TransparentString> command, dius::SyncFile& pty, Size const& size)
    -> di::Result<dius::system::ProcessHandle> {
    auto tty_path = TRY(pty.get_psuedo_terminal_path());

#ifdef __linux__
    // On linux, we can set the terminal size in on the controlling pty. On MacOS, we need to do it in
    // the child. Opening the psuedo terminal implicitly makes it the controlling terminal.
    TRY(pty.set_tty_window_size(size.as_window_size()));
#endif

    return dius::system::Process(di::move(command))
        .with_new_session()
        .with_env("TERM"_ts, "xterm-256color"_ts)
        .with_env("COLORTERM"_ts, "truecolor"_ts)
        .with_file_open(0, di::move(tty_path), dius::OpenMode::ReadWrite)
        .with_file_dup(0, 1)
        .with_file_dup(0, 2)
#ifndef __linux__
        .with_tty_window_size(0, size.as_window_size())
        .with_controlling_tty(0)
#endif
        .spawn();
}

auto PtyByteStream::create(di::Vector<di::TransparentString> command, Size const& size)
    -> di::Result<di::Box<PtyByteStream>> {
    if (command.empty()) {
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto pty_controller = TRY(dius::open_psuedo_terminal_controller(dius::OpenMode::ReadWrite));
    auto process = TRY(spawn_child(di::move(command), pty_controller, size));
    return di::make_box<PtyByteStream>(di::move(pty_controller), process);
}

PtyByteStream::~PtyByteStream() {
    // The child may ignore the hangup, so make sure wait() returns.
    (void) m_process.signal(dius::Signal::Kill);
    (void) m_process.wait();
}

auto PtyByteStream::read_some(di::Span<byte> buffer) -> di::Result<usize> {
    return m_pty_controller.read_some(buffer);
}

auto PtyByteStream::write_exactly(di::Span<byte const> data) -> di::Result<> {
    return m_pty_controller.write_exactly(data);
}

void PtyByteStream::set_window_size(Size const& size) {
    (void) m_pty_controller.set_tty_window_size(size.as_window_size());
}

void PtyByteStream::close() {
    (void) m_process.signal(dius::Signal::Hangup);

    // The controller only reports end of file once every follower is closed, which never
    // happens if the child (or one of its children) ignores the hangup. Writing to the
    // follower wakes the pending read instead.
    auto tty_path = m_pty_controller.get_psuedo_terminal_path();
    if (!tty_path) {
        return;
    }
    auto follower = dius::open_sync(tty_path.value(), dius::OpenMode::ReadWrite);
    if (!follower) {
        return;
    }
    auto wake = di::Array { byte(0) };
    (void) follower.value().write_exactly(wake.span());
}

void ChannelByteStream::feed(di::Span<byte const> data) {
    m_state.with_lock([&](State& state) {
        if (state.finished || state.closed) {
            return;
        }
        for (auto value : data) {
            state.input.push(value);
        }
        m_condition.notify_one();
    });
}

void ChannelByteStream::feed(di::StringView data) {
    feed(di::as_bytes(data.span()));
}

void ChannelByteStream::finish() {
    m_state.with_lock([&](State& state) {
        state.finished = true;
        m_condition.notify_one();
    });
}

auto ChannelByteStream::take_written() -> di::Vector<byte> {
    return m_state.with_lock([&](State& state) {
        return di::move(state.written);
    });
}

auto ChannelByteStream::read_some(di::Span<byte> buffer) -> di::Result<usize> {
    auto lock = di::UniqueLock(m_state.get_lock());
    m_condition.wait(lock, [&] {
        // SAFETY: we acquired the lock manually above.
        auto const& state = m_state.get_assuming_no_concurrent_accesses();
        return !state.input.empty() || state.finished || state.closed;
    });

    // SAFETY: we acquired the lock manually above.
    auto& state = m_state.get_assuming_no_concurrent_accesses();
    auto nread = 0_usize;
    while (nread < buffer.size()) {
        auto value = state.input.pop();
        if (!value) {
            break;
        }
        buffer[nread++] = value.value();
    }
    return nread;
}

auto ChannelByteStream::write_exactly(di::Span<byte const> data) -> di::Result<> {
    return m_state.with_lock([&](State& state) -> di::Result<> {
        if (state.closed) {
            return di::Unexpected(di::BasicError::BrokenPipe);
        }
        state.written.append_container(data | di::to<di::Vector>());
        return {};
    });
}

void ChannelByteStream::close() {
    m_state.with_lock([&](State& state) {
        state.closed = true;
        m_condition.notify_one();
    });
}
}
