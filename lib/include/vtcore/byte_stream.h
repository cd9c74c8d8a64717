#pragma once

#include "di/container/queue/queue.h"
#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/sync/synchronized.h"
#include "di/vocab/error/result.h"
#include "di/vocab/pointer/box.h"
#include "di/vocab/span/prelude.h"
#include "dius/condition_variable.h"
#include "dius/sync_file.h"
#include "dius/system/process.h"
#include "vtcore/size.h"

namespace vtcore {
/// @brief Connection to the host program
///
/// The engine's reader thread is the only caller of read_some(). Writes may come
/// from any thread, but the engine serializes them. close() must make a pending
/// read_some() return, either with an error or with 0 bytes.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Returns 0 at the end of the stream.
    virtual auto read_some(di::Span<byte> buffer) -> di::Result<usize> = 0;
    virtual auto write_exactly(di::Span<byte const> data) -> di::Result<> = 0;

    // Forward the terminal size to the host, if the stream has any way to do so.
    virtual void set_window_size(Size const&) {}

    virtual void close() = 0;
};

/// @brief A child process connected through a psuedo terminal
class PtyByteStream final : public ByteStream {
public:
    static auto create(di::Vector<di::TransparentString> command, Size const& size)
        -> di::Result<di::Box<PtyByteStream>>;

    explicit PtyByteStream(dius::SyncFile pty_controller, dius::system::ProcessHandle process)
        : m_pty_controller(di::move(pty_controller)), m_process(process) {}
    ~PtyByteStream() override;

    auto read_some(di::Span<byte> buffer) -> di::Result<usize> override;
    auto write_exactly(di::Span<byte const> data) -> di::Result<> override;
    void set_window_size(Size const& size) override;

    // Hangs up the child and wakes any pending read. The engine discards what that
    // read returns.
    void close() override;

private:
    dius::SyncFile m_pty_controller;
    dius::system::ProcessHandle m_process;
};

/// @brief Already open files, such as stdin and stdout of an inetd style server
///
/// The files are not owned. close() cannot interrupt a blocked read of a regular
/// file descriptor, so the stream only ends when the peer closes its side.
class FileByteStream final : public ByteStream {
public:
    explicit FileByteStream(dius::SyncFile& input, dius::SyncFile& output) : m_input(input), m_output(output) {}

    auto read_some(di::Span<byte> buffer) -> di::Result<usize> override { return m_input.read_some(buffer); }
    auto write_exactly(di::Span<byte const> data) -> di::Result<> override { return m_output.write_exactly(data); }
    void close() override {}

private:
    dius::SyncFile& m_input;
    dius::SyncFile& m_output;
};

/// @brief In memory stream, fed by the embedding application
///
/// Bytes passed to feed() are returned by read_some() in order. Bytes written by
/// the engine are collected and can be taken with take_written(). After finish()
/// or close(), read_some() drains the remaining input and then returns 0.
class ChannelByteStream final : public ByteStream {
public:
    void feed(di::Span<byte const> data);
    void feed(di::StringView data);
    void finish();

    auto take_written() -> di::Vector<byte>;

    auto read_some(di::Span<byte> buffer) -> di::Result<usize> override;
    auto write_exactly(di::Span<byte const> data) -> di::Result<> override;
    void close() override;

private:
    struct State {
        di::Queue<byte> input;
        di::Vector<byte> written;
        bool finished { false };
        bool closed { false };
    };

    di::Synchronized<State> m_state;
    dius::ConditionVariable m_condition;
};
}
