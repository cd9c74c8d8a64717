#include "di/sync/atomic.h"
#include "di/test/prelude.h"
#include "di/vocab/span/as_bytes.h"
#include "dius/steady_clock.h"
#include "dius/thread.h"
#include "vtcore/byte_stream.h"
#include "vtcore/engine.h"
#include "vtcore/telnet/telnet_protocol.h"

namespace engine {
using namespace vtcore;

// Counts close() calls, and otherwise behaves like a channel.
class CountingByteStream final : public ByteStream {
public:
    auto read_some(di::Span<byte> buffer) -> di::Result<usize> override { return m_channel.read_some(buffer); }
    auto write_exactly(di::Span<byte const> data) -> di::Result<> override { return m_channel.write_exactly(data); }
    void close() override {
        m_close_count.fetch_add(1, di::MemoryOrder::Relaxed);
        m_channel.close();
    }

    auto channel() -> ChannelByteStream& { return m_channel; }
    auto close_count() const -> u32 { return m_close_count.load(di::MemoryOrder::Relaxed); }

private:
    ChannelByteStream m_channel;
    di::Atomic<u32> m_close_count { 0 };
};

static auto deadline() -> dius::SteadyClock::TimePoint {
    return dius::SteadyClock::now() + di::Milliseconds(5000);
}

static auto make_config(u32 rows, u32 cols) -> EngineConfig {
    auto config = EngineConfig {};
    config.size = { rows, cols };
    return config;
}

static auto text(di::Vector<byte> const& bytes) -> di::TransparentString {
    auto result = ""_ts;
    for (auto value : bytes) {
        result.push_back(char(di::to_integer<u8>(value)));
    }
    return result;
}

static auto feed_and_wait(Engine& engine, ChannelByteStream& channel, di::TransparentStringView data) -> bool {
    auto since = engine.output_generation();
    channel.feed(di::as_bytes(data.span()));
    return engine.wait_for_output(since, deadline());
}

// Poll snapshots until one of the rows has the expected text.
static auto wait_for_row(Engine& engine, usize row, di::StringView expected) -> bool {
    auto end = deadline();
    while (dius::SteadyClock::now() < end) {
        auto state = engine.capture_state();
        if (row < state.rows.size() && state.rows[row].text() == expected) {
            return true;
        }
        dius::this_thread::sleep_until(dius::SteadyClock::now() + di::Milliseconds(1));
    }
    return false;
}

static auto count_closed(di::Vector<EngineEvent> const& events) -> usize {
    auto result = 0zu;
    for (auto const& event : events) {
        if (di::get_if<Closed>(event)) {
            result++;
        }
    }
    return result;
}

// Drain events until the reader stops, returning everything seen.
static auto wait_until_closed(Engine& engine) -> di::Vector<EngineEvent> {
    auto result = di::Vector<EngineEvent> {};
    auto end = deadline();
    while (dius::SteadyClock::now() < end) {
        for (auto& event : engine.wait_for_events(end)) {
            result.push_back(di::move(event));
        }
        if (count_closed(result) > 0) {
            break;
        }
    }
    return result;
}

static void create() {
    auto bad_size = Engine::create(make_config(0, 80), di::make_box<ChannelByteStream>());
    ASSERT(!bad_size);

    auto no_command = Engine::create_for_command(make_config(24, 80), {});
    ASSERT(!no_command);
}

static void output() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    ASSERT_EQ(engine.size(), (Size { 3, 10 }));
    ASSERT_EQ(engine.output_generation(), 0u);

    ASSERT(feed_and_wait(engine, channel, "hello\r\nworld"_tsv));
    ASSERT_GT(engine.output_generation(), 0u);
    ASSERT_EQ(engine.capture_state().text(), "hello\nworld\n"_sv);
    ASSERT_EQ(engine.cursor(), (terminal::Cursor { .row = 1, .col = 5 }));

    auto cell = engine.cell_at(0, 1);
    ASSERT(cell);
    ASSERT_EQ(cell->code_point, U'e');
    ASSERT(!engine.cell_at(5, 5));

    // Multi-byte characters may be split across reads.
    ASSERT(feed_and_wait(engine, channel, "\r\n\xe2\x82"_tsv));
    ASSERT(feed_and_wait(engine, channel, "\xac"_tsv));
    ASSERT_EQ(engine.capture_state().rows[2].text(), "€"_sv);

    auto events = engine.poll_events();
    ASSERT(!events.empty());
    auto last = di::get_if<OutputProcessed>(events.back().value());
    ASSERT(last);
    ASSERT_EQ(last->generation, engine.output_generation());
}

static void replies() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    // Replies are written before the output counts as processed.
    ASSERT(feed_and_wait(engine, channel, "hello\033[6n\033[5n"_tsv));
    ASSERT_EQ(text(channel.take_written()), "\033[1;6R\033[0n"_tsv);

    ASSERT(engine.write("ls\r"_sv));
    ASSERT_EQ(text(channel.take_written()), "ls\r"_tsv);
}

static void events() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    ASSERT(feed_and_wait(engine, channel, "\033]2;title\033\\\033]52;c;?\033\\"_tsv));
    ASSERT_EQ(engine.title(), "title"_sv);

    auto events = engine.poll_events();
    ASSERT_EQ(events.size(), 3u);

    auto title = di::get_if<TitleChanged>(events[0]);
    ASSERT(title);
    ASSERT_EQ(title->change.title, "title"_sv);

    auto selection = di::get_if<SelectionRequested>(events[1]);
    ASSERT(selection);
    ASSERT(selection->request.query);

    ASSERT(di::get_if<OutputProcessed>(events[2]));

    // Events are only delivered once.
    ASSERT(engine.poll_events().empty());

    // The embedding application answers the query.
    auto contents = di::Array { byte('h'), byte('i') };
    ASSERT(engine.reply_to_selection_query(selection->request, contents.span()));
    ASSERT_EQ(text(channel.take_written()), "\033]52;c;aGk=\033\\"_tsv);

    ASSERT(!engine.reply_to_selection_query(terminal::OSC52 { "c"_s, {}, false }, contents.span()));
}

static void mouse() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(10, 20), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    auto press = input::MouseEvent::press(input::MouseButton::Left, 1, 2);
    ASSERT(!engine.send_mouse_event(press));

    ASSERT(feed_and_wait(engine, channel, "\033[?1002h\033[?1006h"_tsv));
    ASSERT(engine.send_mouse_event(press));
    ASSERT_EQ(text(channel.take_written()), "\033[<0;3;2M"_tsv);

    // Motion without a button is not reported in button event mode.
    ASSERT(!engine.send_mouse_event(input::MouseEvent::move(input::MouseButton::None, 2, 2)));
}

static void event_queue_bounded() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    // Output notifications collapse into the newest one when nobody polls.
    for (auto _ : di::range(200)) {
        ASSERT(feed_and_wait(engine, channel, "x"_tsv));
    }
    ASSERT_EQ(engine.queued_event_count(), 1u);

    auto events = engine.poll_events();
    ASSERT_EQ(events.size(), 1u);
    auto processed = di::get_if<OutputProcessed>(events[0]);
    ASSERT(processed);
    ASSERT_EQ(processed->generation, engine.output_generation());

    // Other events are capped, and the oldest ones are dropped.
    for (auto _ : di::range(Engine::max_queued_events / 2 + 100)) {
        ASSERT(feed_and_wait(engine, channel, "\033]2;a\033\\\033]2;b\033\\"_tsv));
    }
    ASSERT_EQ(engine.queued_event_count(), Engine::max_queued_events);

    events = engine.poll_events();
    ASSERT_EQ(events.size(), Engine::max_queued_events);
    ASSERT(di::get_if<OutputProcessed>(events.back().value()));
    ASSERT_EQ(engine.queued_event_count(), 0u);
}

static void wait_for_output_deadline() {
    auto stream = di::make_box<ChannelByteStream>();
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    auto start = dius::SteadyClock::now();
    ASSERT(!engine.wait_for_output(engine.output_generation(), start + di::Milliseconds(20)));
    ASSERT(dius::SteadyClock::now() >= start + di::Milliseconds(20));

    ASSERT(engine.wait_for_events(dius::SteadyClock::now() + di::Milliseconds(20)).empty());
}

static void resize() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    ASSERT(feed_and_wait(engine, channel, "a\r\nb\r\nc"_tsv));
    engine.resize({ 2, 5 });
    ASSERT_EQ(engine.size(), (Size { 2, 5 }));

    auto state = engine.capture_state();
    ASSERT_EQ(state.text(), "b\nc"_sv);
    ASSERT_EQ(state.scroll_back.size(), 1u);

    engine.set_scroll_back_limit(0);
    ASSERT(engine.capture_state().scroll_back.empty());

    // Empty sizes are ignored.
    engine.resize({ 0, 0 });
    ASSERT_EQ(engine.size(), (Size { 2, 5 }));
}

static void end_of_stream() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    channel.feed("done"_sv);
    channel.finish();

    auto events = wait_until_closed(engine);
    ASSERT_EQ(count_closed(events), 1u);
    ASSERT(di::get_if<Closed>(events.back().value()));
    ASSERT(engine.is_closed());

    // The final state is kept.
    ASSERT_EQ(engine.capture_state().rows[0].text(), "done"_sv);
    ASSERT(!engine.wait_for_output(engine.output_generation(), deadline()));
}

static void close() {
    auto stream = di::make_box<CountingByteStream>();
    auto& counting = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    ASSERT(feed_and_wait(engine, counting.channel(), "before"_tsv));

    // Every caller returns once the reader has stopped, but the stream is closed only once.
    auto threads = di::Vector<dius::Thread> {};
    for (auto _ : di::range(4)) {
        auto thread = dius::Thread::create([&] {
            engine.close();
        });
        ASSERT(thread);
        threads.push_back(di::move(thread).value());
    }
    engine.close();
    for (auto& thread : threads) {
        (void) thread.join();
    }
    engine.close();

    ASSERT(engine.is_closed());
    ASSERT_EQ(counting.close_count(), 1u);

    auto events = engine.poll_events();
    ASSERT_EQ(count_closed(events), 1u);
    ASSERT(engine.poll_events().empty());

    // Everything but queries is now a no-op.
    ASSERT(engine.write("ignored"_sv));
    ASSERT(!engine.send_mouse_event(input::MouseEvent::press(input::MouseButton::Left, 0, 0)));
    engine.resize({ 5, 5 });
    ASSERT_EQ(engine.size(), (Size { 3, 10 }));
    ASSERT_EQ(engine.capture_state().text(), "before\n\n"_sv);
    ASSERT(counting.channel().take_written().empty());
}

static void close_ignoring_hangup() {
    auto command = di::Vector<di::TransparentString> {};
    command.push_back("sh"_ts);
    command.push_back("-c"_ts);
    command.push_back("trap '' HUP; echo ready; sleep 10"_ts);

    auto result = Engine::create_for_command(make_config(5, 40), di::move(command));
    ASSERT(result);
    auto& engine = **result;
    ASSERT(wait_for_row(engine, 0, "ready"_sv));

    // The child outlives the hangup, but close() still stops the reader.
    auto start = dius::SteadyClock::now();
    engine.close();
    ASSERT(dius::SteadyClock::now() < start + di::Milliseconds(5000));
    ASSERT(engine.is_closed());

    auto events = engine.poll_events();
    ASSERT_EQ(count_closed(events), 1u);
    ASSERT_EQ(engine.capture_state().rows[0].text(), "ready"_sv);
}

static void concurrent_capture() {
    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(make_config(3, 10), di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    auto writer = dius::Thread::create([&] {
        for (auto _ : di::range(500)) {
            channel.feed("0123456789\033[2J\033[Habc\r\n\r\n\r\nscrolled"_sv);
        }
    });
    ASSERT(writer);

    auto resizer = dius::Thread::create([&] {
        for (auto i : di::range(200)) {
            engine.resize(i % 2 == 0 ? Size { 5, 20 } : Size { 3, 10 });
        }
    });
    ASSERT(resizer);

    // Every snapshot is a whole number of updates, never a half applied one.
    for (auto _ : di::range(200)) {
        auto state = engine.capture_state();
        ASSERT(state.size == (Size { 3, 10 }) || state.size == (Size { 5, 20 }));
        ASSERT_EQ(state.rows.size(), state.size.rows);
        for (auto const& row : state.rows) {
            ASSERT_EQ(row.cells.size(), state.size.cols);
        }
        ASSERT_LT(state.cursor.row, state.size.rows);
        ASSERT_LT(state.cursor.col, state.size.cols);
    }

    (void) writer->join();
    (void) resizer->join();
    engine.resize({ 3, 10 });
    ASSERT(feed_and_wait(engine, channel, "\033[2J\033[Hend"_tsv));
    ASSERT_EQ(engine.capture_state().text(), "end\n\n"_sv);
}

static void telnet() {
    auto config = make_config(5, 20);
    config.telnet = true;

    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(config, di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    // Negotiation starts as soon as the engine is created.
    auto expected = telnet::TelnetProtocol {};
    ASSERT_EQ(channel.take_written(), expected.initial_negotiation());

    // The client agrees to report its window size and terminal type.
    ASSERT(feed_and_wait(engine, channel, "\xff\xfb\x1f\xff\xfb\x18x"_tsv));
    ASSERT_EQ(text(channel.take_written()), "\xff\xfa\x18\x01\xff\xf0"_tsv);

    ASSERT(feed_and_wait(engine, channel,
                         "\xff\xfa\x1f\x00\x28\x00\x0a\xff\xf0"
                         "\xff\xfa\x18\x00xterm\xff\xf0"
                         "y"_tsv));
    ASSERT_EQ(engine.size(), (Size { 10, 40 }));
    ASSERT_EQ(engine.telnet_terminal_type(), "xterm"_ts);
    ASSERT_EQ(engine.capture_state().rows[0].text(), "xy"_sv);

    // Data sent to the client is escaped.
    auto data = di::Array { byte('a'), byte(0xff) };
    ASSERT(engine.write(data.span()));
    ASSERT_EQ(text(channel.take_written()), "a\xff\xff"_tsv);
}

static void telnet_resize_order() {
    auto config = make_config(2, 4);
    config.telnet = true;

    auto stream = di::make_box<ChannelByteStream>();
    auto& channel = *stream;
    auto result = Engine::create(config, di::move(stream));
    ASSERT(result);
    auto& engine = **result;

    // Text before the window size report wraps at the old width, and text after it
    // continues at the new one.
    channel.feed("\xff\xfb\x1f"
                 "abcde\xff\xfa\x1f\x00\x0a\x00\x02\xff\xf0"
                 "f"_sv);
    ASSERT(wait_for_row(engine, 1, "ef"_sv));
    ASSERT_EQ(engine.size(), (Size { 2, 10 }));
    ASSERT_EQ(engine.capture_state().rows[0].text(), "abcd"_sv);
}

TEST(engine, create)
TEST(engine, output)
TEST(engine, replies)
TEST(engine, events)
TEST(engine, mouse)
TEST(engine, event_queue_bounded)
TEST(engine, wait_for_output_deadline)
TEST(engine, resize)
TEST(engine, end_of_stream)
TEST(engine, close)
TEST(engine, close_ignoring_hangup)
TEST(engine, concurrent_capture)
TEST(engine, telnet)
TEST(engine, telnet_resize_order)
}
