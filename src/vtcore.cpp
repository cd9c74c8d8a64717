#include "di/cli/parser.h"
#include "di/container/string/string_view.h"
#include "di/io/writer_print.h"
#include "di/util/scope_exit.h"
#include "di/vocab/span/as_bytes.h"
#include "dius/main.h"
#include "dius/print.h"
#include "dius/steady_clock.h"
#include "dius/sync_file.h"
#include "vtcore/byte_stream.h"
#include "vtcore/engine.h"
#include "vtcore/image/glyph_encoder.h"

namespace vtcore {
struct Args {
    di::Vector<di::TransparentStringView> command;
    u32 rows { 24 };
    u32 cols { 80 };
    usize scroll_back { terminal::ScrollBack::default_limit };
    bool telnet { false };
    di::Optional<di::PathView> replay_path;
    di::Optional<image::GlyphSet> glyphs;
    di::Optional<di::PathView> log_path;
    bool help { false };

    constexpr static auto get_cli_parser() {
        return di::cli_parser<Args>("vtcore"_sv, "Headless terminal emulator"_sv)
            .option<&Args::rows>('r', "rows"_tsv, "Number of rows in the terminal"_sv)
            .option<&Args::cols>('c', "cols"_tsv, "Number of columns in the terminal"_sv)
            .option<&Args::scroll_back>('s', "scrollback"_tsv, "Maximum rows kept in the scroll back (0 disables)"_sv)
            .option<&Args::telnet>('t', "telnet"_tsv, "Serve a telnet client connected to stdin and stdout"_sv)
            .option<&Args::replay_path>('R', "replay"_tsv, "Replay a captured byte stream and print the screen"_sv)
            .option<&Args::glyphs>('g', "glyphs"_tsv,
                                   "Also print decoded images as text, using the given glyph set"_sv)
            .option<&Args::log_path>('l', "log-path"_tsv, "Log file path (default /tmp/vtcore.log)"_sv)
            .argument<&Args::command>("COMMAND"_sv, "Program to run in terminal"_sv)
            .help();
    }
};

// Drain events until the reader thread stops, remembering decoded images. OSC 52 is
// served from a private clipboard, which lives as long as the session.
static auto wait_until_closed(Engine& engine) -> di::Vector<u32> {
    auto image_ids = di::Vector<u32> {};
    auto clipboard = di::Vector<byte> {};
    for (;;) {
        auto events = engine.wait_for_events(dius::SteadyClock::now() + di::Milliseconds(100));
        auto closed = false;
        for (auto& event : events) {
            if (auto ev = di::get_if<ImageDecoded>(event)) {
                image_ids.push_back(ev->image_id);
            } else if (auto ev = di::get_if<TitleChanged>(event)) {
                dius::eprintln("vtcore: title changed to {:?}"_sv, ev->change.title);
            } else if (auto ev = di::get_if<SelectionRequested>(event)) {
                if (!ev->request.query) {
                    clipboard = ev->request.contents() | di::to<di::Vector>();
                } else if (!engine.reply_to_selection_query(ev->request, clipboard.span())) {
                    dius::eprintln("vtcore: failed to answer a selection query"_sv);
                }
            } else if (di::get_if<Closed>(event)) {
                closed = true;
            }
        }
        if (closed) {
            return image_ids;
        }
    }
}

static void print_state(Engine& engine, EngineConfig const& config, di::Span<u32 const> image_ids,
                        di::Optional<image::GlyphSet> glyphs, dius::SyncFile& output) {
    auto snapshot = engine.capture_state();
    (void) di::writer_println<di::String::Encoding>(output, "{}"_sv, snapshot.text());

    if (!glyphs) {
        return;
    }

    auto cell_size = config.cell_size();
    for (auto id : image_ids) {
        auto image = snapshot.image(id);
        if (!image) {
            // Scrolled off the screen.
            continue;
        }
        auto glyph_image = image::encode_glyphs(*image, *glyphs, cell_size.xpixels, cell_size.ypixels);
        (void) di::writer_print<di::String::Encoding>(output, "{}\033[m\n"_sv, glyph_image.to_ansi());
    }
}

static auto replay(ChannelByteStream& channel, di::PathView path) -> di::Result<> {
    auto file = TRY(dius::open_sync(path, dius::OpenMode::Readonly));
    auto _ = di::ScopeExit([&] {
        channel.finish();
    });

    auto buffer = di::Vector<byte> {};
    buffer.resize(16384);
    for (;;) {
        auto nread = TRY(file.read_some(buffer.span()));
        if (nread == 0) {
            break;
        }
        channel.feed(di::Span<byte const> { buffer.data(), nread });
    }

    return {};
}

static auto main(Args& args) -> di::Result<void> {
    auto config = EngineConfig {};
    config.size = Size { args.rows, args.cols };
    config.scroll_back_limit = args.scroll_back;
    config.telnet = args.telnet;
    if (config.size.empty()) {
        dius::eprintln("error: vtcore requires a non-zero terminal size"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    if (args.command.empty() && !args.replay_path && !args.telnet) {
        dius::eprintln("error: vtcore requires a command argument to know what to launch"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    // Setup - log to file.
    [[maybe_unused]] auto& log = dius::stderr =
        TRY(dius::open_sync(args.log_path.value_or("/tmp/vtcore.log"_pv), dius::OpenMode::WriteClobber));

    if (args.replay_path) {
        auto stream = di::make_box<ChannelByteStream>();
        auto& channel = *stream;
        auto engine = TRY(Engine::create(config, di::move(stream)));
        TRY(replay(channel, *args.replay_path));

        auto image_ids = wait_until_closed(*engine);
        print_state(*engine, config, image_ids.span(), args.glyphs, dius::stdout);
        return {};
    }

    if (args.telnet) {
        // stdout belongs to the telnet client, so the final screen goes to the log.
        auto engine = TRY(Engine::create(config, di::make_box<FileByteStream>(dius::stdin, dius::stdout)));
        auto image_ids = wait_until_closed(*engine);
        if (engine->telnet_terminal_type()) {
            dius::eprintln("vtcore: telnet client reported its terminal type"_sv);
        }
        print_state(*engine, config, image_ids.span(), args.glyphs, dius::stderr);
        return {};
    }

    auto command = args.command | di::transform(di::to_owned) | di::to<di::Vector>();
    auto engine = TRY(Engine::create_for_command(config, di::move(command)));
    auto image_ids = wait_until_closed(*engine);
    print_state(*engine, config, image_ids.span(), args.glyphs, dius::stdout);
    return {};
}
}

DIUS_MAIN(vtcore::Args, vtcore)
