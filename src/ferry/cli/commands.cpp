// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/cli/console_messenger.hpp>
#include <ferry/archive/seven_zip_codec.hpp>
#include <ferry/core/http_session.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/resource_registry.hpp>
#include <ferry/core/settings.hpp>
#include <ferry/core/sweeper.hpp>
#include <ferry/core/user_store.hpp>
#include <ferry/engine/task_engine.hpp>
#include <ferry/media/ffmpeg_tool.hpp>
#include <ferry/version.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <thread>

namespace ferry::cli {

namespace chrono = std::chrono;

namespace {

constexpr links::MessageId CONSOLE_MESSAGE = 1;

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) {
    g_interrupted.store(true);
}

int fail(const core::Failure& failure) {
    if (failure.is(core::TaskErrc::cancelled)) {
        std::cout << "Cancelled." << std::endl;
        return 130;
    }
    std::cerr << "Error: " << failure.message() << std::endl;
    if (failure.is(core::TaskErrc::password_required)) {
        std::cerr << "Retry with -p <password>" << std::endl;
    }
    return 1;
}

// Everything a command needs, wired from Settings
class Console {
public:
    Console(const core::Settings& settings, const CliArgs& args)
        : registry_(settings.registry_journal.empty()
                        ? settings.temp_dir / "registry.json"
                        : settings.registry_journal)
        , users_(settings.user_store)
        , codec_(settings.seven_zip)
        , media_(settings.ffmpeg)
        , messenger_(std::cout, args.output_dir)
        , engine_(engine::EngineContext{settings, coordinator_, registry_, users_,
                                        http_, codec_, media_, messenger_})
        , sweeper_(registry_, coordinator_, settings.sweep_interval)
        , user_(args.user) {
        users_.set_default_auto_delete(settings.ttl_minutes);
        sweeper_.start();

        // Ctrl-C becomes a cooperative cancel of the running task
        watcher_ = std::jthread([this](std::stop_token stoken) {
            while (!stoken.stop_requested()) {
                if (g_interrupted.exchange(false)) {
                    if (!engine_.cancel(user_)) {
                        std::cerr << "\nNothing to cancel" << std::endl;
                    }
                }
                std::this_thread::sleep_for(chrono::milliseconds(200));
            }
        });
    }

    ~Console() {
        watcher_.request_stop();
        sweeper_.stop();
        sweeper_.run_once();
    }

    engine::TaskEngine& engine() noexcept { return engine_; }
    core::ResourceRegistry& registry() noexcept { return registry_; }
    core::UserId user() const noexcept { return user_; }

private:
    core::TaskCoordinator coordinator_;
    core::ResourceRegistry registry_;
    core::UserStore users_;
    core::HttpSession http_;
    archive::SevenZipCodec codec_;
    media::FfmpegTool media_;
    ConsoleMessenger messenger_;
    engine::TaskEngine engine_;
    core::Sweeper sweeper_;
    core::UserId user_;
    std::jthread watcher_;
};

void print_groups(const links::LinkGroups& groups) {
    for (auto kind : {links::LinkKind::cloud_drive, links::LinkKind::platform_internal,
                      links::LinkKind::streaming_manifest, links::LinkKind::direct,
                      links::LinkKind::unknown}) {
        const auto& bucket = groups.bucket(kind);
        if (bucket.empty()) continue;
        std::cout << links::to_string(kind) << " (" << bucket.size() << ")" << std::endl;
        for (const auto& url : bucket) {
            std::cout << "  " << url << std::endl;
        }
    }
}

void print_selection(const media::StreamSelectionTask& task) {
    std::cout << "Qualities for " << task.manifest_url << ":" << std::endl;
    for (std::size_t i = 0; i < task.variants.size(); ++i) {
        std::cout << "  [" << i << "] " << task.variants[i].label << std::endl;
    }
}

//=============================================================================
// Commands
//=============================================================================

int cmd_extract(Console& console, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: extract needs an archive path" << std::endl;
        return 1;
    }

    auto& engine = console.engine();
    auto outcome = engine.extract_archive(console.user(), args.operands[0], args.password);
    if (!outcome) {
        return fail(outcome.error());
    }

    const auto& files = outcome->result.files;
    for (std::size_t i = 0; i < files.size(); ++i) {
        std::cout << "  " << i << ": " << files[i] << std::endl;
    }
    if (args.verbose && !outcome->links.empty()) {
        print_groups(outcome->links);
    }

    if (args.send_all) {
        auto report = engine.send_all(console.user(), outcome->delivery);
        if (!report) {
            return fail(report.error());
        }
        if (report->cancelled) {
            return 130;
        }
        return report->failed > 0 ? 1 : 0;
    }
    return 0;
}

int cmd_audio(Console& console, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: audio needs a video path" << std::endl;
        return 1;
    }
    auto audio = console.engine().extract_audio(console.user(), args.operands[0]);
    return audio ? 0 : fail(audio.error());
}

int cmd_links(Console& console, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: links needs a text file or '-' for stdin" << std::endl;
        return 1;
    }

    auto& engine = console.engine();
    const links::ChatId chat = console.user();

    links::LinkBatch batch;
    if (args.operands[0] == "-") {
        std::string text(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        batch = engine.remember_links(chat, CONSOLE_MESSAGE, std::move(text));
    } else {
        auto remembered = engine.remember_document(chat, CONSOLE_MESSAGE, args.operands[0]);
        if (!remembered) {
            return fail(remembered.error());
        }
        batch = std::move(*remembered);
    }

    if (args.clean) {
        auto text = engine.clean_links(chat, CONSOLE_MESSAGE);
        if (!text) {
            return fail(text.error());
        }
        std::cout << *text << std::endl;
        return 0;
    }

    if (!args.download) {
        print_groups(engine.classifier().group(batch.extracted_urls, /*dedupe=*/false));
        return batch.extracted_urls.empty() ? 1 : 0;
    }

    auto result = engine.download_links(console.user(), chat, CONSOLE_MESSAGE);
    if (!result) {
        return fail(result.error());
    }
    for (const auto& item : result->failures) {
        std::cerr << "  failed: " << item.url << " (" << item.failure.message() << ")" << std::endl;
    }
    for (const auto& item : result->manifest_failures) {
        std::cerr << "  manifest failed: " << item.url << " (" << item.failure.message() << ")" << std::endl;
    }
    for (const auto& task : result->selections) {
        print_selection(task);
        std::cout << "  use: ferry remux " << task.manifest_url << " <index>" << std::endl;
    }
    if (result->cancelled) {
        return 130;
    }
    return result->fail > 0 ? 1 : 0;
}

int cmd_variants(Console& console, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: variants needs a manifest URL" << std::endl;
        return 1;
    }
    auto task = console.engine().offer_stream(console.user(), args.operands[0]);
    if (!task) {
        return fail(task.error());
    }
    print_selection(*task);
    return 0;
}

int cmd_remux(Console& console, const CliArgs& args) {
    if (args.operands.size() < 2) {
        std::cerr << "Error: remux needs a manifest URL and a variant index" << std::endl;
        return 1;
    }

    char* end = nullptr;
    auto index = std::strtoul(args.operands[1].c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        std::cerr << "Error: bad variant index '" << args.operands[1] << "'" << std::endl;
        return 1;
    }

    auto& engine = console.engine();
    auto task = engine.offer_stream(console.user(), args.operands[0]);
    if (!task) {
        return fail(task.error());
    }
    auto file = engine.choose_variant(console.user(), task->id, index);
    return file ? 0 : fail(file.error());
}

int cmd_sweep(Console& console) {
    auto report = console.registry().sweep();
    std::cout << "Expired records: " << report.removed.size()
              << " | removed dirs: " << report.deleted.size()
              << " | still tracked: " << console.registry().size() << std::endl;
    for (const auto& error : report.errors) {
        std::cerr << "  " << error << std::endl;
    }
    return report.errors.empty() ? 0 : 1;
}

int cmd_classify(Console& console, const CliArgs& args) {
    for (const auto& url : args.operands) {
        std::cout << links::to_string(console.engine().classifier().classify(url)) << "\t" << url << std::endl;
    }
    return 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto need_value = [&](int& i, std::string_view flag) -> const char* {
        if (i + 1 >= argc) {
            args.error = std::string(flag) + " needs a value";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = need_value(i, arg)) args.config_path = v;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = need_value(i, arg)) args.output_dir = v;
        } else if (arg == "-p" || arg == "--password") {
            if (auto v = need_value(i, arg)) args.password = v;
        } else if (arg == "-u" || arg == "--user") {
            if (auto v = need_value(i, arg)) {
                char* end = nullptr;
                args.user = std::strtoll(v, &end, 10);
                if (end == nullptr || *end != '\0') {
                    args.error = "bad user id '" + std::string(v) + "'";
                }
            }
        } else if (arg == "--send-all") {
            args.send_all = true;
        } else if (arg == "--clean") {
            args.clean = true;
        } else if (arg == "--download") {
            args.download = true;
        } else if (arg.starts_with("-") && arg != "-") {
            args.error = "unknown option " + arg;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }

        if (!args.error.empty()) break;
    }

    return args;
}

//=============================================================================
// Dispatch
//=============================================================================

int run(const CliArgs& args) {
    auto settings = core::Settings::load(args.config_path);
    if (!settings) {
        return fail(settings.error());
    }
    if (args.verbose) {
        settings->log_level = "debug";
    }
    core::set_log_level(settings->log_level);

    if (args.command != "extract" && args.command != "audio" && args.command != "links" &&
        args.command != "variants" && args.command != "remux" && args.command != "sweep" &&
        args.command != "classify") {
        std::cerr << "Error: unknown command '" << args.command << "'" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    core::HttpSession::global_init();
    std::signal(SIGINT, on_interrupt);

    int exit_code = 0;
    {
        Console console(*settings, args);

        if (args.command == "extract") {
            exit_code = cmd_extract(console, args);
        } else if (args.command == "audio") {
            exit_code = cmd_audio(console, args);
        } else if (args.command == "links") {
            exit_code = cmd_links(console, args);
        } else if (args.command == "variants") {
            exit_code = cmd_variants(console, args);
        } else if (args.command == "remux") {
            exit_code = cmd_remux(console, args);
        } else if (args.command == "sweep") {
            exit_code = cmd_sweep(console);
        } else {
            exit_code = cmd_classify(console, args);
        }
    }

    core::HttpSession::global_cleanup();
    return exit_code;
}

void print_help(std::string_view program_name) {
    std::cout << "ferry " << ferry::version.to_string() << " - per-user archive, audio and link download tasks\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]...\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  extract <ARCHIVE>          Extract an archive and list its files\n";
    std::cout << "  audio <VIDEO>              Copy the audio track to <name>.m4a\n";
    std::cout << "  links <FILE|->             Classify links found in a text file or stdin\n";
    std::cout << "  variants <URL>             List the qualities of an m3u8 manifest\n";
    std::cout << "  remux <URL> <INDEX>        Save one quality of an m3u8 manifest\n";
    std::cout << "  sweep                      Delete expired temporary directories\n";
    std::cout << "  classify <URL>...          Print the category of each URL\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -V, --verbose              Debug logging\n";
    std::cout << "  -c, --config <FILE>        Settings file (default: ferry.json)\n";
    std::cout << "  -u, --user <ID>            Act as this user id (default: 1)\n";
    std::cout << "  -o, --output <DIR>         Copy delivered files into DIR\n";
    std::cout << "  -p, --password <PW>        Archive password (extract)\n";
    std::cout << "      --send-all             Deliver every extracted file (extract)\n";
    std::cout << "      --clean                Print sorted unique links only (links)\n";
    std::cout << "      --download             Download every link (links)\n";
    std::cout << "\n";
    std::cout << "Ctrl-C cancels the running task at its next checkpoint.\n";
}

void print_version() {
    std::cout << "ferry " << ferry::version.to_string() << std::endl;
    std::cout << "Built " << ferry::BUILD_DATE << " with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace ferry::cli
