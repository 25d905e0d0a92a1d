// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/cli/commands.hpp>
#include <haul/cli/progress_bar.hpp>
#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/http_session.hpp>
#include <haul/core/log.hpp>
#include <haul/core/scheduler.hpp>
#include <haul/store/json_task_store.hpp>
#include <haul/version.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

using namespace haul::core;

namespace chrono = std::chrono;

namespace haul::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

// Scheduler plus the store it persists to, built per invocation
struct App {
    SchedulerConfig config;
    std::unique_ptr<Scheduler> scheduler;
};

bool parse_number(const char* text, std::uint64_t& out) noexcept {
    if (text == nullptr || *text == '\0' || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtoull(text, &end, 10);
    return errno == 0 && end != nullptr && *end == '\0';
}

bool is_hex(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

std::size_t digest_length(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::md5:    return 32;
        case DigestAlgorithm::sha1:   return 40;
        case DigestAlgorithm::sha256: return 64;
    }
    return 0;
}

void report(const std::error_code& ec, std::string_view what) {
    std::cerr << "Error: " << what << ": " << ec.message() << std::endl;
}

std::expected<App, std::error_code> open_app(const CliArgs& args) {
    App app;

    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            report(loaded.error(), "cannot load config " + args.config_path);
            return std::unexpected(loaded.error());
        }
        app.config = std::move(*loaded);
    }

    if (!args.download_dir.empty()) app.config.download_dir = args.download_dir;
    if (args.jobs > 0) app.config.max_concurrent = args.jobs;
    if (args.verbose) app.config.log_level = "debug";
    if (args.quiet) app.config.log_level = "error";

    if (auto ec = app.config.validate()) {
        report(ec, "bad settings");
        return std::unexpected(ec);
    }

    log::init(log::parse_level(app.config.log_level), app.config.log_file);

    const std::string store_path = args.store_path.empty()
        ? std::string(STORE_FILE_NAME) : args.store_path;
    auto store = store::JsonTaskStore::open(store_path);
    if (!store) {
        report(store.error(), "cannot open task store " + store_path);
        return std::unexpected(store.error());
    }

    HttpSession::Options http;
    http.connect_timeout_sec = app.config.connect_timeout_sec;
    http.stall_timeout_sec = app.config.stall_timeout_sec;

    app.scheduler = std::make_unique<Scheduler>(
        app.config,
        std::shared_ptr<store::TaskStore>(std::move(*store)),
        std::make_shared<HttpSession>(std::move(http)));

    // Only `run` transfers; other commands must not rewrite the records of
    // a `run` that may be active in another process
    const auto recovery = args.command == "run" ? Recovery::persist : Recovery::in_memory;
    if (auto ec = app.scheduler->restore(recovery)) {
        report(ec, "cannot load tasks");
        return std::unexpected(ec);
    }
    return app;
}

// Exact id, or an unambiguous prefix of one
std::expected<std::string, std::error_code> resolve_id(const Scheduler& scheduler, std::string_view id) {
    if (scheduler.task(id)) {
        return std::string(id);
    }

    std::vector<std::string> matches;
    for (const auto& task : scheduler.tasks()) {
        if (task.id.starts_with(id)) {
            matches.push_back(task.id);
        }
    }
    if (matches.size() == 1) {
        return matches.front();
    }
    if (matches.size() > 1) {
        std::cerr << "Error: id prefix '" << id << "' matches " << matches.size() << " tasks" << std::endl;
    } else {
        std::cerr << "Error: no task '" << id << "'" << std::endl;
    }
    return std::unexpected(make_error_code(TaskErrc::task_not_found));
}

std::string describe_progress(const Task& task) {
    if (task.total_bytes) {
        const int pct = static_cast<int>(task.fraction() * 100.0);
        return std::to_string(pct) + "% of " + ProgressBar::format_bytes(*task.total_bytes);
    }
    if (task.partial_bytes > 0) {
        return ProgressBar::format_bytes(task.partial_bytes);
    }
    return "-";
}

//=============================================================================
// Commands
//=============================================================================

CliResult cmd_add(App& app, const CliArgs& args) {
    if (args.operands.size() != 1) {
        std::cerr << "Error: add takes exactly one URL" << std::endl;
        return std::unexpected(make_error_code(TaskErrc::invalid_url));
    }

    Task task;
    task.url = args.operands.front();
    task.source_id = args.source_id;
    task.priority = args.priority.value_or(Priority::normal);
    task.expected_bytes = args.size;
    task.digest = args.digest;
    if (!args.output_file.empty()) {
        task.save_path = args.output_file;
        task.file_name = std::filesystem::path(args.output_file).filename().string();
    }
    if (args.start_at) {
        task.scheduled_at = TimePoint(chrono::seconds(*args.start_at));
    }

    auto id = app.scheduler->enqueue_task(std::move(task));
    if (!id) {
        report(id.error(), "cannot add " + args.operands.front());
        return std::unexpected(id.error());
    }

    if (!args.quiet) {
        auto added = app.scheduler->task(*id);
        std::cout << *id;
        if (added) std::cout << "  " << added->save_path;
        std::cout << std::endl;
    } else {
        std::cout << *id << std::endl;
    }
    return 0;
}

CliResult cmd_list(App& app, const CliArgs& args) {
    auto tasks = app.scheduler->tasks();

    if (args.json) {
        auto out = nlohmann::json::array();
        for (const auto& task : tasks) {
            out.push_back(store::task_to_json(task));
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (tasks.empty()) {
        if (!args.quiet) std::cout << "No tasks" << std::endl;
        return 0;
    }

    std::cout << std::left
              << std::setw(18) << "ID"
              << std::setw(13) << "STATUS"
              << std::setw(8) << "PRIO"
              << std::setw(20) << "PROGRESS"
              << "NAME" << "\n";
    for (const auto& task : tasks) {
        std::cout << std::setw(18) << task.id
                  << std::setw(13) << to_string(task.status)
                  << std::setw(8) << to_string(task.priority)
                  << std::setw(20) << describe_progress(task)
                  << task.file_name << "\n";
        if (task.error_message && task.status == TaskStatus::error) {
            std::cout << "    " << *task.error_message << " (" << task.retry_count << " attempts)\n";
        }
    }

    auto stats = app.scheduler->stats();
    std::cout << "\n" << stats.queued << " queued, " << stats.paused << " paused, "
              << stats.completed << " completed, " << stats.failed << " failed, "
              << stats.cancelled << " cancelled" << std::endl;
    return 0;
}

// pause / resume / remove / retry
CliResult cmd_control(App& app, const CliArgs& args) {
    if (args.operands.size() != 1) {
        std::cerr << "Error: " << args.command << " takes one task id" << std::endl;
        return std::unexpected(make_error_code(TaskErrc::task_not_found));
    }

    auto id = resolve_id(*app.scheduler, args.operands.front());
    if (!id) return std::unexpected(id.error());

    std::error_code ec;
    if (args.command == "pause") {
        ec = app.scheduler->pause_task(*id);
    } else if (args.command == "resume") {
        ec = app.scheduler->resume_task(*id);
    } else if (args.command == "remove") {
        ec = app.scheduler->remove_task(*id);
    } else {
        ec = app.scheduler->retry_task(*id);
    }

    if (ec) {
        report(ec, args.command + " " + *id);
        return std::unexpected(ec);
    }

    if (!args.quiet) {
        if (auto task = app.scheduler->task(*id)) {
            std::cout << *id << ": " << to_string(task->status) << std::endl;
        }
    }
    return 0;
}

CliResult cmd_delete(App& app, const CliArgs& args) {
    if (args.operands.size() != 1) {
        std::cerr << "Error: delete takes one task id" << std::endl;
        return std::unexpected(make_error_code(TaskErrc::task_not_found));
    }

    auto id = resolve_id(*app.scheduler, args.operands.front());
    if (!id) return std::unexpected(id.error());

    if (auto ec = app.scheduler->delete_task(*id, args.with_file)) {
        report(ec, "delete " + *id);
        return std::unexpected(ec);
    }
    if (!args.quiet) std::cout << "Deleted " << *id << std::endl;
    return 0;
}

CliResult cmd_priority(App& app, const CliArgs& args) {
    if (args.operands.size() != 2) {
        std::cerr << "Error: priority takes a task id and low|normal|high" << std::endl;
        return std::unexpected(make_error_code(TaskErrc::invalid_transition));
    }

    auto level = parse_priority(args.operands[1]);
    if (!level) {
        std::cerr << "Error: unknown priority '" << args.operands[1] << "'" << std::endl;
        return std::unexpected(make_error_code(TaskErrc::invalid_transition));
    }

    auto id = resolve_id(*app.scheduler, args.operands.front());
    if (!id) return std::unexpected(id.error());

    if (auto ec = app.scheduler->set_priority(*id, *level)) {
        report(ec, "priority " + *id);
        return std::unexpected(ec);
    }
    return 0;
}

CliResult cmd_bulk(App& app, const CliArgs& args) {
    auto ec = args.command == "pause-all" ? app.scheduler->pause_all() : app.scheduler->resume_all();
    if (ec) {
        report(ec, args.command);
        return std::unexpected(ec);
    }
    if (!args.quiet) {
        auto stats = app.scheduler->stats();
        std::cout << stats.queued << " queued, " << stats.paused << " paused" << std::endl;
    }
    return 0;
}

CliResult cmd_prune(App& app, const CliArgs& args) {
    auto removed = app.scheduler->purge_completed(chrono::hours(24) * args.days);
    if (!removed) {
        report(removed.error(), "prune");
        return std::unexpected(removed.error());
    }
    if (!args.quiet) {
        std::cout << "Removed " << *removed << " completed tasks older than " << args.days << " days" << std::endl;
    }
    return 0;
}

// Drive the queue until nothing is left to do or the user interrupts
CliResult cmd_run(App& app, const CliArgs& args) {
    auto& scheduler = *app.scheduler;

    g_interrupted = 0;
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    ProgressBoard board;
    std::map<std::string, TaskStatus, std::less<>> seen;
    std::mutex seen_mutex;

    for (const auto& task : scheduler.tasks()) {
        board.label(task.id, task.file_name);
        seen.emplace(task.id, task.status);
    }

    // Announce status changes above the progress lines
    auto on_change = [&](const TasksChanged&) {
        std::lock_guard lock(seen_mutex);
        for (const auto& task : scheduler.tasks()) {
            auto [it, inserted] = seen.try_emplace(task.id, task.status);
            if (!inserted && it->second == task.status) continue;
            it->second = task.status;
            board.label(task.id, task.file_name);

            if (args.quiet) continue;
            switch (task.status) {
                case TaskStatus::completed:
                    board.message("done     " + task.file_name + " (" +
                                  ProgressBar::format_bytes(task.partial_bytes) + ")");
                    break;
                case TaskStatus::error:
                    board.message("failed   " + task.file_name + ": " + task.error_message.value_or("unknown error"));
                    break;
                case TaskStatus::downloading:
                    if (args.verbose) board.message("started  " + task.file_name);
                    break;
                case TaskStatus::queued:
                case TaskStatus::paused:
                case TaskStatus::cancelled:
                    break;
            }
        }
    };

    auto state_sub = scheduler.state_changes().subscribe(on_change);
    EventChannel<ProgressSnapshot>::Subscription progress_sub;
    if (!args.quiet) {
        progress_sub = scheduler.progress_updates().subscribe([&](const ProgressSnapshot& snapshot) {
            board.draw(snapshot);
        });
    }

    if (auto ec = scheduler.start()) {
        report(ec, "cannot start");
        return std::unexpected(ec);
    }

    while (!g_interrupted && !scheduler.idle()) {
        std::this_thread::sleep_for(chrono::milliseconds(100));
    }

    if (g_interrupted && !args.quiet) {
        board.message("Interrupted, saving progress...");
    }
    scheduler.stop();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    progress_sub.reset();
    state_sub.reset();
    board.clear();

    auto stats = scheduler.stats();
    if (!args.quiet) {
        std::cout << stats.completed << " completed, " << stats.failed << " failed, "
                  << stats.queued << " queued, " << stats.paused << " paused" << std::endl;
    }
    return stats.failed > 0 ? 1 : 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value = [&](int& i, std::string_view name) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = "missing value for " + std::string(name);
        return nullptr;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
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
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--with-file") {
            args.with_file = true;
        } else if (arg == "--store") {
            if (auto v = value(i, arg)) args.store_path = v;
        } else if (arg == "--config") {
            if (auto v = value(i, arg)) args.config_path = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value(i, arg)) args.download_dir = v;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value(i, arg)) args.output_file = v;
        } else if (arg == "-s" || arg == "--source") {
            if (auto v = value(i, arg)) args.source_id = v;
        } else if (arg == "-j" || arg == "--jobs") {
            std::uint64_t n = 0;
            if (auto v = value(i, arg)) {
                if (!parse_number(v, n) || n == 0 || n > 64) {
                    args.error = "invalid job count '" + std::string(v) + "'";
                } else {
                    args.jobs = static_cast<std::uint32_t>(n);
                }
            }
        } else if (arg == "-p" || arg == "--priority") {
            if (auto v = value(i, arg)) {
                args.priority = parse_priority(v);
                if (!args.priority) args.error = "unknown priority '" + std::string(v) + "'";
            }
        } else if (arg == "--size") {
            std::uint64_t n = 0;
            if (auto v = value(i, arg)) {
                if (!parse_number(v, n)) {
                    args.error = "invalid size '" + std::string(v) + "'";
                } else {
                    args.size = n;
                }
            }
        } else if (arg == "--at") {
            std::uint64_t n = 0;
            if (auto v = value(i, arg)) {
                if (!parse_number(v, n)) {
                    args.error = "invalid time '" + std::string(v) + "'";
                } else {
                    args.start_at = static_cast<std::int64_t>(n);
                }
            }
        } else if (arg == "--days") {
            std::uint64_t n = 0;
            if (auto v = value(i, arg)) {
                if (!parse_number(v, n) || n > 36500) {
                    args.error = "invalid day count '" + std::string(v) + "'";
                } else {
                    args.days = static_cast<std::uint32_t>(n);
                }
            }
        } else if (arg == "--md5" || arg == "--sha1" || arg == "--sha256") {
            auto algorithm = *parse_digest_algorithm(std::string_view(arg).substr(2));
            if (auto v = value(i, arg)) {
                std::string hex = v;
                if (hex.size() != digest_length(algorithm) || !is_hex(hex)) {
                    args.error = "invalid " + arg.substr(2) + " digest '" + hex + "'";
                } else {
                    args.digest = Digest{algorithm, hex};
                }
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            args.error = "unknown option '" + arg + "'";
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }

    return args;
}

//=============================================================================
// Dispatch
//=============================================================================

CliResult execute(const CliArgs& args) noexcept {
    try {
        using Handler = CliResult (*)(App&, const CliArgs&);
        static const std::map<std::string_view, Handler> handlers = {
            {"add", cmd_add},
            {"list", cmd_list},
            {"pause", cmd_control},
            {"resume", cmd_control},
            {"remove", cmd_control},
            {"retry", cmd_control},
            {"delete", cmd_delete},
            {"priority", cmd_priority},
            {"pause-all", cmd_bulk},
            {"resume-all", cmd_bulk},
            {"prune", cmd_prune},
            {"run", cmd_run},
        };

        auto handler = handlers.find(args.command);
        if (handler == handlers.end()) {
            std::cerr << "Error: unknown command '" << args.command << "'" << std::endl;
            std::cout << "Use -h for help" << std::endl;
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }

        auto app = open_app(args);
        if (!app) {
            return std::unexpected(app.error());
        }
        return handler->second(*app, args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(TaskErrc::storage_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "haul " << version.to_string() << " - queued, resumable downloads\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  add <URL>               Queue a download\n";
    std::cout << "      -o, --output <FILE>     Save to specified file\n";
    std::cout << "      -s, --source <ID>       Group under <dir>/<ID>/\n";
    std::cout << "      -p, --priority <LEVEL>  low, normal or high\n";
    std::cout << "      --size <BYTES>          Expected size\n";
    std::cout << "      --md5|--sha1|--sha256 <HEX>  Verify the finished file\n";
    std::cout << "      --at <EPOCH_SECONDS>    Not before this time\n";
    std::cout << "  list [--json]           Show all tasks\n";
    std::cout << "  pause <ID>              Pause a task\n";
    std::cout << "  resume <ID>             Resume a paused task\n";
    std::cout << "  remove <ID>             Cancel a task, keep its record\n";
    std::cout << "  retry <ID>              Retry a failed task\n";
    std::cout << "  delete <ID> [--with-file]  Forget a task\n";
    std::cout << "  priority <ID> <LEVEL>   Reorder a queued task\n";
    std::cout << "  pause-all, resume-all   Apply to every task\n";
    std::cout << "  prune [--days N]        Drop completed tasks older than N days (30)\n";
    std::cout << "  run                     Download until the queue is empty\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  --store <FILE>          Task store (default: " << STORE_FILE_NAME << ")\n";
    std::cout << "  --config <FILE>         JSON settings file\n";
    std::cout << "  -d, --directory <DIR>   Download directory\n";
    std::cout << "  -j, --jobs <N>          Concurrent downloads (default: " << DEFAULT_MAX_CONCURRENT << ")\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " add -p high https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -j 2 run\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
}

void print_version() noexcept {
    std::cout << "haul " << version.to_string() << " (built " << BUILD_DATE << ")" << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann/json, OpenSSL\n";
}

} // namespace haul::cli
