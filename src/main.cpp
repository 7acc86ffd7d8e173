#include "classifier/content_classifier.hpp"
#include "clipboard/command_clipboard.hpp"
#include "config/config_loader.hpp"
#include "core/periodic_task.hpp"
#include "core/utils.hpp"
#include "monitor/change_monitor.hpp"
#include "security/redactor.hpp"
#include "service/history_service.hpp"
#include "storage/artifact_store.hpp"
#include "storage/history_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <thread>

using namespace clipstash;

namespace {

constexpr size_t kDefaultListLimit = 20;

std::atomic<bool> g_stop{false};

void signal_handler(int /*signal*/) {
    g_stop.store(true);
}

void print_usage() {
    std::cout <<
        "Usage: clipstash [-c config.toml] [--json] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  run                  Watch the clipboard and record history (default)\n"
        "  recent [N]           Show the N most recent entries\n"
        "  search <query> [N]   Full-text search\n"
        "  show <id>            Show one entry in full\n"
        "  delete <id>          Delete an entry\n"
        "  clear                Delete all entries\n"
        "  restore <id>         Copy an entry back to the clipboard\n"
        "  pin <id>             Keep an entry out of retention\n"
        "  unpin <id>           Let retention evict an entry again\n"
        "  stats                Show history statistics\n"
        "  help                 Show this message\n";
}

struct CliArgs {
    std::string config_path;
    bool json = false;
    std::string command = "run";
    std::vector<std::string> params;
};

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    args.config_path = ConfigLoader::default_config_path();

    bool have_command = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && !have_command) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            args.config_path = argv[++i];
        } else if (arg == "--json") {
            args.json = true;
        } else if (!have_command) {
            args.command = arg;
            have_command = true;
        } else {
            args.params.push_back(arg);
        }
    }
    return args;
}

std::optional<int64_t> parse_id(const std::vector<std::string>& params, size_t index) {
    if (index >= params.size()) return std::nullopt;
    return utils::try_parse_int<int64_t>(params[index]);
}

size_t parse_limit(const std::vector<std::string>& params, size_t index) {
    if (index >= params.size()) return kDefaultListLimit;
    const auto n = utils::try_parse_int<int64_t>(params[index]);
    return (n && *n > 0) ? static_cast<size_t>(*n) : kDefaultListLimit;
}

std::string entry_json(const ClipboardEntry& e, bool full) {
    std::string out = std::format(
        R"({{"id":{},"type":"{}","preview":"{}","sensitive":{},"kinds":"{}","bytes":{},"created_at":"{}","last_seen_at":"{}","pinned":{},"integrity_degraded":{})",
        e.id, content_type_name(e.content_type), utils::escape_json(e.preview()),
        utils::booltostr(e.is_sensitive), utils::escape_json(e.sensitive_kinds), e.byte_size,
        utils::format_timestamp(e.created_at), utils::format_timestamp(e.last_seen_at),
        utils::booltostr(e.pinned), utils::booltostr(e.integrity_degraded));
    if (full) {
        out += std::format(R"(,"payload":"{}")", utils::escape_json(e.raw_payload));
    }
    out += "}";
    return out;
}

void print_entries(const std::vector<ClipboardEntry>& entries, bool json) {
    for (const auto& e : entries) {
        if (json) {
            std::cout << entry_json(e, false) << "\n";
            continue;
        }
        std::cout << std::format("{:>6}{} {:<5}  {}  {}{}\n",
            e.id, e.pinned ? "*" : " ", content_type_name(e.content_type),
            utils::format_timestamp(e.last_seen_at),
            e.preview(), e.is_sensitive ? std::format("  [{}]", e.sensitive_kinds) : "");
    }
}

int report(const Status& status) {
    if (status.is_error()) {
        std::cerr << std::format("Error ({}): {}\n",
            error_category_name(status.error_category()), status.error_message());
        return 1;
    }
    return 0;
}

template<typename T>
int report_error(const Result<T>& result) {
    std::cerr << std::format("Error ({}): {}\n",
        error_category_name(result.error_category()), result.error_message());
    return 1;
}

int run_monitor(const ClipstashConfig& cfg,
                const std::shared_ptr<HistoryStore>& store,
                const std::shared_ptr<ArtifactStore>& artifacts,
                const std::shared_ptr<CommandClipboard>& clipboard) {
    ContentClassifier::Config classifier_cfg;
    classifier_cfg.preview_length = cfg.capture.preview_length;
    classifier_cfg.max_text_bytes = cfg.capture.max_text_bytes;
    classifier_cfg.max_image_bytes = cfg.capture.max_image_bytes;
    auto classifier = std::make_shared<ContentClassifier>(classifier_cfg, artifacts);

    Redactor::Config redactor_cfg;
    redactor_cfg.enabled = cfg.capture.redact_sensitive;
    redactor_cfg.preview_length = cfg.capture.preview_length;
    auto redactor = std::make_shared<Redactor>(redactor_cfg);

    auto monitor = std::make_shared<ChangeMonitor>(clipboard, classifier, redactor, store);
    PeriodicTask poller("Clipboard monitor", cfg.capture.poll_interval(), [monitor] {
        monitor->tick();
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    poller.start();
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
    }
    utils::log::info("Shutdown requested");
    poller.stop();

    const auto s = monitor->stats();
    utils::log::info(std::format("Monitor stats: {} ticks, {} captures, {} bumps, {} skips, {} failures",
                                 s.ticks, s.captures, s.bumps, s.skips, s.failures));
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto args = parse_args(argc, argv);
        if (!args) {
            print_usage();
            return 2;
        }
        if (args->command == "help" || args->command == "--help" || args->command == "-h") {
            print_usage();
            return 0;
        }

        // Configuration
        auto config_result = ConfigLoader::load_or_default(args->config_path);
        if (!config_result.success) {
            std::cerr << config_result.error_message << "\n";
            return 2;
        }
        const ClipstashConfig& cfg = config_result.config;

        // Logging
        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }
        if (!utils::log::set_file(cfg.logging.file)) {
            utils::log::warn(std::format("Cannot open log file {}", cfg.logging.file));
        }

        // Storage
        auto artifacts = std::make_shared<ArtifactStore>(cfg.storage.images_path(),
                                                         cfg.storage.artifact_extension);
        HistoryStore::Config store_cfg;
        store_cfg.db_path = cfg.storage.database_path().string();
        store_cfg.max_entries = cfg.storage.max_entries;
        auto opened = HistoryStore::open(store_cfg, artifacts);
        if (opened.is_error()) {
            return report_error(opened);
        }
        std::shared_ptr<HistoryStore> store = std::move(opened.value());

        auto clipboard = std::make_shared<CommandClipboard>();
        HistoryService service(store, clipboard);

        // A copy command that exits early must not kill us mid-write
        std::signal(SIGPIPE, SIG_IGN);

        const auto& cmd = args->command;
        const auto& params = args->params;

        if (cmd == "run") {
            utils::log::info(std::format("clipstash starting (data dir {})", cfg.storage.data_dir));
            return run_monitor(cfg, store, artifacts, clipboard);
        }

        if (cmd == "recent") {
            auto entries = service.recent(parse_limit(params, 0));
            if (entries.is_error()) return report_error(entries);
            print_entries(entries.value(), args->json);
            return 0;
        }

        if (cmd == "search") {
            if (params.empty()) {
                std::cerr << "search: missing query\n";
                return 2;
            }
            auto entries = service.search(params[0], parse_limit(params, 1));
            if (entries.is_error()) return report_error(entries);
            print_entries(entries.value(), args->json);
            return 0;
        }

        if (cmd == "show" || cmd == "delete" || cmd == "restore" || cmd == "pin" || cmd == "unpin") {
            const auto id = parse_id(params, 0);
            if (!id) {
                std::cerr << std::format("{}: expected a numeric id\n", cmd);
                return 2;
            }

            if (cmd == "restore") {
                return report(service.restore(*id));
            }

            if (cmd == "pin" || cmd == "unpin") {
                return report(service.set_pinned(*id, cmd == "pin"));
            }

            if (cmd == "delete") {
                auto removed = service.remove(*id);
                if (removed.is_error()) return report_error(removed);
                if (!removed.value()) {
                    std::cout << std::format("No entry {}\n", *id);
                }
                return 0;
            }

            auto entry = service.show(*id);
            if (entry.is_error()) return report_error(entry);
            const auto& e = entry.value();
            if (args->json) {
                std::cout << entry_json(e, true) << "\n";
            } else {
                std::cout << std::format("id:         {}\ntype:       {}\ncreated:    {}\nlast seen:  {}\nbytes:      {}\n",
                    e.id, content_type_name(e.content_type), utils::format_timestamp(e.created_at),
                    utils::format_timestamp(e.last_seen_at), e.byte_size);
                if (e.pinned) {
                    std::cout << "pinned:     yes\n";
                }
                if (e.is_sensitive) {
                    std::cout << std::format("sensitive:  {}\n", e.sensitive_kinds);
                }
                if (e.integrity_degraded) {
                    std::cout << "integrity:  artifact missing\n";
                }
                std::string body = e.raw_payload;
                if (e.is_file_reference()) {
                    std::replace(body.begin(), body.end(), kPathSeparator, '\n');
                }
                std::cout << "\n" << body << "\n";
            }
            return 0;
        }

        if (cmd == "clear") {
            auto removed = service.clear_all();
            if (removed.is_error()) return report_error(removed);
            std::cout << std::format("Removed {} entries\n", removed.value());
            return 0;
        }

        if (cmd == "stats") {
            auto stats = service.stats();
            if (stats.is_error()) return report_error(stats);
            const auto& s = stats.value();
            if (args->json) {
                std::cout << std::format(
                    R"({{"total":{},"text":{},"image":{},"file":{},"sensitive":{},"pinned":{},"artifact_bytes":{},"max_entries":{}}})",
                    s.total_entries, s.text_entries, s.image_entries, s.file_entries,
                    s.sensitive_entries, s.pinned_entries, s.artifact_bytes, s.max_entries) << "\n";
            } else {
                std::cout << std::format(
                    "entries:    {} / {}\ntext:       {}\nimages:     {}\nfiles:      {}\nsensitive:  {}\npinned:     {}\nartifacts:  {} bytes\n",
                    s.total_entries, s.max_entries, s.text_entries, s.image_entries,
                    s.file_entries, s.sensitive_entries, s.pinned_entries, s.artifact_bytes);
            }
            return 0;
        }

        std::cerr << std::format("Unknown command '{}'\n", cmd);
        print_usage();
        return 2;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
