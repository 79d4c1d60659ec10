#include "common/sync_config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace memsync {

namespace {

constexpr std::array<std::string_view, 10> kCommands{
    "validate", "stats", "backup", "restore", "load",
    "save", "merge", "partial-restore", "start", "finish",
};

constexpr const char* kDefaultCategories = "CONTEXT DECISION LEARNING TASK REVIEW";

// ── Helpers ───────────────────────────────────────────────────────────────────

[[nodiscard]] bool is_known_command(std::string_view command) {
    return std::find(kCommands.begin(), kCommands.end(), command) != kCommands.end();
}

[[nodiscard]] bool needs_remote(std::string_view command) {
    return command == "merge" || command == "partial-restore";
}

// Validate the fully populated SyncConfig.
void validate_config(const SyncConfig& cfg) {
    if (!is_known_command(cfg.command)) {
        throw std::runtime_error(fmt::format("Unknown command '{}'", cfg.command));
    }
    if (cfg.context == session::ContextKind::Project && cfg.project.empty()) {
        throw std::runtime_error("--project is required for the project context");
    }
    if (cfg.workspace.empty()) {
        throw std::runtime_error("--workspace must not be empty");
    }
    if (cfg.max_errors == 0) {
        throw std::runtime_error("--max-errors must be > 0");
    }
    if (cfg.poll_interval_ms == 0) {
        throw std::runtime_error("--poll-interval-ms must be > 0");
    }
    if (needs_remote(cfg.command) && cfg.remote.empty()) {
        throw std::runtime_error(fmt::format("Command '{}' requires --remote", cfg.command));
    }
}

} // anonymous namespace

// ── parse_size ────────────────────────────────────────────────────────────────

std::uintmax_t parse_size(std::string_view s) {
    auto digits_end = std::find_if(s.begin(), s.end(),
        [](unsigned char c) { return !std::isdigit(c); });
    std::string_view number = s.substr(0, static_cast<std::size_t>(digits_end - s.begin()));
    std::string suffix{s.substr(number.size())};
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::uintmax_t value = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (number.empty() || ec != std::errc{} || ptr != number.data() + number.size()) {
        throw std::runtime_error(fmt::format("Invalid size: '{}'", s));
    }

    unsigned shift = 0;
    if (suffix.empty() || suffix == "B") {
        shift = 0;
    } else if (suffix == "KB") {
        shift = 10;
    } else if (suffix == "MB") {
        shift = 20;
    } else if (suffix == "GB") {
        shift = 30;
    } else {
        throw std::runtime_error(fmt::format("Invalid size suffix in '{}'", s));
    }

    if (shift != 0 && value > (UINTMAX_MAX >> shift)) {
        throw std::runtime_error(fmt::format("Size out of range: '{}'", s));
    }
    return value << shift;
}

// ── parse_list ────────────────────────────────────────────────────────────────

std::vector<std::string> parse_list(std::string_view s) {
    std::vector<std::string> items;
    std::string current;
    for (char c : s) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) items.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) items.push_back(std::move(current));
    return items;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("command",
            po::value<std::string>(),
            "validate|stats|backup|restore|load|save|merge|partial-restore|start|finish")
        ("path",
            po::value<std::string>()->default_value(""),
            "Store to inspect for validate/stats (default: the context snapshot)")
        ("context",
            po::value<std::string>()->default_value("framework"),
            "Session context: framework|project")
        ("project",
            po::value<std::string>()->default_value(""),
            "Project directory name (project context)")
        ("workspace",
            po::value<std::string>()->default_value("."),
            "Workspace root")
        ("live",
            po::value<std::string>()->default_value(""),
            "Live store path (default: <workspace>/.aipm/memory.json)")
        ("snapshot",
            po::value<std::string>()->default_value(""),
            "Snapshot path (default: derived from the context)")
        ("backup",
            po::value<std::string>()->default_value(""),
            "Backup path (default: backup.json beside the snapshot)")
        ("remote",
            po::value<std::string>()->default_value(""),
            "Remote snapshot to merge, or source store for partial-restore")
        ("output",
            po::value<std::string>()->default_value(""),
            "Output path for merge/partial-restore (default: the snapshot)")
        ("policy",
            po::value<std::string>()->default_value("remote-wins"),
            "Conflict policy: remote-wins|local-wins|newest-wins")
        ("prefix",
            po::value<std::string>()->default_value(""),
            "Expected entity name prefix (default: AIPM_ or <PROJECT>_)")
        ("categories",
            po::value<std::string>()->default_value(kDefaultCategories),
            "Entity categories, space or comma separated")
        ("strict-categories",
            po::bool_switch()->default_value(false),
            "Require <prefix><CATEGORY>_ entity names")
        ("case-insensitive",
            po::value<bool>()->default_value(true),
            "Compare prefixes and categories case-insensitively")
        ("allow-duplicates",
            po::bool_switch()->default_value(false),
            "Tolerate duplicate entity names")
        ("max-errors",
            po::value<uint32_t>()->default_value(10),
            "Validation errors collected before the scan stops")
        ("size-warning",
            po::value<std::string>()->default_value("10MB"),
            "Store size that triggers a size warning (0 disables)")
        ("handoff-timeout-ms",
            po::value<uint32_t>()->default_value(30000),
            "How long finish waits for the live store to be released")
        ("poll-interval-ms",
            po::value<uint32_t>()->default_value(500),
            "Release polling interval")
        ("settle-ms",
            po::value<uint32_t>()->default_value(500),
            "Delay after flushing before the live store is handed off")
        ("keep-backup",
            po::bool_switch()->default_value(false),
            "Keep the backup after a successful restore")
        ("filter",
            po::value<std::string>()->default_value(""),
            "Entity name prefix for partial-restore (default: the context prefix)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── parse_config ──────────────────────────────────────────────────────────────

SyncConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("memsync options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("path", 1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
            vm);

        if (vm.count("help") || !vm.count("command")) {
            std::ostringstream oss;
            oss << "Usage: memsync <command> [path] [options]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    SyncConfig cfg;
    cfg.command   = vm["command"].as<std::string>();
    cfg.path      = vm["path"].as<std::string>();
    cfg.project   = vm["project"].as<std::string>();
    cfg.workspace = vm["workspace"].as<std::string>();
    cfg.live      = vm["live"].as<std::string>();
    cfg.snapshot  = vm["snapshot"].as<std::string>();
    cfg.backup    = vm["backup"].as<std::string>();
    cfg.remote    = vm["remote"].as<std::string>();
    cfg.output    = vm["output"].as<std::string>();

    const auto context = vm["context"].as<std::string>();
    auto kind = session::parse_context_kind(context);
    if (!kind) {
        throw std::runtime_error(
            fmt::format("--context must be 'framework' or 'project', got '{}'", context));
    }
    cfg.context = *kind;

    const auto policy = vm["policy"].as<std::string>();
    auto conflict = merge::parse_conflict_policy(policy);
    if (!conflict) {
        throw std::runtime_error(
            fmt::format("--policy must be remote-wins, local-wins or newest-wins, got '{}'",
                        policy));
    }
    cfg.policy = *conflict;

    cfg.prefix             = vm["prefix"].as<std::string>();
    cfg.categories         = parse_list(vm["categories"].as<std::string>());
    cfg.strict_categories  = vm["strict-categories"].as<bool>();
    cfg.case_insensitive   = vm["case-insensitive"].as<bool>();
    cfg.allow_duplicates   = vm["allow-duplicates"].as<bool>();
    cfg.max_errors         = vm["max-errors"].as<uint32_t>();
    cfg.size_warning_bytes = parse_size(vm["size-warning"].as<std::string>());
    cfg.handoff_timeout_ms = vm["handoff-timeout-ms"].as<uint32_t>();
    cfg.poll_interval_ms   = vm["poll-interval-ms"].as<uint32_t>();
    cfg.settle_ms          = vm["settle-ms"].as<uint32_t>();
    cfg.keep_backup        = vm["keep-backup"].as<bool>();
    cfg.filter             = vm["filter"].as<std::string>();
    cfg.log_level          = vm["log-level"].as<std::string>();

    validate_config(cfg);
    return cfg;
}

// ── Projections ───────────────────────────────────────────────────────────────

session::SessionContext session_context(const SyncConfig& cfg) {
    session::SessionContext context;
    context.kind      = cfg.context;
    context.project   = cfg.project;
    context.workspace = cfg.workspace;
    return context;
}

session::SessionPaths session_paths(const SyncConfig& cfg) {
    auto paths = session::resolve_paths(session_context(cfg));
    if (!cfg.live.empty()) paths.live = cfg.live;
    if (!cfg.snapshot.empty()) {
        paths.snapshot = cfg.snapshot;
        // An explicit snapshot carries its backup along unless one is named.
        paths.backup = paths.snapshot.parent_path() / session::kBackupFileName;
    }
    if (!cfg.backup.empty()) paths.backup = cfg.backup;
    return paths;
}

NamingPolicy naming_policy(const SyncConfig& cfg) {
    NamingPolicy policy;
    policy.expected_prefix          = session::entity_prefix_for(session_context(cfg), cfg.prefix);
    policy.case_insensitive         = cfg.case_insensitive;
    policy.categories               = cfg.categories;
    policy.strict_categories        = cfg.strict_categories;
    policy.allow_duplicate_entities = cfg.allow_duplicates;
    return policy;
}

ValidationOptions validation_options(const SyncConfig& cfg) {
    ValidationOptions options;
    options.max_errors         = cfg.max_errors;
    options.size_warning_bytes = cfg.size_warning_bytes;
    return options;
}

} // namespace memsync
