#include "store/validator.hpp"

#include "common/errors.hpp"
#include "store/store_reader.hpp"
#include "store/store_stats.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_set>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace memsync {

namespace {

bool chars_equal(char a, char b, bool case_insensitive) {
    if (!case_insensitive) return a == b;
    return std::toupper(static_cast<unsigned char>(a)) ==
           std::toupper(static_cast<unsigned char>(b));
}

// Does `s` start with `prefix` at offset `pos`?
bool starts_with_at(const std::string& s, std::size_t pos,
                    const std::string& prefix, bool case_insensitive) {
    if (s.size() < pos + prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin() + static_cast<std::ptrdiff_t>(pos),
        [case_insensitive](char a, char b) { return chars_equal(a, b, case_insensitive); });
}

// ── Per-pass state ───────────────────────────────────────────────────────────

class Pass {
public:
    Pass(const NamingPolicy& policy, const ValidationOptions& options,
         ValidationReport& report)
        : policy_(policy), options_(options), report_(report) {}

    ScanAction on_record(std::size_t line_no, DecodeResult&& result) {
        report_.lines_scanned = line_no;

        if (auto* err = std::get_if<DecodeError>(&result)) {
            return add_error(line_no, err->code, err->message);
        }

        const auto& rec = std::get<Record>(result);
        if (const auto* e = std::get_if<Entity>(&rec)) {
            ++report_.entity_count;
            return check_entity(line_no, *e);
        }
        ++report_.relation_count;
        return check_relation(line_no, std::get<Relation>(rec));
    }

private:
    ScanAction add_error(std::size_t line_no, std::error_code code, std::string message) {
        if (report_.errors.size() >= options_.max_errors) {
            report_.too_many_errors = true;
            return ScanAction::Stop;
        }
        report_.errors.push_back(ValidationIssue{line_no, code, std::move(message)});
        return ScanAction::Continue;
    }

    ScanAction policy_error(std::size_t line_no, std::string message) {
        return add_error(line_no, make_error_code(Errc::validation_failed), std::move(message));
    }

    ScanAction check_entity(std::size_t line_no, const Entity& e) {
        if (e.name.empty()) {
            return policy_error(line_no, "entity is missing 'name'");
        }
        if (e.entity_type.empty()) {
            if (policy_error(line_no, fmt::format("entity '{}' is missing 'entityType'", e.name))
                    == ScanAction::Stop) {
                return ScanAction::Stop;
            }
        }
        if (!name_conforms(policy_, e.name)) {
            auto msg = policy_.strict_categories && !policy_.categories.empty()
                ? fmt::format("entity '{}' does not match '{}<CATEGORY>_'",
                              e.name, policy_.expected_prefix)
                : fmt::format("entity '{}' does not start with '{}'",
                              e.name, policy_.expected_prefix);
            if (policy_error(line_no, std::move(msg)) == ScanAction::Stop) {
                return ScanAction::Stop;
            }
        }
        if (!policy_.allow_duplicate_entities) {
            if (!seen_names_.insert(e.name).second) {
                return policy_error(line_no, fmt::format("duplicate entity '{}'", e.name));
            }
        }
        return ScanAction::Continue;
    }

    ScanAction check_relation(std::size_t line_no, const Relation& r) {
        if (r.from.empty()) {
            return policy_error(line_no, "relation is missing 'from'");
        }
        if (r.to.empty()) {
            return policy_error(line_no, "relation is missing 'to'");
        }
        if (r.relation_type.empty()) {
            return policy_error(line_no, "relation is missing 'relationType'");
        }
        return ScanAction::Continue;
    }

    const NamingPolicy& policy_;
    const ValidationOptions& options_;
    ValidationReport& report_;
    std::unordered_set<std::string> seen_names_;
};

} // anonymous namespace

// ── name_conforms ────────────────────────────────────────────────────────────

bool name_conforms(const NamingPolicy& policy, const std::string& name) {
    const auto& prefix = policy.expected_prefix;
    if (!starts_with_at(name, 0, prefix, policy.case_insensitive)) return false;
    if (!policy.strict_categories || policy.categories.empty()) return true;

    return std::any_of(policy.categories.begin(), policy.categories.end(),
        [&](const std::string& category) {
            return starts_with_at(name, prefix.size(), category + "_",
                                  policy.case_insensitive);
        });
}

// ── validate ─────────────────────────────────────────────────────────────────

std::error_code validate_stream(std::istream& in,
                                const NamingPolicy& policy,
                                const ValidationOptions& options,
                                ValidationReport& report) {
    report = ValidationReport{};
    Pass pass(policy, options, report);

    ScanSummary summary;
    auto ec = scan_stream(in,
        [&pass](std::size_t line_no, DecodeResult&& result) {
            return pass.on_record(line_no, std::move(result));
        },
        summary);
    if (!summary.stopped_early) {
        report.lines_scanned = summary.lines_read;
    }
    return ec;
}

std::error_code validate(const std::filesystem::path& path,
                         const NamingPolicy& policy,
                         const ValidationOptions& options,
                         ValidationReport& report) {
    report = ValidationReport{};

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ec ? ec : make_error_code(Errc::not_found);
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return ec;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::make_error_code(std::errc::io_error);
    }

    ec = validate_stream(in, policy, options, report);
    report.file_size = size;

    if (options.size_warning_bytes > 0 && size > options.size_warning_bytes) {
        auto msg = fmt::format("store {} is {} (threshold {})", path.string(),
                               format_size(size), format_size(options.size_warning_bytes));
        spdlog::warn("Validator: size pressure: {}", msg);
        report.warnings.push_back(ValidationWarning{WarningKind::SizePressure, std::move(msg)});
    }

    if (!ec && !report.is_valid()) {
        spdlog::debug("Validator: {} failed:\n{}", path.string(), summarize(report));
    }
    return ec;
}

std::error_code report_error(const ValidationReport& report) {
    if (report.too_many_errors) return make_error_code(Errc::too_many_errors);
    if (!report.is_valid()) return make_error_code(Errc::validation_failed);
    return {};
}

std::string summarize(const ValidationReport& report) {
    std::string out;
    for (const auto& issue : report.errors) {
        out += fmt::format("  line {}: {} ({})\n", issue.line, issue.message,
                           issue.code.message());
    }
    if (report.too_many_errors) {
        out += fmt::format("  stopped after {} errors at line {}\n",
                           report.errors.size(), report.lines_scanned);
    }
    return out;
}

} // namespace memsync
