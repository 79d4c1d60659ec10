#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <system_error>
#include <vector>

namespace memsync {

// ── Naming policy ─────────────────────────────────────────────────────────────
//
// Entity names are namespaced per context ("AIPM_" for the framework, the
// project's own prefix otherwise).  A name carrying another context's prefix
// is cross-context contamination and fails validation.

struct NamingPolicy {
    std::string expected_prefix;            // empty: any name is accepted
    bool case_insensitive = true;

    // With strict_categories, a name must read <prefix><CATEGORY>_...
    std::vector<std::string> categories;
    bool strict_categories = false;

    // Duplicate entity names are an error unless tolerated here.
    bool allow_duplicate_entities = false;
};

struct ValidationOptions {
    std::size_t max_errors = 10;                        // scan stops past this many
    std::uintmax_t size_warning_bytes = 10u << 20;      // 0 disables the warning
};

// ── Report ────────────────────────────────────────────────────────────────────

struct ValidationIssue {
    std::size_t line = 0;       // 1-based line number in the store
    std::error_code code;       // decode_* or validation_failed
    std::string message;
};

enum class WarningKind { SizePressure };

struct ValidationWarning {
    WarningKind kind;
    std::string message;
};

struct ValidationReport {
    std::size_t entity_count = 0;
    std::size_t relation_count = 0;
    std::size_t lines_scanned = 0;
    std::uintmax_t file_size = 0;
    std::vector<ValidationIssue> errors;      // at most max_errors entries
    std::vector<ValidationWarning> warnings;  // never affect validity
    bool too_many_errors = false;             // scan aborted at the error cap

    [[nodiscard]] bool is_valid() const { return errors.empty(); }
};

// ── Validation ────────────────────────────────────────────────────────────────
//
// Single streaming pass.  Per-line problems are recorded in the report, not
// returned; the returned error_code is only for I/O failures (or not_found
// for an absent file).  An empty file or a lone `{}` is a valid empty store.

[[nodiscard]] std::error_code validate(const std::filesystem::path& path,
                                       const NamingPolicy& policy,
                                       const ValidationOptions& options,
                                       ValidationReport& report);

// Validate store content from a stream (no size check).
[[nodiscard]] std::error_code validate_stream(std::istream& in,
                                              const NamingPolicy& policy,
                                              const ValidationOptions& options,
                                              ValidationReport& report);

// Collapse a report into a single code: {} when valid,
// Errc::too_many_errors when the scan aborted, Errc::validation_failed otherwise.
[[nodiscard]] std::error_code report_error(const ValidationReport& report);

// One line per error, for logs.
[[nodiscard]] std::string summarize(const ValidationReport& report);

// True if `name` carries the policy's prefix (and category, when strict).
[[nodiscard]] bool name_conforms(const NamingPolicy& policy, const std::string& name);

} // namespace memsync
