#pragma once

#include <string>
#include <system_error>

namespace memsync {

// ── Error codes ───────────────────────────────────────────────────────────────
//
// Domain failures reported through std::error_code.  Filesystem failures are
// plain std::system_category() codes carrying the errno.

enum class Errc {
    decode_malformed = 1,      // line is not a JSON object
    decode_unknown_kind,       // missing or unrecognised "type" discriminator
    validation_failed,         // naming policy or required-field violation
    too_many_errors,           // validator hit its error cap and stopped
    merge_validation_failed,   // assembled merge output failed validation
    restore_failed,            // backup could not be copied onto the live store
    timeout_exceeded,          // handoff release not observed in time (non-fatal)
    invalid_state,             // handoff / session transition not allowed
    not_found,                 // required input file is absent
};

[[nodiscard]] const std::error_category& memsync_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// Every error is fatal to the calling operation except a handoff timeout.
[[nodiscard]] bool is_fatal(const std::error_code& ec) noexcept;

} // namespace memsync

template <>
struct std::is_error_code_enum<memsync::Errc> : std::true_type {};
