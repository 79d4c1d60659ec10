#pragma once

#include "store/record.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace memsync {

// ── Store line codec ──────────────────────────────────────────────────────────
//
// Store file format: UTF-8, one JSON object per line:
//
//   {"type":"entity","name":"AIPM_X","entityType":"task","observations":["..."]}
//   {"type":"relation","from":"AIPM_X","to":"AIPM_Y","relationType":"blocks"}
//
// Thread-safe: pure functions, no shared state.

struct DecodeError {
    std::error_code code;   // Errc::decode_malformed or Errc::decode_unknown_kind
    std::string message;
};

using DecodeResult = std::variant<Record, DecodeError>;

// Parse one line (without the trailing '\n') into a Record.
// Missing modelled fields decode as empty values; fields present with the
// wrong JSON type are a decode_malformed error.
[[nodiscard]] DecodeResult decode_line(std::string_view line);

// Serialise a record as a single line (no trailing '\n').  Key order is fixed:
// "type" first, then the modelled fields, then `extra` in its stored order.
[[nodiscard]] std::string encode(const Record& record);

// True if `line` is the bare `{}` value the consumer writes before it has
// initialised the store.
[[nodiscard]] bool is_empty_store_marker(std::string_view line);

// True if `line` holds nothing but whitespace.
[[nodiscard]] bool is_blank(std::string_view line);

} // namespace memsync
