#pragma once

#include "store/codec.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <system_error>

namespace memsync {

// ── Streaming store reader ────────────────────────────────────────────────────
//
// Walks a store one line at a time and hands every decoded line to a visitor;
// the file is never held in memory as a whole.
//
// Blank lines are skipped.  A lone `{}` value (the consumer's placeholder
// before it initialises the store) is skipped when it is the only content;
// if real records follow it, it is reported as an unknown-kind decode error.

enum class ScanAction { Continue, Stop };

// `line_no` is 1-based.
using RecordVisitor = std::function<ScanAction(std::size_t line_no, DecodeResult&& result)>;

struct ScanSummary {
    std::size_t lines_read = 0;      // physical lines consumed, blanks included
    std::size_t records_seen = 0;    // lines handed to the visitor
    bool stopped_early = false;      // visitor returned ScanAction::Stop
};

// Scan an already-open stream.
// Returns io_error if the stream goes bad before EOF.
[[nodiscard]] std::error_code scan_stream(std::istream& in,
                                          const RecordVisitor& visit,
                                          ScanSummary& summary);

// Scan the store file at `path`.
// Returns Errc::not_found if the file does not exist, an errno code if it
// cannot be opened.
[[nodiscard]] std::error_code scan_store(const std::filesystem::path& path,
                                         const RecordVisitor& visit,
                                         ScanSummary& summary);

} // namespace memsync
