#include "store/store_reader.hpp"

#include "common/errors.hpp"

#include <cerrno>
#include <fstream>
#include <optional>
#include <string>

namespace memsync {

std::error_code scan_stream(std::istream& in,
                            const RecordVisitor& visit,
                            ScanSummary& summary) {
    summary = ScanSummary{};

    std::string line;
    std::optional<std::size_t> pending_marker;  // line number of a leading `{}`
    bool seen_content = false;

    auto emit = [&](std::size_t line_no, DecodeResult&& result) {
        ++summary.records_seen;
        if (visit(line_no, std::move(result)) == ScanAction::Stop) {
            summary.stopped_early = true;
            return false;
        }
        return true;
    };

    while (std::getline(in, line)) {
        ++summary.lines_read;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line)) continue;

        const std::size_t line_no = summary.lines_read;

        if (!seen_content && is_empty_store_marker(line)) {
            seen_content = true;
            pending_marker = line_no;
            continue;
        }
        seen_content = true;

        if (pending_marker) {
            DecodeError err{make_error_code(Errc::decode_unknown_kind),
                            "empty object before records"};
            auto marker_line = *pending_marker;
            pending_marker.reset();
            if (!emit(marker_line, DecodeResult{std::move(err)})) return {};
        }

        if (!emit(line_no, decode_line(line))) return {};
    }

    if (in.bad()) {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code scan_store(const std::filesystem::path& path,
                           const RecordVisitor& visit,
                           ScanSummary& summary) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) return ec;
        return make_error_code(Errc::not_found);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return {errno != 0 ? errno : EIO, std::system_category()};
    }
    return scan_stream(in, visit, summary);
}

} // namespace memsync
