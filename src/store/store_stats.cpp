#include "store/store_stats.hpp"

#include "common/errors.hpp"
#include "store/store_reader.hpp"

#include <spdlog/fmt/fmt.h>

namespace memsync {

std::error_code collect_stats(const std::filesystem::path& path, StoreStats& stats) {
    stats = StoreStats{};

    ScanSummary summary;
    auto ec = scan_store(path,
        [&stats](std::size_t, DecodeResult&& result) {
            if (const auto* rec = std::get_if<Record>(&result)) {
                if (std::holds_alternative<Entity>(*rec)) {
                    ++stats.entities;
                } else {
                    ++stats.relations;
                }
            }
            return ScanAction::Continue;
        },
        summary);

    if (ec == Errc::not_found) return {};
    if (ec) return ec;

    std::error_code size_ec;
    stats.size_bytes = std::filesystem::file_size(path, size_ec);
    if (size_ec) return size_ec;
    return {};
}

std::string format_size(std::uintmax_t bytes) {
    constexpr double kKiB = 1024.0;
    constexpr double kMiB = 1024.0 * 1024.0;
    if (bytes < 1024) return fmt::format("{} B", bytes);
    if (bytes < 1024 * 1024) return fmt::format("{:.1f} KB", static_cast<double>(bytes) / kKiB);
    return fmt::format("{:.1f} MB", static_cast<double>(bytes) / kMiB);
}

std::string format_stats(const StoreStats& stats) {
    return fmt::format("{} entities, {} relations ({})",
                       stats.entities, stats.relations, format_size(stats.size_bytes));
}

} // namespace memsync
