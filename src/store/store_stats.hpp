#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace memsync {

struct StoreStats {
    std::size_t entities = 0;
    std::size_t relations = 0;
    std::uintmax_t size_bytes = 0;
};

// Count records in the store at `path`.  Undecodable lines are not counted.
// An absent file yields all-zero stats and no error.
[[nodiscard]] std::error_code collect_stats(const std::filesystem::path& path,
                                            StoreStats& stats);

// "12 entities, 4 relations (3.2 KB)"
[[nodiscard]] std::string format_stats(const StoreStats& stats);

// 512 → "512 B", 2048 → "2.0 KB", 5 << 20 → "5.0 MB"
[[nodiscard]] std::string format_size(std::uintmax_t bytes);

} // namespace memsync
