#include "common/errors.hpp"

namespace memsync {

namespace {

class MemsyncCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "memsync"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::decode_malformed:        return "malformed record";
            case Errc::decode_unknown_kind:     return "unknown record kind";
            case Errc::validation_failed:       return "store validation failed";
            case Errc::too_many_errors:         return "too many validation errors";
            case Errc::merge_validation_failed: return "merge result failed validation";
            case Errc::restore_failed:          return "restore from backup failed";
            case Errc::timeout_exceeded:        return "timed out waiting for release";
            case Errc::invalid_state:           return "operation not allowed in current state";
            case Errc::not_found:               return "file not found";
        }
        return "unknown memsync error";
    }
};

} // anonymous namespace

const std::error_category& memsync_category() noexcept {
    static const MemsyncCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), memsync_category()};
}

bool is_fatal(const std::error_code& ec) noexcept {
    if (!ec) return false;
    return ec != Errc::timeout_exceeded;
}

} // namespace memsync
