// ============================================================================
// colock/core/error.cpp - Error Category Implementation
// ============================================================================

#include "colock/core/error.hpp"

#include <string>

namespace colock {

namespace {

class ColockCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "colock"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::WouldBlock:
                return "Lock is not available in the requested mode";
            case Errc::NotSoleOwner:
                return "Other references to the lock exist";
            case Errc::NoExecutor:
                return "No current executor";
            case Errc::ExecutorInitFailed:
                return "Failed to initialize executor";
            default:
                return "Unknown colock error";
        }
    }
};

}  // namespace

const std::error_category& ColockCategory() noexcept {
    static const ColockCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), ColockCategory()};
}

}  // namespace colock
