// ============================================================================
// parmap/core/error.cpp - Error Category Implementation
// ============================================================================

#include "parmap/core/error.hpp"

#include <string>

namespace parmap {

namespace {

class ParmapCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "parmap"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::InvalidWorkerCount:
                return "Worker count must be at least 1";
            case Errc::InvocationMismatch:
                return "Named-argument mode does not match the work function";
            case Errc::MissingNamedArgument:
                return "Missing named argument";
            case Errc::NamedArgumentTypeMismatch:
                return "Named argument has the wrong type";
            case Errc::NotASequence:
                return "Result is not a sequence and cannot be extended";
            case Errc::ElementTypeMismatch:
                return "Result cannot be stored as an output entry";
            case Errc::ThreadConfigFailed:
                return "Failed to configure worker thread";
            case Errc::ExtendElementTypeUnset:
                return "Extend mode needs the output element type named explicitly";
            default:
                return "Unknown parmap error";
        }
    }
};

}  // namespace

const std::error_category& ParmapCategory() noexcept {
    static const ParmapCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), ParmapCategory()};
}

}  // namespace parmap
