// ============================================================================
// parmap/map/options.cpp - Map Call Configuration
// ============================================================================

#include "parmap/map/options.hpp"

#include "parmap/map/invocation.hpp"

namespace parmap {

Status ValidateOptions(const MapOptions& options, InvocationKind kind) {
    if (options.num_workers < 1) {
        return Failure(Errc::InvalidWorkerCount);
    }
    if (options.use_named_arguments != (kind == InvocationKind::Keyworded)) {
        return Failure(Errc::InvocationMismatch);
    }
    return Success();
}

std::string_view ToString(ErrorPolicy policy) {
    switch (policy) {
        case ErrorPolicy::Raise:
            return "Raise";
        case ErrorPolicy::CollectAsEntry:
            return "CollectAsEntry";
        case ErrorPolicy::Suppress:
            return "Suppress";
    }
    return "Unknown";
}

std::string_view ToString(AppendMode mode) {
    switch (mode) {
        case AppendMode::Append:
            return "Append";
        case AppendMode::Extend:
            return "Extend";
    }
    return "Unknown";
}

}  // namespace parmap
