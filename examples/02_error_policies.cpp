// ============================================================================
// Example 02: Error Policies
// ============================================================================
//
// The same failing workload under Raise, CollectAsEntry, and Suppress, plus
// a failure during warm-up, which fails the call under every policy.
//
// RUN:
//   cd build && ./examples/02_error_policies
//
// ============================================================================

#include "parmap/parmap.hpp"

#include <iostream>
#include <vector>

using namespace parmap;

Outcome<int> TenDividedBy(int x) {
    if (x == 0) {
        return Failure(std::make_error_code(std::errc::argument_out_of_domain));
    }
    return Success(10 / x);
}

void Print(const MapResult<int>& result) {
    if (!result) {
        std::cout << "call failed: " << result.Error().message() << std::endl;
        return;
    }
    std::cout << "[";
    const char* sep = "";
    for (const auto& entry : *result.Value()) {
        std::cout << sep;
        if (entry) {
            std::cout << entry.Value();
        } else {
            std::cout << "<" << entry.Error().message() << ">";
        }
        sep = ", ";
    }
    std::cout << "]" << std::endl;
}

int main() {
    std::cout << "=== Parmap Example 02: Error Policies ===" << std::endl;
    std::cout << std::endl;

    std::vector<int> inputs{5, 2, 0, 10, 1};

    MapOptions options;
    options.num_workers = 2;
    options.warmup_count = 1;
    options.show_progress = false;

    for (ErrorPolicy policy : {ErrorPolicy::Raise, ErrorPolicy::CollectAsEntry, ErrorPolicy::Suppress}) {
        options.on_error = policy;
        std::cout << "--- " << ToString(policy) << " ---" << std::endl;
        Print(ParallelMap(inputs, TenDividedBy, options));
        std::cout << std::endl;
    }

    // The first input fails while warming up
    std::cout << "--- Warm-up Failure (Suppress) ---" << std::endl;
    options.on_error = ErrorPolicy::Suppress;
    Print(ParallelMap(std::vector<int>{0, 1, 2}, TenDividedBy, options));

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
