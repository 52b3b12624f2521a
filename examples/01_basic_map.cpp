// ============================================================================
// Example 01: Basic Parallel Map
// ============================================================================
//
// This example maps a slow function over a list of inputs on a worker pool
// and shows that results come back in input order.
//
// RUN:
//   cd build && ./examples/01_basic_map
//
// ============================================================================

#include "parmap/parmap.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace parmap;

// Pretend each input takes a different amount of time
int SlowSquare(int x) {
    std::this_thread::sleep_for(std::chrono::milliseconds((x * 37) % 50));
    return x * x;
}

Generator<int> Countdown(int from) {
    for (int i = from; i > 0; --i) {
        co_yield i;
    }
}

int main() {
    std::cout << "=== Parmap Example 01: Basic Map ===" << std::endl;
    std::cout << std::endl;

    std::vector<int> inputs;
    for (int i = 1; i <= 40; ++i) {
        inputs.push_back(i);
    }

    // Example 1: pooled with progress on stderr
    std::cout << "--- Example 1: Pooled Map ---" << std::endl;
    MapOptions options;
    options.num_workers = 8;
    options.progress_label = "squares";

    auto squares = ParallelMap(inputs, SlowSquare, options);
    if (!squares) {
        std::cout << "Failed: " << squares.Error().message() << std::endl;
        return 1;
    }
    for (const auto& entry : *squares.Value()) {
        std::cout << entry.Value() << " ";
    }
    std::cout << std::endl << std::endl;

    // Example 2: serial run
    std::cout << "--- Example 2: Serial Map ---" << std::endl;
    options.num_workers = 1;
    options.show_progress = false;
    auto serial = ParallelMap(std::vector<int>{1, 2, 3, 4}, [](int x) { return x * 10; }, options);
    for (const auto& entry : *serial.Value()) {
        std::cout << entry.Value() << " ";
    }
    std::cout << std::endl << std::endl;

    // Example 3: single-pass input
    std::cout << "--- Example 3: Generator Input ---" << std::endl;
    options.num_workers = 4;
    auto halves = ParallelMap(Countdown(6), [](int x) { return x / 2.0; }, options);
    for (const auto& entry : *halves.Value()) {
        std::cout << entry.Value() << " ";
    }
    std::cout << std::endl << std::endl;

    // Example 4: side effects only
    std::cout << "--- Example 4: No Output ---" << std::endl;
    options.return_output = false;
    auto done = ParallelMap(std::vector<int>{1, 2, 3}, [](int x) { SlowSquare(x); }, options);
    std::cout << "Has output: " << std::boolalpha << done.Value().has_value() << std::endl;

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
