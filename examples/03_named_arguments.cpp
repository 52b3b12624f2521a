// ============================================================================
// Example 03: Named Arguments, Extend, and Custom Accumulation
// ============================================================================
//
// RUN:
//   cd build && ./examples/03_named_arguments
//
// ============================================================================

#include "parmap/parmap.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace parmap;

std::vector<std::string> SplitWords(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    for (char c : line) {
        if (c == ' ') {
            if (!current.empty()) words.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

int main() {
    std::cout << "=== Parmap Example 03: Named Arguments ===" << std::endl;
    std::cout << std::endl;

    MapOptions options;
    options.num_workers = 4;
    options.warmup_count = 1;
    options.show_progress = false;

    // Example 1: each input is a mapping of parameter names to values
    std::cout << "--- Example 1: Keyworded ---" << std::endl;
    std::vector<KwArgs<double>> boxes{
        {{"width", 2.0}, {"height", 3.0}},
        {{"height", 1.5}, {"width", 4.0}},
        {{"width", 10.0}},
    };
    options.use_named_arguments = true;
    options.on_error = ErrorPolicy::CollectAsEntry;

    auto areas = ParallelMap(boxes, Keyworded<double>({"width", "height"}, [](double w, double h) { return w * h; }),
                             options);
    for (const auto& entry : *areas.Value()) {
        if (entry) {
            std::cout << "area " << entry.Value() << std::endl;
        } else {
            std::cout << "error: " << entry.Error().message() << std::endl;
        }
    }
    std::cout << std::endl;

    // Example 2: flatten sequence results
    std::cout << "--- Example 2: Extend ---" << std::endl;
    options.use_named_arguments = false;
    options.append_mode = AppendMode::Extend;
    std::vector<std::string> lines{"the quick brown", "fox", "jumps over the lazy dog"};

    auto words = ParallelMapper<std::string, std::vector<std::string>, std::string>(
                     Positional<std::string>(SplitWords), options)
                     .WithInitialResult({Success(std::string("<start>"))})
                     .Run(lines);
    for (const auto& entry : *words.Value()) {
        std::cout << entry.Value() << " ";
    }
    std::cout << std::endl << std::endl;

    // Example 3: custom accumulator keeping a running total
    std::cout << "--- Example 3: Custom Accumulator ---" << std::endl;
    options.append_mode = AppendMode::Append;
    auto totals = ParallelMapper<int, int>(Positional<int>([](int x) { return x * x; }), options)
                      .WithAccumulator([](Outcome<int> outcome, Collection<int>& output) -> Status {
                          int previous = output.empty() ? 0 : output.back().ValueOr(0);
                          output.push_back(Success(previous + outcome.ValueOr(0)));
                          return Success();
                      })
                      .Run(std::vector<int>{1, 2, 3, 4});
    for (const auto& entry : *totals.Value()) {
        std::cout << entry.Value() << " ";
    }
    std::cout << std::endl;

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
