// ============================================================================
// parmap/map/progress.cpp - Terminal Progress Display
// ============================================================================

#include "parmap/map/progress.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace parmap {

namespace {

std::string FormatClock(double seconds) {
    auto total = static_cast<long long>(std::max(0.0, seconds));
    long long hours = total / 3600;
    long long minutes = (total / 60) % 60;
    long long secs = total % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, secs);
    }
    return fmt::format("{:02}:{:02}", minutes, secs);
}

}  // namespace

std::string FormatProgressLine(std::string_view label, size_t completed, size_t total,
                               std::chrono::duration<double> elapsed, size_t bar_width) {
    std::string prefix = label.empty() ? std::string{} : fmt::format("{}: ", label);
    if (total != kUnknownTotal) {
        completed = std::min(completed, total);
    }
    double secs = elapsed.count();
    double rate = secs > 0.0 ? static_cast<double>(completed) / secs : 0.0;

    // Unknown length: count and rate only
    if (total == kUnknownTotal) {
        return fmt::format("{}{}it [{}, {:.2f}it/s]", prefix, completed, FormatClock(secs), rate);
    }

    // Nothing to dispatch is already done
    double fraction = total == 0 ? 1.0 : static_cast<double>(completed) / static_cast<double>(total);
    auto filled = static_cast<size_t>(fraction * static_cast<double>(bar_width));
    std::string bar(filled, '#');
    bar.append(bar_width - filled, ' ');

    double remaining = rate > 0.0 ? static_cast<double>(total - completed) / rate : 0.0;

    return fmt::format("{}{:3.0f}%|{}| {}/{} [{}<{}, {:.2f}it/s]", prefix, fraction * 100.0, bar, completed, total,
                       FormatClock(secs), FormatClock(remaining), rate);
}

TerminalProgressSink::TerminalProgressSink(std::string label, std::FILE* out, size_t bar_width)
    : label_(std::move(label)), out_(out), bar_width_(bar_width) {}

void TerminalProgressSink::OnStart(size_t total) {
    start_ = std::chrono::steady_clock::now();
    drawn_ = false;
    Draw(0, total);
}

void TerminalProgressSink::OnProgress(size_t completed, size_t total) {
    Draw(completed, total);
}

void TerminalProgressSink::OnFinish() {
    if (drawn_) {
        Draw(last_completed_, last_total_);
        fmt::print(out_, "\n");
        std::fflush(out_);
        drawn_ = false;
    }
}

void TerminalProgressSink::Draw(size_t completed, size_t total) {
    last_completed_ = completed;
    last_total_ = total;
    auto elapsed = std::chrono::steady_clock::now() - start_;
    fmt::print(out_, "\r{}", FormatProgressLine(label_, completed, total, elapsed, bar_width_));
    std::fflush(out_);
    drawn_ = true;
}

}  // namespace parmap
