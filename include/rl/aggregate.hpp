#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rl/model.hpp"

namespace rl {

// All values in seconds, rounded to 4 decimal places.
struct LatencyStats {
    double mean{};
    double median{};
    double stddev{}; // sample stddev; 0 with fewer than two samples
    double max{};
    double min{};
    double p90{};
};

struct SummaryReport {
    int total_requests{};
    int successful_requests{};
    int failed_requests{};
    std::optional<LatencyStats> latency; // only with at least one success
    std::string message;                 // only without successes
    // category ("500", "exceptions", ...) -> details, in first-seen order
    std::vector<std::pair<std::string, std::vector<std::string>>> detailed_errors;
};

inline constexpr const char* kNoSuccessMessage = "No successful requests.";
inline constexpr const char* kExceptionsCategory = "exceptions";

// Nearest rank: sorted[floor(fraction * n)], clamped to the last element.
// `sorted` must be ascending; 0 for an empty input.
double percentile_at(const std::vector<double>& sorted, double fraction);

// round half away from zero at 4 decimals
double round4(double v);

// Statistics over latency samples; all zero for an empty input
LatencyStats aggregate_latencies(const std::vector<double>& times);

SummaryReport summarize(const RunResult& run);

} // namespace rl
