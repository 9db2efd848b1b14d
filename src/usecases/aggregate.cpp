#include "rl/aggregate.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace rl {

double percentile_at(const std::vector<double>& sorted, double fraction)
{
    if (sorted.empty()) return 0.0;
    const size_t n = sorted.size();
    auto idx = static_cast<size_t>(std::floor(fraction * static_cast<double>(n)));
    if (idx >= n) idx = n - 1;
    return sorted[idx];
}

double round4(double v)
{
    return std::round(v * 10000.0) / 10000.0;
}

LatencyStats aggregate_latencies(const std::vector<double>& times)
{
    LatencyStats st{};
    if (times.empty()) return st;

    std::vector<double> sorted = times;
    std::ranges::sort(sorted);
    const size_t n = sorted.size();

    const double mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) /
                        static_cast<double>(n);
    const double median = n % 2 == 1
                              ? sorted[n / 2]
                              : (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;

    double stddev = 0.0;
    if (n >= 2)
    {
        double ss = 0.0;
        for (double t : sorted) ss += (t - mean) * (t - mean);
        stddev = std::sqrt(ss / static_cast<double>(n - 1));
    }

    st.mean = round4(mean);
    st.median = round4(median);
    st.stddev = round4(stddev);
    st.max = round4(sorted.back());
    st.min = round4(sorted.front());
    st.p90 = round4(percentile_at(sorted, 0.9));
    return st;
}

static std::vector<std::string>& category(SummaryReport& rep, const std::string& key)
{
    auto it = std::ranges::find_if(
        rep.detailed_errors,
        [&](const auto& kv) { return kv.first == key; });
    if (it != rep.detailed_errors.end()) return it->second;
    rep.detailed_errors.emplace_back(key, std::vector<std::string>{});
    return rep.detailed_errors.back().second;
}

SummaryReport summarize(const RunResult& run)
{
    SummaryReport rep{};
    std::vector<double> latencies;
    latencies.reserve(run.outcomes.size());

    for (const auto& o : run.outcomes)
    {
        switch (o.kind)
        {
            case OutcomeKind::Success:
                latencies.push_back(o.latency);
                break;
            case OutcomeKind::ErrorStatus:
                ++rep.failed_requests;
                category(rep, std::to_string(o.status)).push_back(o.detail);
                break;
            case OutcomeKind::ErrorException:
                ++rep.failed_requests;
                category(rep, kExceptionsCategory).push_back(o.detail);
                break;
        }
    }

    rep.successful_requests = static_cast<int>(latencies.size());
    rep.total_requests = rep.successful_requests + rep.failed_requests;
    if (latencies.empty()) rep.message = kNoSuccessMessage;
    else rep.latency = aggregate_latencies(latencies);
    return rep;
}

} // namespace rl
