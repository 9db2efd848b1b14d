#include "rl/output.hpp"

#include <iomanip>
#include <sstream>

#include "rl/aggregate.hpp"
#include "rl/model.hpp"
#include "rl/runner.hpp"

namespace rl {

std::string format_start_text(const LoadPlan& plan)
{
    std::ostringstream os;
    os << "Starting the load test for " << plan.request.method << ' ' << plan.request.url
       << " with a QPS of " << plan.qps
       << " for " << plan.duration << " secs"
       << " (concurrency " << plan.concurrency << ", "
       << planned_requests(plan.qps, plan.duration) << " requests)\n";
    return os.str();
}

std::string format_finish_text(const RunResult& run)
{
    std::ostringstream os;
    if (run.interrupted)
    {
        os << "Test interrupted: " << run.outcomes.size() << " of " << run.planned
           << " requests dispatched.\n";
    }
    else
    {
        os << "Test complete.\n";
    }
    return os.str();
}

std::string format_summary_text(const SummaryReport& rep, double elapsed_s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "requests: total=" << rep.total_requests
       << " ok=" << rep.successful_requests
       << " failed=" << rep.failed_requests;
    if (elapsed_s > 0.0)
    {
        os << " achieved_qps=" << static_cast<double>(rep.total_requests) / elapsed_s;
    }
    os << '\n';

    if (rep.latency)
    {
        const auto& l = *rep.latency;
        os << "latency: min=" << l.min * 1000.0
           << " ms, mean=" << l.mean * 1000.0
           << " ms, median=" << l.median * 1000.0
           << " ms, p90=" << l.p90 * 1000.0
           << " ms, max=" << l.max * 1000.0
           << " ms, stddev=" << l.stddev * 1000.0 << " ms\n";
    }
    else
    {
        os << rep.message << '\n';
    }

    for (const auto& [cat, details] : rep.detailed_errors)
    {
        os << "  errors[" << cat << "]: " << details.size() << '\n';
    }
    return os.str();
}

} // namespace rl
