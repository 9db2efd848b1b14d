#include "rl/runner.hpp"

#include <cmath>
#include <exception>
#include <limits>
#include <memory>
#include <utility>

namespace rl {

namespace {
constexpr int kSuccessStatus = 200;
}

int planned_requests(double qps, double duration)
{
    const double n = std::floor(qps * duration);
    if (!(n > 0.0)) return 0;
    if (n >= static_cast<double>(std::numeric_limits<int>::max()))
        return std::numeric_limits<int>::max();
    return static_cast<int>(n);
}

void execute_request(HttpTransport& transport,
                     const HttpRequest& req,
                     std::function<void(RequestOutcome)> on_outcome)
{
    const auto t0 = std::chrono::steady_clock::now();
    auto reported = std::make_shared<bool>(false);
    auto report = [on_outcome = std::move(on_outcome), reported](RequestOutcome o)
    {
        if (*reported) return;
        *reported = true;
        on_outcome(std::move(o));
    };

    auto on_result = [report, t0](TransportResult r)
    {
        if (r.rc != 0)
        {
            report(make_error_exception(r.error.empty() ? "transport error" : std::move(r.error)));
            return;
        }
        const double elapsed =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        if (r.status == kSuccessStatus) report(make_success(elapsed, r.status));
        else report(make_error_status(elapsed, r.status, std::move(r.body)));
    };

    try
    {
        transport.async_send(req, on_result);
    }
    catch (const std::exception& e)
    {
        report(make_error_exception(e.what()));
    }
}

RunResult run_load(boost::asio::io_context& ioc,
                   HttpTransport& transport,
                   const LoadPlan& plan,
                   const Cancellation* cancel)
{
    RunResult result{};
    result.planned = planned_requests(plan.qps, plan.duration);
    if (result.planned == 0) return result;

    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / plan.qps));
    result.outcomes.reserve(static_cast<size_t>(result.planned));

    bool finished = false;
    const auto t0 = std::chrono::steady_clock::now();

    // 結果の追加はこのコールバックだけが行う（単一スレッド上で完了順に積まれる）
    auto task = [&](int, std::function<void()> done)
    {
        execute_request(transport, plan.request, [&result, done](RequestOutcome o)
        {
            result.outcomes.push_back(std::move(o));
            done();
        });
    };
    auto on_finished = [&](int launched)
    {
        finished = true;
        result.interrupted = launched < result.planned;
    };

    for_each_index_paced(
        ioc, result.planned, plan.concurrency, interval, task, on_finished, cancel);

    if (ioc.stopped()) ioc.restart();
    while (!finished)
    {
        if (ioc.run_one() == 0) break;
    }
    // ループが外から止められた: 実行中のリクエストは結果に含めない
    if (!finished) result.interrupted = true;

    result.elapsed_s =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    return result;
}

} // namespace rl
