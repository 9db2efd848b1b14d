// RateLoad: rate-controlled HTTP load generator (C++23)

#include <chrono>
#include <csignal>
#include <cstdio>
#include <functional>
#include <print>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "rl/aggregate.hpp"
#include "rl/cli.hpp"
#include "rl/concurrency.hpp"
#include "rl/options.hpp"
#include "rl/output.hpp"
#include "rl/runner.hpp"
#include "rl/transport.hpp"

int main(int argc, char **argv)
{
    rl::Options opt;
    if (argc <= 1)
    {
        rl::print_usage(argv[0]);
        return 0;
    }
    if (!rl::parse_args(argc, argv, opt))
    {
        return opt.help ? 0 : 1;
    }
    if (auto err = rl::validate_options(opt); !err.empty())
    {
        std::println(stderr, "error: {}", err);
        return 1;
    }
    rl::LoadPlan plan;
    if (auto err = rl::make_load_plan(opt, plan); !err.empty())
    {
        std::println(stderr, "error: {}", err);
        return 1;
    }

    boost::asio::io_context ioc;

    // 1回目の Ctrl-C: 送出を止め、実行中のリクエストを待つ
    // 2回目: 待たずにイベントループを止める（--timeout なしで応答が返らない場合の出口）
    rl::Cancellation cancel;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    int signals_seen = 0;
    std::function<void(const boost::system::error_code &, int)> on_signal =
        [&](const boost::system::error_code &ec, int sig)
    {
        if (ec) return;
        if (++signals_seen == 1)
        {
            std::println(stderr, "signal {} received, waiting for in-flight requests (again to abort)", sig);
            cancel.cancel();
            signals.async_wait(on_signal);
            return;
        }
        std::println(stderr, "signal {} received again, abandoning in-flight requests", sig);
        ioc.stop();
    };
    signals.async_wait(on_signal);

    rl::BeastTransport transport(
        ioc,
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(plan.timeout)));

    std::print("{}", rl::format_start_text(plan));
    const rl::RunResult run = rl::run_load(ioc, transport, plan, &cancel);
    boost::system::error_code ignored;
    signals.cancel(ignored);
    std::print("{}", rl::format_finish_text(run));

    const rl::SummaryReport rep = rl::summarize(run);
    std::print("{}", rl::format_summary_text(rep, run.elapsed_s));
    if (auto err = rl::write_report_file(rep, opt.output); !err.empty())
    {
        std::println(stderr, "error: {}", err);
        return 1;
    }
    std::println("Results written to {}", opt.output);
    return 0;
}
