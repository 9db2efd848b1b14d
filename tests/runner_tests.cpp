#include <algorithm>
#include <chrono>
#include <functional>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "rl/aggregate.hpp"
#include "rl/runner.hpp"
#include "rl/transport.hpp"

using namespace rl;
using namespace std::chrono_literals;

static void assert_true(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_int(int a, int b, const char *msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b <<
                " actual=" << a << std::endl;
        std::exit(1);
    }
}

// In-process transport: answers each call after `delay` with respond(call_number).
class FakeTransport : public HttpTransport
{
public:
    FakeTransport(boost::asio::io_context &ioc,
                  std::chrono::milliseconds delay,
                  std::function<TransportResult(int)> respond)
        : ioc_(ioc), delay_(delay), respond_(std::move(respond))
    {}

    void async_send(const HttpRequest &req, Handler handler) override
    {
        const int n = ++calls;
        last_request = req;
        ++in_flight;
        max_in_flight = std::max(max_in_flight, in_flight);
        auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, delay_);
        timer->async_wait([this, timer, n, h = std::move(handler)](const boost::system::error_code &)
        {
            --in_flight;
            h(respond_(n));
        });
    }

    int calls = 0;
    int in_flight = 0;
    int max_in_flight = 0;
    HttpRequest last_request;

private:
    boost::asio::io_context &ioc_;
    std::chrono::milliseconds delay_;
    std::function<TransportResult(int)> respond_;
};

class ThrowingTransport : public HttpTransport
{
public:
    void async_send(const HttpRequest &, Handler) override
    {
        ++calls;
        throw std::runtime_error("socket exhausted");
    }

    int calls = 0;
};

// Never answers: each call parks its handler on a timer far in the future.
class HangingTransport : public HttpTransport
{
public:
    explicit HangingTransport(boost::asio::io_context &ioc) : ioc_(ioc) {}

    void async_send(const HttpRequest &, Handler handler) override
    {
        ++calls;
        auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, 1h);
        timer->async_wait([timer, h = std::move(handler)](const boost::system::error_code &) {});
    }

    int calls = 0;

private:
    boost::asio::io_context &ioc_;
};

static TransportResult http_status(int status, std::string body = {})
{
    TransportResult r{};
    r.rc = 0;
    r.status = status;
    r.body = std::move(body);
    return r;
}

static TransportResult transport_error(std::string message)
{
    TransportResult r{};
    r.rc = -1;
    r.error = std::move(message);
    return r;
}

static LoadPlan base_plan(double qps, double duration, int concurrency)
{
    LoadPlan plan{};
    plan.request.method = "GET";
    plan.request.url = "http://127.0.0.1:9/health";
    plan.qps = qps;
    plan.duration = duration;
    plan.concurrency = concurrency;
    return plan;
}

static int count_kind(const RunResult &run, OutcomeKind kind)
{
    return static_cast<int>(std::ranges::count_if(
        run.outcomes,
        [&](const RequestOutcome &o) { return o.kind == kind; }));
}

static void test_planned_requests()
{
    assert_eq_int(planned_requests(10, 1), 10, "10 qps x 1 s");
    assert_eq_int(planned_requests(5, 2), 10, "5 qps x 2 s");
    assert_eq_int(planned_requests(2.5, 3), 7, "floor(7.5)");
    assert_eq_int(planned_requests(0.001, 1), 0, "below one request");
    assert_eq_int(planned_requests(0.5, 1), 0, "floor(0.5)");
}

static void test_all_ok()
{
    boost::asio::io_context ioc;
    FakeTransport tr(ioc, 1ms, [](int) { return http_status(200, "ok"); });
    RunResult run = run_load(ioc, tr, base_plan(10, 1, 5));

    assert_eq_int(tr.calls, 10, "all ok: dispatched == qps*duration");
    assert_eq_int(static_cast<int>(run.outcomes.size()), 10, "all ok: one outcome per attempt");
    assert_true(!run.interrupted, "all ok: not interrupted");

    SummaryReport rep = summarize(run);
    assert_eq_int(rep.total_requests, 10, "all ok: total");
    assert_eq_int(rep.successful_requests, 10, "all ok: successful");
    assert_eq_int(rep.failed_requests, 0, "all ok: failed");
    assert_true(rep.latency.has_value(), "all ok: latency fields present");
    assert_true(rep.latency->min >= 0.0 && rep.latency->max >= rep.latency->min, "all ok: latencies >= 0");
}

static void test_all_500()
{
    boost::asio::io_context ioc;
    FakeTransport tr(ioc, 1ms, [](int) { return http_status(500, "Internal Server Error"); });
    RunResult run = run_load(ioc, tr, base_plan(5, 2, 2));

    SummaryReport rep = summarize(run);
    assert_eq_int(rep.failed_requests, 10, "all 500: failed");
    assert_eq_int(rep.successful_requests, 0, "all 500: no successes");
    assert_true(!rep.latency.has_value(), "all 500: no latency fields");
    assert_true(!rep.message.empty(), "all 500: message");
    assert_true(rep.detailed_errors.size() == 1 && rep.detailed_errors[0].first == "500", "all 500: one category");
    assert_eq_int(static_cast<int>(rep.detailed_errors[0].second.size()), 10, "all 500: 10 entries");
    assert_true(rep.detailed_errors[0].second[0] == "Internal Server Error", "all 500: body kept");
}

static void test_zero_requests()
{
    boost::asio::io_context ioc;
    FakeTransport tr(ioc, 1ms, [](int) { return http_status(200); });
    RunResult run = run_load(ioc, tr, base_plan(0.001, 1, 1));

    assert_eq_int(tr.calls, 0, "N=0: no transport call");
    assert_true(run.outcomes.empty(), "N=0: empty result");
    SummaryReport rep = summarize(run);
    assert_eq_int(rep.total_requests, 0, "N=0: total 0");
    assert_true(!rep.message.empty(), "N=0: message present");
}

static void test_mixed_successes_and_exceptions()
{
    boost::asio::io_context ioc;
    // calls 3, 6 and 9 fail at the transport level
    FakeTransport tr(ioc, 2ms, [](int n)
    {
        if (n % 3 == 0) return transport_error("connect: Connection refused");
        return http_status(200);
    });
    RunResult run = run_load(ioc, tr, base_plan(20, 0.5, 3));

    assert_eq_int(static_cast<int>(run.outcomes.size()), 10, "mixed: 10 outcomes");
    assert_eq_int(count_kind(run, OutcomeKind::ErrorException), 3, "mixed: 3 exceptions");
    for (const auto &o : run.outcomes)
    {
        if (o.kind == OutcomeKind::ErrorException)
        {
            assert_true(o.latency == 0.0, "mixed: no latency on transport errors");
            assert_true(o.detail == "connect: Connection refused", "mixed: error text kept");
        }
    }

    SummaryReport rep = summarize(run);
    assert_eq_int(rep.successful_requests, 7, "mixed: successful");
    assert_eq_int(rep.failed_requests, 3, "mixed: failed");
    assert_eq_int(rep.total_requests, rep.successful_requests + rep.failed_requests, "mixed: sum");
    assert_true(rep.detailed_errors.size() == 1 && rep.detailed_errors[0].first == "exceptions", "mixed: category");
    assert_eq_int(static_cast<int>(rep.detailed_errors[0].second.size()), 3, "mixed: 3 entries");
}

static void test_concurrency_bound_with_slow_responses()
{
    boost::asio::io_context ioc;
    // responses much slower than the pacing interval
    FakeTransport tr(ioc, 40ms, [](int) { return http_status(200); });
    RunResult run = run_load(ioc, tr, base_plan(200, 0.05, 3));

    assert_eq_int(tr.calls, 10, "slow: all dispatched");
    assert_eq_int(static_cast<int>(run.outcomes.size()), 10, "slow: all collected");
    assert_true(tr.max_in_flight <= 3, "slow: in flight never exceeds concurrency");
    // 4 batches (3+3+3+1) of ~40 ms each
    assert_true(run.elapsed_s >= 0.16, "slow: barrier throttles achieved rate");
}

static void test_pacing()
{
    boost::asio::io_context ioc;
    FakeTransport tr(ioc, 0ms, [](int) { return http_status(200); });
    RunResult run = run_load(ioc, tr, base_plan(50, 0.2, 10));
    assert_eq_int(static_cast<int>(run.outcomes.size()), 10, "pacing: 10 outcomes");
    // one 20 ms interval after each of the 10 launches
    assert_true(run.elapsed_s >= 0.2, "pacing: run spans the configured duration");
}

static void test_request_forwarded()
{
    boost::asio::io_context ioc;
    FakeTransport tr(ioc, 0ms, [](int) { return http_status(200); });
    LoadPlan plan = base_plan(4, 0.75, 1);
    plan.request.method = "POST";
    plan.request.headers = {{"X-Test", "1"}};
    plan.request.body = R"({"k":"v"})";
    (void) run_load(ioc, tr, plan);
    assert_eq_int(tr.calls, 3, "forwarded: 3 calls");
    assert_true(tr.last_request.method == "POST", "forwarded: method");
    assert_true(tr.last_request.url == plan.request.url, "forwarded: url");
    assert_true(tr.last_request.body == plan.request.body, "forwarded: body");
    assert_true(tr.last_request.headers.size() == 1 && tr.last_request.headers[0].first == "X-Test",
                "forwarded: headers");
}

static void test_throwing_transport_recorded()
{
    boost::asio::io_context ioc;
    ThrowingTransport tr;
    RunResult run = run_load(ioc, tr, base_plan(100, 0.05, 2));
    assert_eq_int(tr.calls, 5, "throwing: every attempt dispatched");
    assert_eq_int(count_kind(run, OutcomeKind::ErrorException), 5, "throwing: recorded as exceptions");
    assert_true(run.outcomes[0].detail == "socket exhausted", "throwing: message kept");
}

static void test_execute_request_mapping()
{
    boost::asio::io_context ioc;
    FakeTransport tr(ioc, 5ms, [](int n)
    {
        if (n == 1) return http_status(200, "ignored");
        if (n == 2) return http_status(404, "no such page");
        return transport_error("");
    });

    std::vector<RequestOutcome> got;
    HttpRequest req{};
    for (int i = 0; i < 3; ++i)
    {
        execute_request(tr, req, [&](RequestOutcome o) { got.push_back(std::move(o)); });
    }
    ioc.run();

    assert_eq_int(static_cast<int>(got.size()), 3, "mapping: one outcome per call");
    assert_true(got[0].kind == OutcomeKind::Success && got[0].status == 200, "mapping: 200 -> success");
    assert_true(got[0].latency >= 0.005, "mapping: latency measured");
    assert_true(got[0].detail.empty(), "mapping: success keeps no body");
    assert_true(got[1].kind == OutcomeKind::ErrorStatus && got[1].status == 404, "mapping: 404 -> error status");
    assert_true(got[1].detail == "no such page", "mapping: body as detail");
    assert_true(got[1].latency > 0.0, "mapping: error status has latency");
    assert_true(got[2].kind == OutcomeKind::ErrorException, "mapping: rc!=0 -> exception");
    assert_true(!got[2].detail.empty(), "mapping: exception always has a description");
}

static void test_cancellation_stops_dispatch()
{
    boost::asio::io_context ioc;
    Cancellation cancel;
    FakeTransport tr(ioc, 1ms, [&](int n)
    {
        if (n == 4) cancel.cancel();
        return http_status(200);
    });
    RunResult run = run_load(ioc, tr, base_plan(100, 1, 2), &cancel);

    assert_true(run.interrupted, "cancel: interrupted");
    assert_eq_int(run.planned, 100, "cancel: planned kept");
    assert_true(tr.calls < 100, "cancel: dispatch stopped early");
    assert_eq_int(static_cast<int>(run.outcomes.size()), tr.calls, "cancel: one outcome per dispatched attempt");
    SummaryReport rep = summarize(run);
    assert_eq_int(rep.total_requests, tr.calls, "cancel: report consistent");
}

static void test_stopped_loop_abandons_hung_requests()
{
    boost::asio::io_context ioc;
    HangingTransport tr(ioc);
    boost::asio::steady_timer stopper(ioc, 50ms);
    stopper.async_wait([&](const boost::system::error_code &) { ioc.stop(); });

    const auto t0 = std::chrono::steady_clock::now();
    RunResult run = run_load(ioc, tr, base_plan(10, 1, 2), nullptr);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    assert_true(elapsed < 5s, "stop: returns without waiting for hung requests");
    assert_true(run.interrupted, "stop: interrupted");
    assert_eq_int(tr.calls, 1, "stop: first attempt launched before the stop");
    assert_eq_int(static_cast<int>(run.outcomes.size()), 0, "stop: no outcome for a hung request");
    assert_eq_int(summarize(run).total_requests, 0, "stop: report still builds");
}

int main()
{
    test_planned_requests();
    test_all_ok();
    test_all_500();
    test_zero_requests();
    test_mixed_successes_and_exceptions();
    test_concurrency_bound_with_slow_responses();
    test_pacing();
    test_request_forwarded();
    test_throwing_transport_recorded();
    test_execute_request_mapping();
    test_cancellation_stops_dispatch();
    test_stopped_loop_abandons_hung_requests();
    std::cout << "runner tests: OK" << std::endl;
    return 0;
}
