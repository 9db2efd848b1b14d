#pragma once

#include <chrono>
#include <functional>

#include <boost/asio/io_context.hpp>

#include "rl/concurrency.hpp"
#include "rl/model.hpp"
#include "rl/transport.hpp"

namespace rl {

// Everything one run needs, already validated.
struct LoadPlan {
    HttpRequest request;
    double qps = 1.0;
    double duration = 10.0; // seconds
    int concurrency = 1;
    double timeout = 0.0;   // per-request seconds for the transport, 0 = none
};

// floor(qps * duration), the number of attempts a full run dispatches
int planned_requests(double qps, double duration);

// Runs one attempt: times the exchange on a monotonic clock and maps the transport
// result onto exactly one RequestOutcome, delivered through on_outcome.
void execute_request(HttpTransport& transport,
                     const HttpRequest& req,
                     std::function<void(RequestOutcome)> on_outcome);

// 1回分の負荷試験を実行する
// - qps に従ってペーシングし、concurrency 件ごとにバッチ完了を待つ
// - ioc.run() をこの中で回すので、呼び出しスレッドがイベントループになる
// - cancel がセットされると新規送信をやめ、実行中のバッチを待って返る
// - ioc.stop() されたら実行中のリクエストを待たずに返る（interrupted = true）
RunResult run_load(boost::asio::io_context& ioc,
                   HttpTransport& transport,
                   const LoadPlan& plan,
                   const Cancellation* cancel = nullptr);

} // namespace rl
