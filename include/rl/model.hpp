#pragma once

#include <string>
#include <vector>

namespace rl {

enum class OutcomeKind {
    Success,        // HTTP 200
    ErrorStatus,    // any other HTTP status, body kept in detail
    ErrorException, // transport failure, no latency
};

struct RequestOutcome {
    OutcomeKind kind{OutcomeKind::ErrorException};
    double      latency{};  // seconds; 0 for ErrorException
    int         status{};   // HTTP status; 0 for ErrorException
    std::string detail;     // response body or failure description
};

RequestOutcome make_success(double latency, int status);
RequestOutcome make_error_status(double latency, int status, std::string body);
RequestOutcome make_error_exception(std::string message);

struct RunResult {
    std::vector<RequestOutcome> outcomes; // completion order
    int       planned{};                  // floor(qps * duration)
    double    elapsed_s{};
    bool      interrupted{};
};

} // namespace rl
