#include "rl/model.hpp"

#include <utility>

namespace rl {

RequestOutcome make_success(double latency, int status)
{
    RequestOutcome o{};
    o.kind = OutcomeKind::Success;
    o.latency = latency;
    o.status = status;
    return o;
}

RequestOutcome make_error_status(double latency, int status, std::string body)
{
    RequestOutcome o{};
    o.kind = OutcomeKind::ErrorStatus;
    o.latency = latency;
    o.status = status;
    o.detail = std::move(body);
    return o;
}

RequestOutcome make_error_exception(std::string message)
{
    RequestOutcome o{};
    o.kind = OutcomeKind::ErrorException;
    o.detail = std::move(message);
    return o;
}

} // namespace rl
