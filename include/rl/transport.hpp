#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>

namespace rl
{
struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string> > headers;
    std::string body;
};

struct TransportResult
{
    int rc{};           // 0 when a response was received
    std::string error;  // valid if rc != 0
    int status{};       // valid if rc == 0
    std::string body;   // valid if rc == 0
};

// Sends one request and reports exactly one TransportResult through the handler.
// Implementations complete asynchronously on the io_context they were built with.
class HttpTransport
{
public:
    using Handler = std::function<void(TransportResult)>;

    virtual ~HttpTransport() = default;

    virtual void async_send(const HttpRequest &req, Handler handler) = 0;
};

struct ParsedUrl
{
    std::string scheme; // lowercased
    std::string host;
    std::string port;   // defaulted from scheme when absent
    std::string target; // path + query, at least "/"
};

// Split an absolute http(s) URL. Returns std::nullopt for anything else.
std::optional<ParsedUrl> parse_url(const std::string &url);

// HTTP/1.1 over Boost.Beast, one connection per request. Plain http only.
class BeastTransport : public HttpTransport
{
public:
    // timeout of zero disables the per-request deadline
    explicit BeastTransport(boost::asio::io_context &ioc,
                            std::chrono::steady_clock::duration timeout = {});

    void async_send(const HttpRequest &req, Handler handler) override;

private:
    boost::asio::io_context &ioc_;
    std::chrono::steady_clock::duration timeout_;
};
} // namespace rl
