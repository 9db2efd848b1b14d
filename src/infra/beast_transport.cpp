#include "rl/transport.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace rl
{
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

std::optional<ParsedUrl> parse_url(const std::string &url)
{
    const auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;

    ParsedUrl out{};
    out.scheme = url.substr(0, sep);
    std::ranges::transform(
        out.scheme,
        out.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.scheme != "http" && out.scheme != "https") return std::nullopt;

    std::string_view rest(url);
    rest.remove_prefix(sep + 3);
    const auto frag = rest.find('#');
    if (frag != std::string_view::npos) rest = rest.substr(0, frag);

    const auto auth_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, auth_end);
    std::string_view target =
            auth_end == std::string_view::npos ? std::string_view{} : rest.substr(auth_end);

    std::string_view port;
    if (!authority.empty() && authority.front() == '[')
    {
        // [v6-literal]:port
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        out.host = std::string(authority.substr(1, close - 1));
        std::string_view tail = authority.substr(close + 1);
        if (!tail.empty())
        {
            if (tail.front() != ':') return std::nullopt;
            port = tail.substr(1);
        }
    }
    else
    {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
        {
            out.host = std::string(authority.substr(0, colon));
            port = authority.substr(colon + 1);
        }
        else
        {
            out.host = std::string(authority);
        }
    }
    if (out.host.empty() || out.host.find('@') != std::string::npos) return std::nullopt;

    if (port.empty())
    {
        out.port = out.scheme == "https" ? "443" : "80";
    }
    else
    {
        if (!std::ranges::all_of(port, [](unsigned char c) { return std::isdigit(c) != 0; }))
            return std::nullopt;
        out.port = std::string(port);
    }

    if (target.empty()) out.target = "/";
    else if (target.front() == '?') out.target = "/" + std::string(target);
    else out.target = std::string(target);
    return out;
}

namespace
{
// One request on its own connection: resolve, connect, write, read, close.
class Exchange : public std::enable_shared_from_this<Exchange>
{
public:
    Exchange(asio::io_context &ioc,
             ParsedUrl url,
             http::request<http::string_body> req,
             std::chrono::steady_clock::duration timeout,
             HttpTransport::Handler handler)
        : url_(std::move(url)),
          req_(std::move(req)),
          timeout_(timeout),
          handler_(std::move(handler)),
          resolver_(ioc),
          stream_(ioc),
          deadline_(ioc)
    {}

    void start()
    {
        if (timeout_ > std::chrono::steady_clock::duration::zero())
        {
            deadline_.expires_after(timeout_);
            deadline_.async_wait(
                beast::bind_front_handler(&Exchange::on_deadline, shared_from_this()));
        }
        resolver_.async_resolve(
            url_.host,
            url_.port,
            beast::bind_front_handler(&Exchange::on_resolve, shared_from_this()));
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        if (ec) return fail("resolve", ec);
        stream_.async_connect(
            results,
            beast::bind_front_handler(&Exchange::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
    {
        if (ec) return fail("connect", ec);
        http::async_write(
            stream_,
            req_,
            beast::bind_front_handler(&Exchange::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t)
    {
        if (ec) return fail("write", ec);
        http::async_read(
            stream_,
            buffer_,
            res_,
            beast::bind_front_handler(&Exchange::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t)
    {
        if (ec) return fail("read", ec);
        close();
        TransportResult r{};
        r.rc = 0;
        r.status = static_cast<int>(res_.result_int());
        r.body = std::move(res_.body());
        finish(std::move(r));
    }

    void on_deadline(beast::error_code ec)
    {
        if (ec == asio::error::operation_aborted || done_) return;
        timed_out_ = true;
        resolver_.cancel();
        close();
    }

    void fail(std::string_view stage, beast::error_code ec)
    {
        close();
        TransportResult r{};
        r.rc = -1;
        if (timed_out_) r.error = "request timed out";
        else r.error = std::string(stage) + ": " + ec.message();
        finish(std::move(r));
    }

    void finish(TransportResult r)
    {
        if (done_) return;
        done_ = true;
        deadline_.cancel();
        handler_(std::move(r));
    }

    void close()
    {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.socket().close(ignored);
    }

    ParsedUrl url_;
    http::request<http::string_body> req_;
    std::chrono::steady_clock::duration timeout_;
    HttpTransport::Handler handler_;

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    asio::steady_timer deadline_;
    beast::flat_buffer buffer_;
    http::response<http::string_body> res_;

    bool timed_out_ = false;
    bool done_ = false;
};

std::string host_field(const ParsedUrl &u)
{
    const bool default_port = (u.scheme == "http" && u.port == "80") ||
                              (u.scheme == "https" && u.port == "443");
    std::string host = u.host.find(':') != std::string::npos ? "[" + u.host + "]" : u.host;
    if (!default_port) host += ":" + u.port;
    return host;
}
} // namespace

BeastTransport::BeastTransport(asio::io_context &ioc,
                               std::chrono::steady_clock::duration timeout)
    : ioc_(ioc), timeout_(timeout)
{}

void BeastTransport::async_send(const HttpRequest &req, Handler handler)
{
    auto post_error = [&](std::string message)
    {
        TransportResult r{};
        r.rc = -1;
        r.error = std::move(message);
        asio::post(ioc_, [h = std::move(handler), r = std::move(r)]() mutable { h(std::move(r)); });
    };

    auto url = parse_url(req.url);
    if (!url) return post_error("invalid URL: " + req.url);
    if (url->scheme != "http") return post_error("unsupported scheme: " + url->scheme);

    http::request<http::string_body> msg;
    msg.version(11);
    const http::verb verb = http::string_to_verb(req.method);
    if (verb == http::verb::unknown) msg.method_string(req.method);
    else msg.method(verb);
    msg.target(url->target);
    msg.set(http::field::host, host_field(*url));
    msg.set(http::field::user_agent, "rateload/1.0");
    for (const auto &[name, value] : req.headers) msg.set(name, value);
    msg.keep_alive(false);
    msg.body() = req.body;
    msg.prepare_payload();

    std::make_shared<Exchange>(ioc_, std::move(*url), std::move(msg), timeout_, std::move(handler))
        ->start();
}
} // namespace rl
