#include "rl/cli.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "rl/runner.hpp"
#include "rl/transport.hpp"

using json = nlohmann::json;

namespace rl {

namespace {

bool is_token(std::string_view s)
{
    // RFC 9110 tchar
    constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
    return !s.empty() && std::ranges::all_of(s, [&](unsigned char c)
    {
        return std::isalnum(c) != 0 || extra.find(static_cast<char>(c)) != std::string_view::npos;
    });
}

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](unsigned char x, unsigned char y)
           {
               return std::tolower(x) == std::tolower(y);
           });
}

// Parse text as a JSON object; on failure returns an error naming the flag.
std::string parse_object(const std::string& text, std::string_view flag, json& out)
{
    try
    {
        out = json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        return "invalid " + std::string(flag) + " JSON: " + e.what();
    }
    if (!out.is_object()) return std::string(flag) + " must be a JSON object";
    return {};
}

} // namespace

std::string validate_options(const Options& opt)
{
    if (opt.url.empty()) return "missing target URL";
    if (!parse_url(opt.url)) return "invalid URL: " + opt.url;
    if (!std::isfinite(opt.qps) || opt.qps <= 0.0) return "--qps must be greater than 0";
    if (opt.duration <= 0) return "--duration must be greater than 0";
    if (opt.concurrency < 1) return "--concurrency must be at least 1";
    if (!std::isfinite(opt.timeout) || opt.timeout < 0.0) return "--timeout must be 0 or greater";
    if (opt.qps * static_cast<double>(opt.duration) >
        static_cast<double>(std::numeric_limits<int>::max()))
        return "--qps * --duration exceeds the supported request count";
    if (!is_token(opt.method)) return "invalid --method: " + opt.method;
    if (opt.output.empty()) return "--output must not be empty";
    return {};
}

std::string make_load_plan(const Options& opt, LoadPlan& plan)
{
    json headers;
    json payload;
    if (auto err = parse_object(opt.headers, "--headers", headers); !err.empty()) return err;
    if (auto err = parse_object(opt.payload, "--payload", payload); !err.empty()) return err;

    LoadPlan out{};
    out.request.method = opt.method;
    out.request.url = opt.url;
    bool has_content_type = false;
    for (const auto& item : headers.items())
    {
        const std::string& name = item.key();
        if (!item.value().is_string()) return "--headers value for '" + name + "' must be a string";
        if (iequals(name, "Content-Type")) has_content_type = true;
        out.request.headers.emplace_back(name, item.value().get<std::string>());
    }
    // the payload always travels as a JSON body
    if (!has_content_type) out.request.headers.emplace_back("Content-Type", "application/json");
    out.request.body = payload.dump();

    out.qps = opt.qps;
    out.duration = static_cast<double>(opt.duration);
    out.concurrency = opt.concurrency;
    out.timeout = opt.timeout;
    plan = std::move(out);
    return {};
}

} // namespace rl
