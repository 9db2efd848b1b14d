#include "rl/cli.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <print>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

using namespace std::string_view_literals;

namespace rl {

void print_usage(const char *prog)
{
    std::println("HTTP load testing tool");
    std::println("Usage: {} [options] <url>", prog);
    std::println("Options:");
    std::println("  --qps Q            Requests per second, may be fractional (default: 1)");
    std::println("  --duration S       Test duration in seconds (default: 10)");
    std::println("  --method M         HTTP method (default: GET)");
    std::println("  --headers JSON     HTTP headers as a JSON object (default: {{}})");
    std::println("  --payload JSON     Request payload as a JSON object (default: {{}})");
    std::println("  --output FILE      Report file (default: results.json)");
    std::println(
        "  --concurrency N    Max requests in flight; dispatch waits for the whole batch (default: 1)");
    std::println("  --timeout S        Per-request timeout in seconds, 0 = none (default: 0)");
    std::println("  -h, --help         Show this help");
    std::println("");
    std::println("Ctrl-C stops dispatching and waits for in-flight requests; a second Ctrl-C abandons them.");
    std::println("");
    std::println("Examples:");
    std::println("  {} http://127.0.0.1:8080/health", prog);
    std::println(
        "  {} --qps 50 --duration 30 --concurrency 10 --method post --payload '{{\"k\":1}}' http://localhost:8000/api",
        prog);
}

static bool to_double(const std::string &s, double &out)
{
    try
    {
        size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    }
    catch (const std::exception &)
    {
        return false;
    }
}

static bool to_int(const std::string &s, int &out)
{
    try
    {
        size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == s.size();
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_args(int argc, char **argv, Options &opt)
{
    // "--name value" or "--name=value"
    auto take_value = [&](std::string_view a, std::string_view name, int &i, std::string &val) -> bool
    {
        if (a == name)
        {
            if (i + 1 >= argc) return false;
            val = argv[++i];
            return true;
        }
        if (a.size() > name.size() && a.substr(name.size(), 1) == "="sv)
        {
            val = std::string(a.substr(name.size() + 1));
            return true;
        }
        return false;
    };
    auto is_flag = [](std::string_view a, std::string_view name)
    {
        return a == name || (a.size() > name.size() && a.starts_with(name) && a[name.size()] == '=');
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        if (a == "-h"sv || a == "--help"sv)
        {
            opt.help = true;
            print_usage(argv[0]);
            return false;
        }
        if (is_flag(a, "--qps"))
        {
            if (!take_value(a, "--qps", i, val) || !to_double(val, opt.qps))
            {
                std::println(stderr, "invalid --qps value: {}", val);
                return false;
            }
        }
        else if (is_flag(a, "--duration"))
        {
            if (!take_value(a, "--duration", i, val) || !to_int(val, opt.duration))
            {
                std::println(stderr, "invalid --duration value: {}", val);
                return false;
            }
        }
        else if (is_flag(a, "--method"))
        {
            if (!take_value(a, "--method", i, val))
            {
                std::println(stderr, "invalid --method usage");
                return false;
            }
            std::ranges::transform(
                val,
                val.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            opt.method = std::move(val);
        }
        else if (is_flag(a, "--headers"))
        {
            if (!take_value(a, "--headers", i, opt.headers))
            {
                std::println(stderr, "invalid --headers usage");
                return false;
            }
        }
        else if (is_flag(a, "--payload"))
        {
            if (!take_value(a, "--payload", i, opt.payload))
            {
                std::println(stderr, "invalid --payload usage");
                return false;
            }
        }
        else if (is_flag(a, "--output"))
        {
            if (!take_value(a, "--output", i, opt.output))
            {
                std::println(stderr, "invalid --output usage");
                return false;
            }
        }
        else if (is_flag(a, "--concurrency"))
        {
            if (!take_value(a, "--concurrency", i, val) || !to_int(val, opt.concurrency))
            {
                std::println(stderr, "invalid --concurrency value: {}", val);
                return false;
            }
        }
        else if (is_flag(a, "--timeout"))
        {
            if (!take_value(a, "--timeout", i, val) || !to_double(val, opt.timeout))
            {
                std::println(stderr, "invalid --timeout value: {}", val);
                return false;
            }
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println(stderr, "unknown option: {}", a);
            return false;
        }
        else if (!opt.url.empty())
        {
            std::println(stderr, "unexpected argument: {}", a);
            return false;
        }
        else
        {
            opt.url = std::string(a);
        }
    }
    if (opt.url.empty())
    {
        std::println(stderr, "missing target URL");
        return false;
    }
    return true;
}

} // namespace rl
