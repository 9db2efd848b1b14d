#pragma once

#include <string>

namespace rl
{
struct Options
{
    std::string url;
    double qps = 1.0;
    int duration = 10;                   // seconds
    std::string method = "GET";          // uppercased by parse_args
    std::string headers = "{}";          // JSON object text
    std::string payload = "{}";          // JSON object text
    std::string output = "results.json"; // report file path
    int concurrency = 1;                 // max in-flight attempts
    double timeout = 0.0;                // per-request seconds, 0 = none
    bool help = false;                   // -h/--help was given
};
} // namespace rl
