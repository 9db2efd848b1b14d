#include "rl/output.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "rl/aggregate.hpp"
#include "rl/json.hpp"

namespace rl
{
namespace
{
constexpr const char *kIndent = "    ";

void write_number_field(std::ostringstream &os, const char *key, double v)
{
    os << kIndent << '"' << key << "\": " << json_number(v) << ",\n";
}

void write_detailed_errors(std::ostringstream &os, const SummaryReport &rep)
{
    os << kIndent << R"("detailed_errors": )";
    if (rep.detailed_errors.empty())
    {
        os << "{}";
        return;
    }
    os << "{\n";
    for (size_t i = 0; i < rep.detailed_errors.size(); ++i)
    {
        const auto &[cat, details] = rep.detailed_errors[i];
        os << kIndent << kIndent << '"' << json_escape(cat) << "\": [";
        if (details.empty())
        {
            os << "]";
        }
        else
        {
            os << "\n";
            for (size_t j = 0; j < details.size(); ++j)
            {
                os << kIndent << kIndent << kIndent << '"' << json_escape(details[j]) << '"';
                if (j + 1 < details.size()) os << ",";
                os << "\n";
            }
            os << kIndent << kIndent << "]";
        }
        if (i + 1 < rep.detailed_errors.size()) os << ",";
        os << "\n";
    }
    os << kIndent << "}";
}
} // namespace

std::string build_report_json(const SummaryReport &rep)
{
    std::ostringstream os;
    os << "{\n";
    os << kIndent << R"("total_requests": )" << rep.total_requests << ",\n";
    os << kIndent << R"("successful_requests": )" << rep.successful_requests << ",\n";
    os << kIndent << R"("failed_requests": )" << rep.failed_requests << ",\n";
    if (rep.latency)
    {
        const auto &l = *rep.latency;
        write_number_field(os, "mean_latency", l.mean);
        write_number_field(os, "median_latency", l.median);
        write_number_field(os, "stddev_latency", l.stddev);
        write_number_field(os, "max_latency", l.max);
        write_number_field(os, "min_latency", l.min);
        write_number_field(os, "90th_percentile_latency", l.p90);
    }
    else
    {
        os << kIndent << R"("message": ")" << json_escape(rep.message) << "\",\n";
    }
    write_detailed_errors(os, rep);
    os << "\n}";
    return os.str();
}

std::string write_report_file(const SummaryReport &rep, const std::string &path)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) return "cannot open " + path + ": " + std::strerror(errno);
    out << build_report_json(rep);
    out.flush();
    if (!out) return "cannot write " + path;
    return {};
}
} // namespace rl
