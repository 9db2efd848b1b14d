#pragma once

#include <string>

namespace rl
{
// Forward declarations to avoid heavy includes in header
struct LoadPlan;
struct RunResult;
struct SummaryReport;

// Text formatting (returns complete text block with trailing newline)
std::string format_start_text(const LoadPlan &plan);

std::string format_finish_text(const RunResult &run);

std::string format_summary_text(const SummaryReport &rep, double elapsed_s);

// Report file body: JSON object, 4-space indent, trailing newline not included
std::string build_report_json(const SummaryReport &rep);

// Write build_report_json(rep) to path. Returns an error message, empty on success.
std::string write_report_file(const SummaryReport &rep, const std::string &path);
} // namespace rl
