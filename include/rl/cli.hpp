#pragma once

#include <string>

#include "rl/options.hpp"

namespace rl
{
struct LoadPlan;

void print_usage(const char *prog);

// Fill opt from argv. Prints the problem and returns false on bad usage or --help.
bool parse_args(int argc, char **argv, Options &opt);

// Range and shape checks. Returns an error message, empty when opt is usable.
std::string validate_options(const Options &opt);

// Parse the JSON headers/payload and build the run plan.
// Returns an error message, empty on success.
std::string make_load_plan(const Options &opt, LoadPlan &plan);
} // namespace rl
