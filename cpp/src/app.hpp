#pragma once

#include "opts.hpp"

#include <iosfwd>
#include <string>
#include <vector>

// records of every input, "-" standing for in; a trailing separator
// does not start an empty record
std::vector<std::string> read_records(const app_options& opts, std::istream& in);

// sorts or checks the records and reports errors on err; returns the exit
// status: 0 success, 1 i/o error, 2 unorderable or unsorted input
int run(const app_options& opts, std::istream& in, std::ostream& out, std::ostream& err);
