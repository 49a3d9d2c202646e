#pragma once
#include <ostream>

#include "backranq/tools/puzzler/options.hpp"

namespace backranq::tools::puzzler {

// Each command writes its report to 'out' and returns the process exit code.
// Failures are reported as exceptions.
int run_extract(const Options& o, std::ostream& out);
int run_list(const Options& o, std::ostream& out);
int run_next(const Options& o, std::ostream& out);
int run_facets(const Options& o, std::ostream& out);
int run_attempt(const Options& o, std::ostream& out);
int run_stats(const Options& o, std::ostream& out);
int run_user_stats(const Options& o, std::ostream& out);
int run_prefs(const Options& o, std::ostream& out);

int run_command(const Options& o, std::ostream& out);

// Whole program: parses argv, runs the command, and turns any failure into
// "Error: <what>" on 'err' with exit code 1. Usage errors still exit the process.
int run_main(int argc, char** argv, std::ostream& out, std::ostream& err);

}  // namespace backranq::tools::puzzler
