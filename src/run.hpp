#ifndef GREP_RUN_HPP
#define GREP_RUN_HPP

#include <istream>
#include <ostream>

#include "options.hpp"

namespace grep {

const int EXIT_MATCHED = 0;
const int EXIT_NO_MATCH = 1;
const int EXIT_TROUBLE = 2;

// Compiles the pattern once and filters every source named in `options`
// ("-" or no files at all reads `in`). Diagnostics go to `err`.
// Returns EXIT_MATCHED, EXIT_NO_MATCH, or EXIT_TROUBLE for an invalid
// pattern or a file that could not be opened.
int run(const Options& options, std::istream& in, std::ostream& out, std::ostream& err);

// Parses the command line, then run(). A usage error returns EXIT_TROUBLE.
int run_command_line(int argc, const char* const argv[],
                     std::istream& in, std::ostream& out, std::ostream& err);

} // namespace grep

#endif // GREP_RUN_HPP
