#include "options.hpp"

using namespace std;

namespace grep {

Options parse_options(int argc, const char* const argv[]) {
    Options options;
    bool have_pattern = false;
    bool end_of_flags = false;

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];

        if (end_of_flags || arg.empty() || arg[0] != '-' || arg == "-") {
            options.files.push_back(arg);
        } else if (arg == "--") {
            end_of_flags = true;
        } else if (arg == "-E") {
            if (i + 1 >= argc) {
                throw UsageError("Expected a pattern after '-E'");
            }
            if (have_pattern) {
                throw UsageError("Expected a single '-E' pattern");
            }
            options.pattern = argv[++i];
            have_pattern = true;
        } else if (arg == "-o") {
            options.only_matching = true;
        } else if (arg == "-c") {
            options.count = true;
        } else if (arg == "-v") {
            options.invert = true;
        } else if (arg == "-q") {
            options.quiet = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            throw UsageError("Unknown option '" + arg + "'");
        }
    }

    if (!have_pattern) {
        throw UsageError("Expected '-E' followed by a pattern");
    }
    return options;
}

string usage(const string& program) {
    return "Usage: " + program + " -E <pattern> [-o] [-c] [-v] [-q] [--verbose] [file...]";
}

} // namespace grep
