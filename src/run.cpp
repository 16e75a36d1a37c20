#include "run.hpp"

#include <fstream>
#include <string>

#include "line_filter.hpp"
#include "pattern.hpp"

using namespace std;

namespace grep {

namespace {

const char* const PROGRAM = "grep";

void log_error(ostream& err, const string& message) {
    err << PROGRAM << ": " << message << endl;
}

void log_info(ostream& err, const Options& options, const string& message) {
    if (options.verbose) {
        err << PROGRAM << ": " << message << endl;
    }
}

string describe_pattern(const CompiledPattern& compiled) {
    string text = to_string(compiled.elements.size()) + " element(s):";
    for (const Element& element : compiled.elements) {
        text += " " + describe(element);
    }
    if (compiled.anchored_start) {
        text += " [anchored at start]";
    }
    if (compiled.anchored_end) {
        text += " [anchored at end]";
    }
    return text;
}

string describe_stats(const string& source, const FilterStats& stats) {
    return source + ": " + to_string(stats.lines_read) + " line(s) read, " +
           to_string(stats.lines_selected) + " selected";
}

} // namespace

int run(const Options& options, istream& in, ostream& out, ostream& err) {
    // Compile once, before reading any input
    CompiledPattern compiled;
    try {
        compiled = compile(options.pattern);
    } catch (const InvalidPattern& e) {
        log_error(err, string("invalid pattern: ") + e.what());
        return EXIT_TROUBLE;
    }
    log_info(err, options, "compiled '" + options.pattern + "' to " + describe_pattern(compiled));

    bool found_match = false;
    bool had_trouble = false;

    if (options.files.empty()) {
        FilterStats stats = filter_lines(compiled, options, in, out, "");
        log_info(err, options, describe_stats("(standard input)", stats));
        found_match = stats.lines_selected > 0;
    } else {
        bool multiple_files = options.files.size() > 1;

        for (const string& filename : options.files) {
            string prefix = multiple_files ? filename + ":" : "";
            FilterStats stats;

            if (filename == "-") {
                stats = filter_lines(compiled, options, in, out, prefix);
            } else {
                ifstream file(filename);
                if (!file.is_open()) {
                    log_error(err, "Could not open file: " + filename);
                    had_trouble = true;
                    continue;
                }
                stats = filter_lines(compiled, options, file, out, prefix);
            }

            log_info(err, options, describe_stats(filename, stats));
            if (stats.lines_selected > 0) {
                found_match = true;
                if (options.quiet) {
                    break;
                }
            }
        }
    }

    if (had_trouble && !(options.quiet && found_match)) {
        return EXIT_TROUBLE;
    }
    return found_match ? EXIT_MATCHED : EXIT_NO_MATCH;
}

int run_command_line(int argc, const char* const argv[], istream& in, ostream& out, ostream& err) {
    Options options;
    try {
        options = parse_options(argc, argv);
    } catch (const UsageError& e) {
        log_error(err, e.what());
        err << usage(PROGRAM) << endl;
        return EXIT_TROUBLE;
    }
    return run(options, in, out, err);
}

} // namespace grep
