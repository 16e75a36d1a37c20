#include "line_filter.hpp"

#include "matcher.hpp"

using namespace std;

namespace grep {

namespace {

// Prints every non-empty, non-overlapping match in `line`, starting with `first`
void print_spans(const CompiledPattern& pattern, const string& line, MatchSpan first,
                 ostream& out, const string& prefix) {
    MatchSpan span = first;
    while (true) {
        if (span.length() > 0) {
            out << prefix << line.substr(span.begin, span.length()) << "\n";
        }
        size_t next = span.length() > 0 ? span.end : span.end + 1;
        if (!search(pattern, line, span, next)) {
            break;
        }
    }
}

} // namespace

FilterStats filter_lines(const CompiledPattern& pattern, const Options& options,
                         istream& in, ostream& out, const string& prefix) {
    FilterStats stats;
    string line;

    while (getline(in, line)) {
        stats.lines_read++;

        MatchSpan span;
        bool matched = search(pattern, line, span);
        if (matched == options.invert) {
            continue;
        }
        stats.lines_selected++;

        if (options.quiet) {
            // Exit status is all that is needed
            break;
        }
        if (options.count) {
            continue;
        }

        if (options.only_matching) {
            // Inverted selections have no span to print
            if (!options.invert) {
                print_spans(pattern, line, span, out, prefix);
            }
        } else {
            out << prefix << line << "\n";
        }
    }

    if (options.count && !options.quiet) {
        out << prefix << stats.lines_selected << "\n";
    }
    return stats;
}

} // namespace grep
