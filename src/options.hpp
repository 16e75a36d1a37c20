#ifndef GREP_OPTIONS_HPP
#define GREP_OPTIONS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace grep {

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// Everything the command line can configure
struct Options {
    std::string pattern;
    bool only_matching = false; // -o
    bool count = false;         // -c
    bool invert = false;        // -v
    bool quiet = false;         // -q
    bool verbose = false;       // --verbose
    std::vector<std::string> files;
};

// Throws UsageError on an unknown flag or a missing pattern.
Options parse_options(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace grep

#endif // GREP_OPTIONS_HPP
