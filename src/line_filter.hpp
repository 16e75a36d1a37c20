#ifndef GREP_LINE_FILTER_HPP
#define GREP_LINE_FILTER_HPP

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

#include "options.hpp"
#include "pattern.hpp"

namespace grep {

struct FilterStats {
    std::size_t lines_read = 0;
    std::size_t lines_selected = 0;
};

// Tests every line of `in` against `pattern` and writes the selected lines
// (or their matched spans, or a count) to `out`, each prefixed with `prefix`.
FilterStats filter_lines(const CompiledPattern& pattern, const Options& options,
                         std::istream& in, std::ostream& out, const std::string& prefix);

} // namespace grep

#endif // GREP_LINE_FILTER_HPP
