#ifndef GREP_MATCHER_HPP
#define GREP_MATCHER_HPP

#include <cstddef>
#include <string>

#include "pattern.hpp"

namespace grep {

// Half-open range [begin, end) of the input covered by a match
struct MatchSpan {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t length() const { return end - begin; }
};

// Check if a character satisfies a single element's test
bool matches_element(char c, const Element& element);

// Leftmost match of `pattern` in `input` starting at or after offset `from`.
// Returns false if there is none; otherwise fills `span`. Never throws.
// A start-anchored pattern can only match when `from` is 0.
bool search(const CompiledPattern& pattern, const std::string& input, MatchSpan& span,
            std::size_t from = 0);

// True iff some substring of `input` satisfies `pattern` under its anchors.
// Adjacent `+` elements over long runs can backtrack exponentially; no step
// cap is applied to either search() or attempt().
bool attempt(const CompiledPattern& pattern, const std::string& input);

} // namespace grep

#endif // GREP_MATCHER_HPP
