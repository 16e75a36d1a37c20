#include "matcher.hpp"

using namespace std;

namespace grep {

namespace {

const size_t NO_MATCH = string::npos;

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_ascii_word(char c) {
    return is_ascii_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

size_t match_from(const CompiledPattern& pattern, const string& input, size_t pos, size_t elem_idx);

// Length of the run of characters starting at `pos` that pass the element's test
size_t count_run(const string& input, size_t pos, const Element& element) {
    size_t count = 0;
    while (pos + count < input.length() && matches_element(input[pos + count], element)) {
        count++;
    }
    return count;
}

// Tries the rest of the pattern after consuming `count` repetitions of the
// element at `elem_idx`, then one fewer, down to a single repetition.
size_t match_repetitions(const CompiledPattern& pattern, const string& input, size_t pos, size_t elem_idx, size_t count) {
    for (; count >= 1; count--) {
        size_t end = match_from(pattern, input, pos + count, elem_idx + 1);
        if (end != NO_MATCH) {
            return end;
        }
    }
    return NO_MATCH;
}

// Matches elements [elem_idx, end) starting at input position `pos`.
// Returns the input position after the match, or NO_MATCH.
size_t match_from(const CompiledPattern& pattern, const string& input, size_t pos, size_t elem_idx) {
    if (elem_idx >= pattern.elements.size()) {
        if (pattern.anchored_end && pos != input.length()) {
            return NO_MATCH;
        }
        return pos;
    }

    if (pos >= input.length()) {
        return NO_MATCH;
    }

    const Element& current = pattern.elements[elem_idx];

    if (current.quantifier == Element::ONE_OR_MORE) {
        // Greedy: take the longest run first, give back one at a time
        size_t max_count = count_run(input, pos, current);
        if (max_count == 0) {
            return NO_MATCH;
        }
        return match_repetitions(pattern, input, pos, elem_idx, max_count);
    }

    if (!matches_element(input[pos], current)) {
        return NO_MATCH;
    }
    return match_from(pattern, input, pos + 1, elem_idx + 1);
}

} // namespace

bool matches_element(char c, const Element& element) {
    switch (element.type) {
        case Element::LITERAL:
            return c == element.value[0];

        case Element::DIGIT:
            return is_ascii_digit(c);

        case Element::WORD:
            return is_ascii_word(c);

        case Element::CHAR_CLASS: {
            bool member = element.value.find(c) != string::npos;
            return element.negated ? !member : member;
        }
    }
    return false;
}

bool search(const CompiledPattern& pattern, const string& input, MatchSpan& span, size_t from) {
    if (from > input.length() || (pattern.anchored_start && from != 0)) {
        return false;
    }

    // Only offset 0 when anchored to start; otherwise every offset up to and
    // including the end, so that anchor-only patterns can match empty input
    size_t last_start = pattern.anchored_start ? 0 : input.length();

    for (size_t start = from; start <= last_start; ++start) {
        size_t end = match_from(pattern, input, start, 0);
        if (end != NO_MATCH) {
            span.begin = start;
            span.end = end;
            return true;
        }
    }

    return false;
}

bool attempt(const CompiledPattern& pattern, const string& input) {
    MatchSpan span;
    return search(pattern, input, span);
}

} // namespace grep
