#include "pattern.hpp"

using namespace std;

namespace grep {

InvalidPattern::InvalidPattern(const string& construct, size_t position)
    : runtime_error(construct + " at position " + to_string(position)),
      construct_(construct), position_(position) {}

namespace {

// Parses the body of a character group. `open` is the index of '['; on
// success returns the index of the closing ']'.
size_t parse_char_class(const string& pattern, size_t open, size_t end, Element& out) {
    size_t first = open + 1;
    bool negated = first < end && pattern[first] == '^';
    if (negated) {
        first++;
    }

    size_t close = first;
    while (close < end && pattern[close] != ']') {
        close++;
    }
    if (close >= end) {
        throw InvalidPattern("unterminated character group '" + pattern.substr(open, end - open) + "'", open);
    }

    string members = pattern.substr(first, close - first);
    if (members.empty()) {
        throw InvalidPattern("empty character group '" + pattern.substr(open, close - open + 1) + "'", open);
    }

    out = Element(Element::CHAR_CLASS, members, negated, open);
    return close;
}

} // namespace

CompiledPattern compile(const string& pattern) {
    CompiledPattern compiled;
    compiled.source = pattern;

    // Anchors are only recognized at the very ends of the text
    size_t begin = 0;
    size_t end = pattern.length();
    if (begin < end && pattern[begin] == '^') {
        compiled.anchored_start = true;
        begin++;
    }
    if (begin < end && pattern[end - 1] == '$') {
        compiled.anchored_end = true;
        end--;
    }

    for (size_t i = begin; i < end; i++) {
        Element element(Element::LITERAL, string(1, pattern[i]), false, i);

        if (pattern[i] == '+') {
            // A '+' that follows an element is consumed below
            throw InvalidPattern("quantifier '+' with no preceding element", i);
        } else if (pattern[i] == '\\') {
            if (i + 1 >= pattern.length()) {
                throw InvalidPattern("unterminated escape sequence '\\'", i);
            }
            char next = pattern[i + 1];
            if (next == 'd') {
                element = Element(Element::DIGIT, "", false, i);
            } else if (next == 'w') {
                element = Element(Element::WORD, "", false, i);
            } else {
                throw InvalidPattern(string("unrecognized escape sequence '\\") + next + "'", i);
            }
            i++; // Skip the class letter
        } else if (pattern[i] == '[') {
            i = parse_char_class(pattern, i, end, element);
        }

        if (i + 1 < end && pattern[i + 1] == '+') {
            element.quantifier = Element::ONE_OR_MORE;
            i++;
        }

        compiled.elements.push_back(element);
    }

    return compiled;
}

string describe(const Element& element) {
    string text;
    switch (element.type) {
        case Element::LITERAL:
            text = element.value;
            break;
        case Element::DIGIT:
            text = "\\d";
            break;
        case Element::WORD:
            text = "\\w";
            break;
        case Element::CHAR_CLASS:
            text = (element.negated ? "[^" : "[") + element.value + "]";
            break;
    }
    if (element.quantifier == Element::ONE_OR_MORE) {
        text += "+";
    }
    return text;
}

} // namespace grep
