#ifndef GREP_PATTERN_HPP
#define GREP_PATTERN_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace grep {

// Thrown by compile() when the pattern text contains a malformed construct.
class InvalidPattern : public std::runtime_error {
public:
    InvalidPattern(const std::string& construct, std::size_t position);

    const std::string& construct() const { return construct_; }
    std::size_t position() const { return position_; }

private:
    std::string construct_;
    std::size_t position_;
};

// Represents a single match element
struct Element {
    enum Type { LITERAL, DIGIT, WORD, CHAR_CLASS };
    enum Quantifier { EXACTLY_ONE, ONE_OR_MORE };

    Type type;
    std::string value;  // The literal character, or the members of a class
    bool negated;       // Only meaningful for CHAR_CLASS
    Quantifier quantifier;
    std::size_t position; // Offset of the construct in the pattern text

    Element(Type t, std::string v = "", bool neg = false, std::size_t pos = 0)
        : type(t), value(v), negated(neg), quantifier(EXACTLY_ONE), position(pos) {}
};

// Immutable once compiled; elements are consumed strictly in order.
struct CompiledPattern {
    std::string source;
    std::vector<Element> elements;
    bool anchored_start = false;
    bool anchored_end = false;
};

CompiledPattern compile(const std::string& pattern);

// Human readable form of an element, e.g. "[^abc]+" or "\d"
std::string describe(const Element& element);

} // namespace grep

#endif // GREP_PATTERN_HPP
