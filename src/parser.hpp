#pragma once

#include "regex_node.hpp"

#include <string>

namespace grep {

// Recursive-descent parser. Never fails: malformed input degrades to the
// closest structural reading.
//   alternation := sequence ('|' sequence)*
//   sequence    := repeat*
//   repeat      := atom ('?' | '+' | '*')?
//   atom        := '(' alternation ')' | '[' '^'? class ']' | '\' escape
//                | '.' | '^' | '$' | literal
class Parser {
public:
    explicit Parser(const std::string& pattern);
    explicit Parser(std::u32string pattern);

    RegexNode parse();
    int group_count() const { return group_counter; }

private:
    std::u32string pattern;
    size_t pos = 0;
    int group_counter = 0;

    bool at_end() const { return pos >= pattern.size(); }
    char32_t peek() const { return pattern[pos]; }
    char32_t advance() { return pattern[pos++]; }
    bool expect(char32_t c);

    RegexNode parse_alternation();
    RegexNode parse_sequence();
    RegexNode parse_repeat();
    RegexNode parse_atom();
    RegexNode parse_escape();
    RegexNode parse_char_class();
};

RegexNode parse(const std::string& pattern);

}
