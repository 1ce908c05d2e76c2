#include "parser.hpp"
#include "utf8.hpp"

#include <utility>

namespace grep {

static bool is_ascii_digit(char32_t c)
{
    return c >= U'0' && c <= U'9';
}

Parser::Parser(const std::string& pattern) : pattern(decode_utf8(pattern)) {}

Parser::Parser(std::u32string pattern) : pattern(std::move(pattern)) {}

bool Parser::expect(char32_t c)
{
    if(!at_end() && peek() == c)
    {
        pos++;
        return true;
    }
    return false;
}

RegexNode Parser::parse()
{
    return parse_alternation();
}

RegexNode Parser::parse_alternation()
{
    std::vector<RegexNode> branches;
    branches.push_back(parse_sequence());
    while(expect(U'|'))
    {
        branches.push_back(parse_sequence());
    }
    if(branches.size() == 1) return std::move(branches.front());
    return make_alternation(std::move(branches));
}

RegexNode Parser::parse_sequence()
{
    std::vector<RegexNode> items;
    while(!at_end() && peek() != U')' && peek() != U'|')
    {
        items.push_back(parse_repeat());
    }
    return make_sequence(std::move(items));
}

RegexNode Parser::parse_repeat()
{
    RegexNode atom = parse_atom();
    if(at_end()) return atom;

    switch(peek())
    {
        case U'?': pos++; return make_repeat(std::move(atom), RepeatKind::ZeroOrOne);
        case U'+': pos++; return make_repeat(std::move(atom), RepeatKind::OneOrMore);
        case U'*': pos++; return make_repeat(std::move(atom), RepeatKind::ZeroOrMore);
        default: return atom;
    }
}

RegexNode Parser::parse_atom()
{
    if(at_end()) return make_sequence({});

    char32_t c = advance();
    switch(c)
    {
        case U'(': {
            // numbered on open, so nested groups count outer to inner
            int id = ++group_counter;
            RegexNode inner = parse_alternation();
            expect(U')');
            return make_group(id, std::move(inner));
        }
        case U'[':
            return parse_char_class();
        case U'\\':
            return parse_escape();
        case U'.':
            return make_dot();
        case U'^':
            return make_start_anchor();
        case U'$':
            return make_end_anchor();
        default:
            return make_literal(c);
    }
}

// Called with the cursor just past the backslash.
RegexNode Parser::parse_escape()
{
    if(at_end()) return make_literal(U'\\');

    char32_t c = advance();
    if(c == U'd') return make_digit();
    if(c == U'w') return make_word();
    if(!is_ascii_digit(c)) return make_literal(c);

    // The whole digit run is consumed even when it names no group; an
    // out-of-range reference then stands for a single literal backslash.
    long long value = c - U'0';
    while(!at_end() && is_ascii_digit(peek()))
    {
        if(value <= group_counter) value = value * 10 + (advance() - U'0');
        else advance();
    }
    if(value == 0 || value > group_counter) return make_literal(U'\\');
    return make_backreference(static_cast<int>(value));
}

// Called with the cursor just past '['. Members are taken verbatim.
RegexNode Parser::parse_char_class()
{
    bool negated = expect(U'^');
    std::u32string members;
    while(!at_end() && peek() != U']')
    {
        members.push_back(advance());
    }
    expect(U']');
    return make_char_class(std::move(members), negated);
}

RegexNode parse(const std::string& pattern)
{
    Parser parser(pattern);
    return parser.parse();
}

}
