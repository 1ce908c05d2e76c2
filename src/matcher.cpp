#include "matcher.hpp"
#include "parser.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <utility>

#include <utf8proc.h>

namespace grep {

static bool is_digit_char(char32_t c)
{
    return c >= U'0' && c <= U'9';
}

// Letters and numbers in any script, plus '_'.
static bool is_word_char(char32_t c)
{
    if(c < 0x80) return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || is_digit_char(c) || c == U'_';

    switch(utf8proc_category(static_cast<utf8proc_int32_t>(c)))
    {
        case UTF8PROC_CATEGORY_LU:
        case UTF8PROC_CATEGORY_LL:
        case UTF8PROC_CATEGORY_LT:
        case UTF8PROC_CATEGORY_LM:
        case UTF8PROC_CATEGORY_LO:
        case UTF8PROC_CATEGORY_ND:
        case UTF8PROC_CATEGORY_NL:
        case UTF8PROC_CATEGORY_NO:
            return true;
        default:
            return false;
    }
}

static MatchSet single(size_t pos, const Captures& captures)
{
    MatchSet res;
    res.insert({pos, captures});
    return res;
}

static bool match_char(const RegexNode& node, char32_t c)
{
    switch(node.type)
    {
        case NodeType::Literal: return c == node.ch;
        case NodeType::Dot: return true;
        case NodeType::Digit: return is_digit_char(c);
        case NodeType::Word: return is_word_char(c);
        case NodeType::CharClass: {
            bool contains = node.members.find(c) != std::u32string::npos;
            return contains != node.negated;
        }
        default: return false;
    }
}

static MatchSet match_sequence(const RegexNode& node, const std::u32string& input, size_t pos, const Captures& captures, bool record)
{
    MatchSet frontier = single(pos, captures);

    for(const auto& item : node.children)
    {
        MatchSet next;
        for(const auto& state : frontier)
        {
            MatchSet step = match_node(item, input, state.first, state.second, record);
            next.insert(step.begin(), step.end());
        }
        if(next.empty()) return {};
        frontier.swap(next);
    }
    return frontier;
}

static MatchSet match_alternation(const RegexNode& node, const std::u32string& input, size_t pos, const Captures& captures, bool record)
{
    MatchSet res;
    for(const auto& branch : node.children)
    {
        MatchSet step = match_node(branch, input, pos, captures, record);
        res.insert(step.begin(), step.end());
    }
    return res;
}

static MatchSet match_repeat(const RegexNode& node, const std::u32string& input, size_t pos, const Captures& captures, bool record)
{
    const RegexNode& inner = node.inner();
    MatchSet res;

    if(node.repeat == RepeatKind::ZeroOrOne)
    {
        res.insert({pos, captures});
        MatchSet once = match_node(inner, input, pos, captures, record);
        res.insert(once.begin(), once.end());
        return res;
    }

    if(node.repeat == RepeatKind::ZeroOrMore) res.insert({pos, captures});

    // Expand until no new state appears. A state already in res has been
    // expanded before, so zero-width iterations stop here.
    MatchSet frontier = match_node(inner, input, pos, captures, record);
    while(!frontier.empty())
    {
        MatchSet next;
        for(const auto& state : frontier)
        {
            if(!res.insert(state).second) continue;
            MatchSet more = match_node(inner, input, state.first, state.second, record);
            next.insert(more.begin(), more.end());
        }
        frontier.swap(next);
    }
    return res;
}

static MatchSet match_group(const RegexNode& node, const std::u32string& input, size_t pos, const Captures& captures, bool record)
{
    MatchSet res;
    for(const auto& state : match_node(node.inner(), input, pos, captures, record))
    {
        if(!record)
        {
            res.insert(state);
            continue;
        }
        Captures updated = state.second;
        updated[node.id] = {pos, state.first};
        res.insert({state.first, std::move(updated)});
    }
    return res;
}

static MatchSet match_backreference(const RegexNode& node, const std::u32string& input, size_t pos, const Captures& captures)
{
    auto it = captures.find(node.id);
    if(it == captures.end()) return {};

    const Span& span = it->second;
    size_t len = span.second - span.first;
    if(pos > input.size() || input.size() - pos < len) return {};
    if(!std::equal(input.begin() + span.first, input.begin() + span.second, input.begin() + pos)) return {};

    return single(pos + len, captures);
}

MatchSet match_node(const RegexNode& node, const std::u32string& input, size_t pos, const Captures& captures, bool record)
{
    switch(node.type)
    {
        case NodeType::Literal:
        case NodeType::Dot:
        case NodeType::Digit:
        case NodeType::Word:
        case NodeType::CharClass:
            if(pos < input.size() && match_char(node, input[pos])) return single(pos + 1, captures);
            return {};
        case NodeType::StartAnchor:
            if(pos == 0) return single(pos, captures);
            return {};
        case NodeType::EndAnchor:
            if(pos == input.size()) return single(pos, captures);
            return {};
        case NodeType::Sequence:
            return match_sequence(node, input, pos, captures, record);
        case NodeType::Alternation:
            return match_alternation(node, input, pos, captures, record);
        case NodeType::Repeat:
            return match_repeat(node, input, pos, captures, record);
        case NodeType::Group:
            return match_group(node, input, pos, captures, record);
        case NodeType::Backreference:
            return match_backreference(node, input, pos, captures);
    }
    return {};
}

std::set<size_t> end_positions(const MatchSet& results)
{
    std::set<size_t> ends;
    for(const auto& state : results) ends.insert(state.first);
    return ends;
}

bool match_at_any(const RegexNode& ast, const std::u32string& input, bool record_captures)
{
    for(size_t start = 0; start <= input.size(); ++start)
    {
        if(!match_node(ast, input, start, Captures{}, record_captures).empty()) return true;
    }
    return false;
}

bool match_pattern(const std::string& input_line, const std::string& pattern)
{
    RegexNode ast = parse(pattern);
    return match_at_any(ast, decode_utf8(input_line), has_backreference(ast));
}

CompiledPattern::CompiledPattern(RegexNode root, int groups)
    : root(std::move(root)), groups(groups), needs_captures(has_backreference(this->root)) {}

CompiledPattern CompiledPattern::compile(const std::string& pattern)
{
    Parser parser(pattern);
    RegexNode ast = parser.parse();
    return CompiledPattern(std::move(ast), parser.group_count());
}

bool CompiledPattern::test(const std::string& line) const
{
    return test(decode_utf8(line));
}

bool CompiledPattern::test(const std::u32string& line) const
{
    return match_at_any(root, line, needs_captures);
}

}
