#pragma once

#include <string>
#include <vector>

namespace grep {

enum class NodeType {
    Literal,
    Dot,
    Digit,
    Word,
    CharClass,
    StartAnchor,
    EndAnchor,
    Sequence,
    Alternation,
    Repeat,
    Group,
    Backreference
};

enum class RepeatKind {
    ZeroOrOne,
    OneOrMore,
    ZeroOrMore
};

// One node of the parsed pattern. Which fields are meaningful depends on type:
//   Literal        ch
//   CharClass      members, negated
//   Sequence       children (in order)
//   Alternation    children (branches, left to right)
//   Repeat         children[0], repeat
//   Group          children[0], id
//   Backreference  id
struct RegexNode {
    NodeType type = NodeType::Sequence;
    char32_t ch = 0;
    std::u32string members;
    bool negated = false;
    RepeatKind repeat = RepeatKind::ZeroOrOne;
    int id = 0;
    std::vector<RegexNode> children;

    const RegexNode& inner() const { return children.front(); }
};

RegexNode make_literal(char32_t c);
RegexNode make_dot();
RegexNode make_digit();
RegexNode make_word();
RegexNode make_char_class(std::u32string members, bool negated);
RegexNode make_start_anchor();
RegexNode make_end_anchor();
RegexNode make_sequence(std::vector<RegexNode> items);
RegexNode make_alternation(std::vector<RegexNode> branches);
RegexNode make_repeat(RegexNode inner, RepeatKind kind);
RegexNode make_group(int id, RegexNode inner);
RegexNode make_backreference(int id);

bool has_backreference(const RegexNode& node);

// s-expression form, e.g. (seq (lit a) (repeat+ digit))
std::string describe(const RegexNode& node);

}
