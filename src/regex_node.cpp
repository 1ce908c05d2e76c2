#include "regex_node.hpp"
#include "utf8.hpp"

#include <utility>

namespace grep {

static RegexNode make_node(NodeType type)
{
    RegexNode node;
    node.type = type;
    return node;
}

RegexNode make_literal(char32_t c)
{
    RegexNode node = make_node(NodeType::Literal);
    node.ch = c;
    return node;
}

RegexNode make_dot() { return make_node(NodeType::Dot); }
RegexNode make_digit() { return make_node(NodeType::Digit); }
RegexNode make_word() { return make_node(NodeType::Word); }
RegexNode make_start_anchor() { return make_node(NodeType::StartAnchor); }
RegexNode make_end_anchor() { return make_node(NodeType::EndAnchor); }

RegexNode make_char_class(std::u32string members, bool negated)
{
    RegexNode node = make_node(NodeType::CharClass);
    node.members = std::move(members);
    node.negated = negated;
    return node;
}

RegexNode make_sequence(std::vector<RegexNode> items)
{
    RegexNode node = make_node(NodeType::Sequence);
    node.children = std::move(items);
    return node;
}

RegexNode make_alternation(std::vector<RegexNode> branches)
{
    RegexNode node = make_node(NodeType::Alternation);
    node.children = std::move(branches);
    return node;
}

RegexNode make_repeat(RegexNode inner, RepeatKind kind)
{
    RegexNode node = make_node(NodeType::Repeat);
    node.repeat = kind;
    node.children.push_back(std::move(inner));
    return node;
}

RegexNode make_group(int id, RegexNode inner)
{
    RegexNode node = make_node(NodeType::Group);
    node.id = id;
    node.children.push_back(std::move(inner));
    return node;
}

RegexNode make_backreference(int id)
{
    RegexNode node = make_node(NodeType::Backreference);
    node.id = id;
    return node;
}

bool has_backreference(const RegexNode& node)
{
    if(node.type == NodeType::Backreference) return true;
    for(const auto& child : node.children)
    {
        if(has_backreference(child)) return true;
    }
    return false;
}

static void describe_children(const RegexNode& node, std::string& out)
{
    for(const auto& child : node.children)
    {
        out += ' ';
        out += describe(child);
    }
}

std::string describe(const RegexNode& node)
{
    std::string out;
    switch(node.type)
    {
        case NodeType::Literal:
            out = "(lit " + encode_utf8(std::u32string(1, node.ch)) + ")";
            break;
        case NodeType::Dot: out = "dot"; break;
        case NodeType::Digit: out = "digit"; break;
        case NodeType::Word: out = "word"; break;
        case NodeType::StartAnchor: out = "start"; break;
        case NodeType::EndAnchor: out = "end"; break;
        case NodeType::CharClass:
            out = node.negated ? "(nclass " : "(class ";
            out += encode_utf8(node.members) + ")";
            break;
        case NodeType::Sequence:
            out = "(seq";
            describe_children(node, out);
            out += ")";
            break;
        case NodeType::Alternation:
            out = "(alt";
            describe_children(node, out);
            out += ")";
            break;
        case NodeType::Repeat: {
            const char* suffix = "?";
            if(node.repeat == RepeatKind::OneOrMore) suffix = "+";
            else if(node.repeat == RepeatKind::ZeroOrMore) suffix = "*";
            out = std::string("(repeat") + suffix + " " + describe(node.inner()) + ")";
            break;
        }
        case NodeType::Group:
            out = "(group " + std::to_string(node.id) + " " + describe(node.inner()) + ")";
            break;
        case NodeType::Backreference:
            out = "(backref " + std::to_string(node.id) + ")";
            break;
    }
    return out;
}

}
