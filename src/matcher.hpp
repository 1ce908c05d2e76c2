#pragma once

#include "regex_node.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>

namespace grep {

// Half-open character span [first, second) a group last matched.
using Span = std::pair<size_t, size_t>;
using Captures = std::map<int, Span>;

// Every way a node can match from one position: end offset plus the
// captures recorded along that path.
using MatchSet = std::set<std::pair<size_t, Captures>>;

// With record_captures off, groups add no spans and results collapse to
// plain end positions. Only patterns with a backreference need them.
MatchSet match_node(const RegexNode& node, const std::u32string& input, size_t pos, const Captures& captures,
                    bool record_captures = true);

std::set<size_t> end_positions(const MatchSet& results);

// Tries every start offset 0..=length with fresh captures.
bool match_at_any(const RegexNode& ast, const std::u32string& input, bool record_captures = true);

// Parses the pattern on every call.
bool match_pattern(const std::string& input_line, const std::string& pattern);

// A pattern parsed once and tested against many lines.
class CompiledPattern {
public:
    static CompiledPattern compile(const std::string& pattern);

    bool test(const std::string& line) const;
    bool test(const std::u32string& line) const;

    const RegexNode& ast() const { return root; }
    int group_count() const { return groups; }

private:
    CompiledPattern(RegexNode root, int groups);

    RegexNode root;
    int groups = 0;
    bool needs_captures = true;
};

}
