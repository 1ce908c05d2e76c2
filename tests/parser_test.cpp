#include <gtest/gtest.h>

#include "parser.hpp"

using namespace grep;

static std::string tree(const std::string& pattern)
{
    return describe(parse(pattern));
}

TEST(ParserTest, EmptyPatternIsEmptySequence) {
    RegexNode ast = parse("");
    EXPECT_EQ(ast.type, NodeType::Sequence);
    EXPECT_TRUE(ast.children.empty());
}

TEST(ParserTest, LiteralsAndMetaCharacters) {
    EXPECT_EQ(tree("a.b"), "(seq (lit a) dot (lit b))");
    EXPECT_EQ(tree("^ab$"), "(seq start (lit a) (lit b) end)");
    EXPECT_EQ(tree("\\d\\w"), "(seq digit word)");
}

TEST(ParserTest, Quantifiers) {
    EXPECT_EQ(tree("a?b+c*"), "(seq (repeat? (lit a)) (repeat+ (lit b)) (repeat* (lit c)))");
    // only one quantifier binds; the next one is a literal
    EXPECT_EQ(tree("a**"), "(seq (repeat* (lit a)) (lit *))");
    EXPECT_EQ(tree("+a"), "(seq (lit +) (lit a))");
}

TEST(ParserTest, AlternationCollapsesSingleBranch) {
    EXPECT_EQ(tree("abc"), "(seq (lit a) (lit b) (lit c))");
    EXPECT_EQ(tree("a|b"), "(alt (seq (lit a)) (seq (lit b)))");
    EXPECT_EQ(tree("a|"), "(alt (seq (lit a)) (seq))");
}

TEST(ParserTest, GroupsNumberedByOpeningParen) {
    EXPECT_EQ(tree("((a)(b))"),
              "(seq (group 1 (seq (group 2 (seq (lit a))) (group 3 (seq (lit b))))))");

    Parser parser("(x)(y(z))");
    parser.parse();
    EXPECT_EQ(parser.group_count(), 3);
}

TEST(ParserTest, GroupWithAlternationAndQuantifier) {
    EXPECT_EQ(tree("(cat|dog)+"), "(seq (repeat+ (group 1 (alt (seq (lit c) (lit a) (lit t)) (seq (lit d) (lit o) (lit g))))))");
}

TEST(ParserTest, MalformedGroupsAreTolerated) {
    EXPECT_EQ(tree("(ab"), "(seq (group 1 (seq (lit a) (lit b))))");
    EXPECT_EQ(tree("()"), "(seq (group 1 (seq)))");
    // a stray close paren ends the pattern
    EXPECT_EQ(tree("a)b"), "(seq (lit a))");
}

TEST(ParserTest, CharacterClasses) {
    EXPECT_EQ(tree("[abc]"), "(seq (class abc))");
    EXPECT_EQ(tree("[^xyz]"), "(seq (nclass xyz))");
    EXPECT_EQ(tree("[]"), "(seq (class ))");
    // no ranges or escapes inside a class
    EXPECT_EQ(tree("[a-z\\d]"), "(seq (class a-z\\d))");
    EXPECT_EQ(tree("[ab"), "(seq (class ab))");
}

TEST(ParserTest, BackreferenceToOpenedGroup) {
    EXPECT_EQ(tree("(a)\\1"), "(seq (group 1 (seq (lit a))) (backref 1))");

    RegexNode ast = parse("(a)(b)(c)(d)(e)(f)(g)(h)(i)(j)\\10");
    ASSERT_EQ(ast.children.size(), 11u);
    EXPECT_EQ(ast.children.back().type, NodeType::Backreference);
    EXPECT_EQ(ast.children.back().id, 10);
}

TEST(ParserTest, InvalidBackreferenceBecomesBackslash) {
    // the digit run is consumed and the whole escape is a literal backslash
    EXPECT_EQ(tree("\\1"), "(seq (lit \\))");
    EXPECT_EQ(tree("(a)\\2x"), "(seq (group 1 (seq (lit a))) (lit \\) (lit x))");
    EXPECT_EQ(tree("(a)\\0"), "(seq (group 1 (seq (lit a))) (lit \\))");
    EXPECT_EQ(tree("(a)\\123"), "(seq (group 1 (seq (lit a))) (lit \\))");
    // reference inside its own group is allowed once the group is open
    EXPECT_EQ(tree("(a\\1)"), "(seq (group 1 (seq (lit a) (backref 1))))");
}

TEST(ParserTest, OtherEscapesAreLiterals) {
    EXPECT_EQ(tree("\\.\\(\\\\"), "(seq (lit .) (lit () (lit \\))");
    EXPECT_EQ(tree("a\\"), "(seq (lit a) (lit \\))");
}

TEST(ParserTest, MultiByteCharactersAreSingleAtoms) {
    RegexNode ast = parse("\xC3\xA9+");
    ASSERT_EQ(ast.children.size(), 1u);
    const RegexNode& rep = ast.children[0];
    EXPECT_EQ(rep.type, NodeType::Repeat);
    EXPECT_EQ(rep.repeat, RepeatKind::OneOrMore);
    EXPECT_EQ(rep.inner().ch, U'é');
}

TEST(ParserTest, DetectsBackreferences) {
    EXPECT_TRUE(has_backreference(parse("(a)\\1")));
    EXPECT_TRUE(has_backreference(parse("x|((a)b\\2)+")));
    EXPECT_FALSE(has_backreference(parse("(a+)(b|c)*")));
    // an escape naming no group is a literal backslash
    EXPECT_FALSE(has_backreference(parse("a\\1")));
}
