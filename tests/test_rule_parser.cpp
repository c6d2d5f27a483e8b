#include <gtest/gtest.h>

#include "errors.h"
#include "library_fixture.h"
#include "rule_parser.h"

using namespace rulegraph;
using namespace fixtures;

class RuleParser : public ::testing::Test {
protected:
    NamespaceMap ns;
};

TEST_F(RuleParser, SingleClauseEachSide) {
    auto rule = parse_rule("?x ex:hasAuthor ?y => ?y ex:wrote ?x", ns);
    ASSERT_EQ(rule.antecedent.size(), 1u);
    ASSERT_EQ(rule.consequent.size(), 1u);
    EXPECT_EQ(rule.antecedent[0], (triple_pattern_t{make_variable("x"), ex("hasAuthor"), make_variable("y")}));
    EXPECT_EQ(rule.consequent[0], (triple_template_t{make_variable("y"), ex("wrote"), make_variable("x")}));
}

TEST_F(RuleParser, SeveralClausesAndTrailingDots) {
    auto rule = parse_rule("?b hasAuthor ?a . ?b hasGenre ?g . => ?a hasExpertise ?g . ?g a Genre .", ns);
    EXPECT_EQ(rule.antecedent.size(), 2u);
    ASSERT_EQ(rule.consequent.size(), 2u);
    EXPECT_EQ(rule.antecedent[1].predicate, ex("hasGenre"));
    EXPECT_EQ(rule.consequent[1], (triple_template_t{make_variable("g"), rdf_type(), ex("Genre")}));
}

TEST_F(RuleParser, TokensKeepDotsAndSpacesThatBelongToThem) {
    auto rule = parse_rule("?b <http://schema.org/author> ?a => ?a http://x.org/v1.2#wrote \"a book\"@en", ns);
    EXPECT_EQ(rule.antecedent[0].predicate, make_iri("http://schema.org/author"));
    EXPECT_EQ(rule.consequent[0].predicate, make_iri("http://x.org/v1.2#wrote"));
    EXPECT_EQ(rule.consequent[0].object, make_literal("a book", "", "en"));
}

TEST_F(RuleParser, DotDirectlyAfterVariableSeparatesClauses) {
    auto rule = parse_rule("?x ex:p ?y.?y ex:q ?z => ?x ex:r ?z", ns);
    ASSERT_EQ(rule.antecedent.size(), 2u);
    EXPECT_EQ(rule.antecedent[0], (triple_pattern_t{make_variable("x"), ex("p"), make_variable("y")}));
    EXPECT_EQ(rule.antecedent[1], (triple_pattern_t{make_variable("y"), ex("q"), make_variable("z")}));
    ASSERT_EQ(rule.consequent.size(), 1u);

    auto dollar = parse_rule("$a ex:p $b.$b ex:q ex:C. => $a ex:r ex:C.", ns);
    EXPECT_EQ(dollar.antecedent.size(), 2u);
    EXPECT_EQ(dollar.consequent.size(), 1u);
}

TEST_F(RuleParser, EmptySidesArePermitted) {
    auto fact = parse_rule("=> ex:Library ex:opens ex:Monday", ns);
    EXPECT_TRUE(fact.antecedent.empty());
    EXPECT_EQ(fact.consequent.size(), 1u);

    auto nothing = parse_rule("?x ex:hasAuthor ?y =>", ns);
    EXPECT_EQ(nothing.antecedent.size(), 1u);
    EXPECT_TRUE(nothing.consequent.empty());
}

TEST_F(RuleParser, ArrowMustAppearExactlyOnce) {
    EXPECT_THROW(parse_rule("?x ex:hasAuthor ?y", ns), rule_syntax_error);
    EXPECT_THROW(parse_rule("?x ex:hasAuthor ?y => ?y ex:wrote ?x => ?x ex:a ?y", ns), rule_syntax_error);
}

TEST_F(RuleParser, ClausesNeedThreeTerms) {
    EXPECT_THROW(parse_rule("?x ex:hasAuthor => ?y ex:wrote ?x", ns), rule_syntax_error);
    EXPECT_THROW(parse_rule("?x ex:hasAuthor ?y ?z => ?y ex:wrote ?x", ns), rule_syntax_error);
    EXPECT_THROW(parse_rule("?x ex:hasAuthor ?y ?y ex:wrote ?x", ns), rule_syntax_error);
}

TEST_F(RuleParser, MalformedTokens) {
    EXPECT_THROW(parse_rule("?x foaf:knows ?y => ?y foaf:knows ?x", ns), rule_syntax_error);
    EXPECT_THROW(parse_rule("? ex:hasAuthor ?y => ?y ex:wrote ?x", ns), rule_syntax_error);
    EXPECT_THROW(parse_rule("?x ex:title \"open => ?x ex:a ex:Book", ns), rule_syntax_error);
}
