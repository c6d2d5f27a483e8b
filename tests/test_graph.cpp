#include <gtest/gtest.h>

#include "errors.h"
#include "graph.h"
#include "library_fixture.h"

using namespace rulegraph;
using namespace fixtures;

TEST(Graph, AddingATripleTwiceIsANoOp) {
    Graph once, twice;
    auto t = ex_triple("Book1", "hasAuthor", "Alice");
    EXPECT_TRUE(once.add(t));
    EXPECT_TRUE(twice.add(t));
    EXPECT_FALSE(twice.add(t));
    EXPECT_EQ(once, twice);
    EXPECT_EQ(twice.size(), 1u);
}

TEST(Graph, RejectsVariables) {
    Graph g;
    EXPECT_THROW(g.add({make_variable("x"), ex("hasAuthor"), ex("Alice")}), term_error);
    EXPECT_TRUE(g.empty());
}

TEST(Graph, AddAllCountsNewTriples) {
    Graph g = library_graph();
    Graph other{ex_triple("Book1", "hasAuthor", "Alice"), ex_triple("Book3", "hasAuthor", "Carol")};
    EXPECT_EQ(g.add_all(other), 1u);
    EXPECT_EQ(g.size(), 7u);
}

TEST(Graph, MatchUsesFixedPositionsOnly) {
    Graph g = library_graph();
    EXPECT_EQ(g.match({make_variable("s"), ex("hasAuthor"), ex("Alice")}).size(), 2u);
    EXPECT_EQ(g.match({ex("Book1"), make_variable("p"), make_variable("o")}).size(), 2u);
    EXPECT_EQ(g.match({make_variable("s"), make_variable("p"), make_variable("o")}).size(), 6u);
    EXPECT_TRUE(g.match({ex("Book3"), make_variable("p"), make_variable("o")}).empty());
}

TEST(Graph, Accessors) {
    Graph g = library_graph();
    EXPECT_EQ(g.subject_objects(ex("borrowedBy")).size(), 2u);
    EXPECT_EQ(g.subjects(ex("hasGenre"), ex("SciFi")), (std::vector<term_t>{ex("Book1"), ex("Book2")}));
    EXPECT_EQ(g.objects(ex("Book2"), ex("hasAuthor")), (std::vector<term_t>{ex("Alice")}));
}

TEST(Graph, SerializesOneStatementPerLine) {
    Graph g{
        {make_iri("http://s/2"), make_iri("http://p"), make_literal("two", "", "en")},
        {make_iri("http://s/1"), make_iri("http://p"), make_iri("http://o")},
    };
    EXPECT_EQ(g.serialize(),
              "<http://s/1> <http://p> <http://o> .\n"
              "<http://s/2> <http://p> \"two\"@en .\n");
}
