#include <gtest/gtest.h>

#include "errors.h"
#include "graph_loader.h"
#include "library_fixture.h"

#include <filesystem>
#include <fstream>

using namespace rulegraph;
using namespace fixtures;

namespace fs = std::filesystem;

class GraphLoader : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path.empty()) fs::remove(path);
    }

    std::string write_file(const std::string& content) {
        path = fs::temp_directory_path() / ("rulegraph_loader_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".nt");
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    NamespaceMap ns;
    fs::path path;
};

TEST_F(GraphLoader, ReadsStatements) {
    auto graph = parse_graph(
        "# library catalogue\n"
        "ex:Book1 ex:hasAuthor ex:Alice .\n"
        "ex:Book1 ex:hasGenre ex:SciFi . ex:Book2 ex:hasGenre ex:SciFi .\n"
        "\n"
        "Book2 hasAuthor Alice.\n",
        ns);
    EXPECT_EQ(graph.size(), 4u);
    EXPECT_TRUE(graph.contains(ex_triple("Book2", "hasAuthor", "Alice")));
    EXPECT_TRUE(graph.contains(ex_triple("Book2", "hasGenre", "SciFi")));
}

TEST_F(GraphLoader, PrefixesAndLiterals) {
    auto graph = parse_graph(
        "PREFIX dc: <http://purl.org/dc/terms/>\n"
        "ex:Book1 dc:title \"The Left Hand. Of Darkness\" .\n"
        "ex:Book1 a ex:Book .\n"
        "<http://example.org/library/Book1> ex:pages 304 .\n",
        ns);
    EXPECT_EQ(graph.size(), 3u);
    EXPECT_TRUE(graph.contains({ex("Book1"), make_iri("http://purl.org/dc/terms/title"),
                                make_literal("The Left Hand. Of Darkness")}));
    EXPECT_TRUE(graph.contains({ex("Book1"), rdf_type(), ex("Book")}));
    EXPECT_TRUE(graph.contains({ex("Book1"), ex("pages"), make_literal("304", vocab::xsd + "integer")}));
}

TEST_F(GraphLoader, PrefixesDoNotLeakIntoTheCallersMap) {
    parse_graph("PREFIX dc: <http://purl.org/dc/terms/>\n", ns);
    EXPECT_FALSE(ns.contains("dc"));
}

TEST_F(GraphLoader, DuplicatesCollapse) {
    auto graph = parse_graph("ex:a ex:p ex:b .\nex:a ex:p ex:b .\n", ns);
    EXPECT_EQ(graph.size(), 1u);
}

TEST_F(GraphLoader, EmptyDocument) {
    EXPECT_TRUE(parse_graph("", ns).empty());
    EXPECT_TRUE(parse_graph("# nothing here\n\n", ns).empty());
}

TEST_F(GraphLoader, MalformedContent) {
    EXPECT_THROW(parse_graph("ex:a ex:p ?x .\n", ns), extraction_failed);
    EXPECT_THROW(parse_graph("ex:a ex:p ex:b\n", ns), extraction_failed);
    EXPECT_THROW(parse_graph("ex:a ex:p .\n", ns), extraction_failed);
    EXPECT_THROW(parse_graph("ex:a foaf:knows ex:b .\n", ns), extraction_failed);
    EXPECT_THROW(parse_graph("ex:a ex:p ex:b => ex:c ex:p ex:d .\n", ns), extraction_failed);
}

TEST_F(GraphLoader, ErrorNamesTheSource) {
    try {
        parse_graph("ex:a ex:p ex:b\n", ns, "catalogue.nt");
        FAIL() << "expected extraction_failed";
    } catch (const extraction_failed& e) {
        EXPECT_EQ(std::string(e.what()).rfind("catalogue.nt", 0), 0u);
    }
}

TEST_F(GraphLoader, LoadsFiles) {
    auto file = write_file("ex:Loan1 ex:borrowedBy ex:Bob .\nex:Loan2 ex:borrowedBy ex:Bob .\n");
    auto graph = load_graph(file, ns);
    EXPECT_EQ(graph.size(), 2u);
    EXPECT_TRUE(graph.contains(ex_triple("Loan2", "borrowedBy", "Bob")));
}

TEST_F(GraphLoader, MissingFile) {
    EXPECT_THROW(load_graph("/nonexistent/catalogue.nt", ns), source_unavailable);
}
