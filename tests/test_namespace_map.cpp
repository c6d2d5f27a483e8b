#include <gtest/gtest.h>

#include "errors.h"
#include "log.h"
#include "namespace_map.h"
#include "term.h"

using namespace rulegraph;

TEST(NamespaceMap, Defaults) {
    NamespaceMap ns;
    EXPECT_EQ(ns.default_base(), NamespaceMap::default_base_iri);
    EXPECT_EQ(ns.resolve("ex:Book"), NamespaceMap::default_base_iri + "Book");
    EXPECT_EQ(ns.resolve("rdf:type"), vocab::rdf_type);
    EXPECT_EQ(ns.expand_bare("wrote"), NamespaceMap::default_base_iri + "wrote");
    EXPECT_TRUE(ns.contains("xsd"));
}

TEST(NamespaceMap, UnboundPrefix) {
    NamespaceMap ns;
    EXPECT_THROW(ns.resolve("foaf:name"), reference_error);
    EXPECT_THROW(ns.resolve("plain"), reference_error);
}

TEST(NamespaceMap, LoadsConfiguration) {
    NamespaceMap ns;
    ns.load("# library deployment\n"
            "PREFIX foaf: <http://xmlns.com/foaf/0.1/>\n"
            "@prefix dc: <http://purl.org/dc/terms/> .\n"
            "DEFAULT <http://users.example.net/library/>\n");
    EXPECT_EQ(ns.resolve("foaf:name"), "http://xmlns.com/foaf/0.1/name");
    EXPECT_EQ(ns.resolve("dc:title"), "http://purl.org/dc/terms/title");
    EXPECT_EQ(ns.default_base(), "http://users.example.net/library/");
    EXPECT_EQ(ns.resolve("ex:Book"), "http://users.example.net/library/Book");
}

TEST(NamespaceMap, DefaultKeepsAnExplicitExBinding) {
    NamespaceMap ns;
    ns.bind("ex", "http://other.example/");
    ns.set_default_base("http://users.example.net/library/");
    EXPECT_EQ(ns.resolve("ex:Book"), "http://other.example/Book");
}

TEST(NamespaceMap, MalformedConfiguration) {
    NamespaceMap ns;
    EXPECT_THROW(ns.load("PREFIX foaf: http://xmlns.com/foaf/0.1/\n"), config_error);
    EXPECT_THROW(ns.load("BOGUS line\n"), config_error);
    EXPECT_THROW(ns.load_file("/nonexistent/namespaces.conf"), config_error);
    EXPECT_EQ(ns.default_base(), NamespaceMap::default_base_iri);
}

TEST(Log, Levels) {
    EXPECT_EQ(parse_log_level("debug"), log_level::debug);
    EXPECT_EQ(parse_log_level("off"), log_level::off);
    EXPECT_THROW(parse_log_level("loud"), config_error);

    auto previous = get_log_level();
    set_log_level(log_level::error);
    EXPECT_EQ(get_log_level(), log_level::error);
    log(log_level::info) << "discarded\n";
    set_log_level(previous);
}
