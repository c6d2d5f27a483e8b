#pragma once

#include "graph.h"
#include "namespace_map.h"
#include "term.h"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace rulegraph {

namespace modes {
    struct no_rules {};
    struct basic_rules {};
    struct advanced_rules {};
    // free-text IF ... THEN ... lines
    struct custom_rules { std::string text; };
    // one "antecedent => consequent" rule per line
    struct declarative_rules { std::string text; };
}

using rule_mode = std::variant<modes::no_rules, modes::basic_rules, modes::advanced_rules,
                               modes::custom_rules, modes::declarative_rules>;

std::string mode_name(const rule_mode& mode);
// "none", "basic", "advanced", "custom", "declarative"; throws config_error otherwise
rule_mode make_rule_mode(const std::string& name, const std::string& text = {});

enum class recommendation_strategy { preferences, borrowing };

struct engine_options {
    recommendation_strategy recommend = recommendation_strategy::preferences;
    // also derive (book, writtenBy, author) during author inversion
    bool emit_written_by = false;
};

struct rule_diagnostic_t {
    std::size_t line;
    std::string rule;
    std::string message;
};

struct rule_report_t {
    Graph graph;
    std::size_t derived = 0;
    std::vector<rule_diagnostic_t> skipped;
};

class RuleEngine {
public:
    explicit RuleEngine(NamespaceMap namespaces = NamespaceMap(), engine_options options = {});

    // Extends a copy of the graph; the input is never modified.
    // Throws rule_syntax_error for a malformed custom rule line.
    rule_report_t apply(const Graph& graph, const rule_mode& mode) const;
    rule_report_t apply(const Graph& graph, const std::vector<rule_mode>& mode_list) const;

    void apply_basic(Graph& graph) const;
    void apply_advanced(Graph& graph) const;
    // all lines are checked before any triple is added
    void apply_custom(Graph& graph, const std::string& text) const;
    // failing rules are skipped and returned
    std::vector<rule_diagnostic_t> apply_declarative(Graph& graph, const std::string& text) const;

private:
    // library vocabulary, all in the default namespace except rdf:type
    struct vocabulary_t {
        term_t type;
        term_t book, loan, frequent_borrower;
        term_t has_author, has_genre, borrowed_by, prefers_genre;
        term_t wrote, written_by, related_to, has_expertise, recommended_for;
    };

    std::size_t invert_authors(Graph& graph) const;
    std::size_t relate_genres(Graph& graph) const;
    std::size_t classify_borrowers(Graph& graph) const;
    std::size_t derive_expertise(Graph& graph) const;
    std::size_t recommend_by_preference(Graph& graph) const;
    std::size_t recommend_by_borrowing(Graph& graph) const;

    NamespaceMap ns;
    engine_options opts;
    vocabulary_t words;
};

} // namespace rulegraph
