#pragma once

#include "graph.h"
#include "namespace_map.h"
#include "query_parser.h"
#include "term.h"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rulegraph {

// variable name (without '?') -> bound term
using binding_t = std::map<std::string, term_t>;

// rendering of a SELECT variable with no binding in a row
extern const std::string not_applicable;

struct select_result_t {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
};

using query_result_t = std::variant<select_result_t, bool, Graph>;

// Joins the patterns left to right starting from a single empty binding.
// Every returned row binds every variable of the pattern list; zero patterns
// give one empty row.
std::vector<binding_t> evaluate(const Graph& graph, const std::vector<triple_pattern_t>& patterns);

// nullopt when a variable of the template is unbound
std::optional<triple_t> instantiate(const triple_template_t& pattern, const binding_t& binding);

select_result_t project_select(const std::vector<std::string>& variables, const std::vector<binding_t>& rows);
bool project_ask(const std::vector<binding_t>& rows);
Graph project_construct(const std::vector<triple_template_t>& templates, const std::vector<binding_t>& rows);
// the triples that satisfied the pattern list
Graph project_describe(const std::vector<triple_pattern_t>& patterns, const std::vector<binding_t>& rows);

query_result_t execute(const Graph& graph, const query_t& query);

// Throws query_syntax_error, or query_evaluation_error when the text holds another form.
query_result_t run_query(const Graph& graph, const std::string& text, query_form form,
                         const NamespaceMap& namespaces);
query_result_t run_query(const Graph& graph, const std::string& text, const NamespaceMap& namespaces);

} // namespace rulegraph
