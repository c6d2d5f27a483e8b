#pragma once

#include "namespace_map.h"
#include "term.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rulegraph {

enum class query_form { select, ask, construct, describe };

std::string to_string(query_form form);
// "select", "ask", "construct", "describe" in any case; throws query_evaluation_error otherwise
query_form parse_query_form(const std::string& name);

struct query_t {
    query_form form = query_form::select;
    bool distinct = false;
    bool all_variables = false;
    std::vector<std::string> variables;        // SELECT projection, without the leading '?'
    std::vector<term_t> describe_targets;      // recorded, not used to widen DESCRIBE
    std::vector<triple_template_t> templates;  // CONSTRUCT
    std::vector<triple_pattern_t> patterns;    // WHERE
    std::optional<std::size_t> limit;
};

// Throws query_syntax_error with the position of the offending input.
query_t parse_query(const std::string& text, const NamespaceMap& namespaces);

} // namespace rulegraph
