#pragma once

#include "namespace_map.h"
#include "term.h"

#include <string>
#include <vector>

namespace rulegraph {

struct rule_t {
    std::vector<triple_pattern_t> antecedent;
    std::vector<triple_template_t> consequent;
};

// Parses one declarative rule line: "s p o . s p o => s p o . s p o".
// Either side may be empty. Throws rule_syntax_error.
rule_t parse_rule(const std::string& text, const NamespaceMap& namespaces);

} // namespace rulegraph
