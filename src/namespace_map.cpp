#include "namespace_map.h"
#include "errors.h"
#include "rule_grammar.h"
#include "term.h"

#include <fstream>
#include <sstream>

namespace rulegraph {

const std::string NamespaceMap::default_base_iri = "http://example.org/library/";

NamespaceMap::NamespaceMap() : NamespaceMap(default_base_iri) {}

NamespaceMap::NamespaceMap(const std::string& default_base) : base(default_base) {
    bindings["rdf"] = vocab::rdf;
    bindings["rdfs"] = vocab::rdfs;
    bindings["xsd"] = vocab::xsd;
    bindings["ex"] = base;
}

void NamespaceMap::bind(const std::string& prefix, const std::string& iri) {
    bindings[prefix] = iri;
}

bool NamespaceMap::contains(const std::string& prefix) const {
    return bindings.count(prefix) != 0;
}

std::string NamespaceMap::resolve(const std::string& compact) const {
    auto colon = compact.find(':');
    if (colon == std::string::npos) throw reference_error("not a prefixed name: " + compact);
    auto it = bindings.find(compact.substr(0, colon));
    if (it == bindings.end())
        throw reference_error("undeclared prefix '" + compact.substr(0, colon) + ":' in " + compact);
    return it->second + compact.substr(colon + 1);
}

void NamespaceMap::set_default_base(const std::string& iri) {
    auto ex = bindings.find("ex");
    if (ex != bindings.end() && ex->second == base) ex->second = iri;
    base = iri;
}

void NamespaceMap::load(const std::string& text) {
    tao::pegtl::string_input<> input(text, "namespaces");
    actions::parse_state state(*this);
    try {
        tao::pegtl::parse<grammar::config, actions::action>(input, state);
    } catch (const tao::pegtl::parse_error& e) {
        const auto p = e.positions().front();
        throw config_error("namespace configuration: syntax error at line " + std::to_string(p.line) +
                           ", column " + std::to_string(p.column));
    }
    *this = std::move(state.namespaces);
}

void NamespaceMap::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw config_error("could not read namespace file '" + path + "'");
    std::ostringstream text;
    text << file.rdbuf();
    load(text.str());
}

} // namespace rulegraph
