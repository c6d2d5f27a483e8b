#pragma once

#include "graph.h"
#include "namespace_map.h"
#include "term.h"

#include <string>

namespace fixtures {

using namespace rulegraph;

inline term_t ex(const std::string& local) {
    return make_iri(NamespaceMap::default_base_iri + local);
}

inline triple_t ex_triple(const std::string& s, const std::string& p, const std::string& o) {
    return {ex(s), ex(p), ex(o)};
}

inline term_t rdf_type() {
    return make_iri(vocab::rdf_type);
}

// Two books by Alice in the same genre, two loans borrowed by Bob.
inline Graph library_graph() {
    return Graph{
        ex_triple("Book1", "hasAuthor", "Alice"),
        ex_triple("Book2", "hasAuthor", "Alice"),
        ex_triple("Book1", "hasGenre", "SciFi"),
        ex_triple("Book2", "hasGenre", "SciFi"),
        ex_triple("Loan1", "borrowedBy", "Bob"),
        ex_triple("Loan2", "borrowedBy", "Bob"),
    };
}

inline std::size_t count_predicate(const Graph& graph, const term_t& predicate) {
    return graph.match({make_variable("s"), predicate, make_variable("o")}).size();
}

} // namespace fixtures
