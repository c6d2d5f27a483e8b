#pragma once

#include "namespace_map.h"
#include "term.h"

#include <string>

namespace rulegraph {

// Converts one token of rule, query or graph text into a term:
//   ?x $x          variable
//   <iri>          IRI
//   p:local        IRI through the namespace map (reference_error when p is unbound)
//   scheme://...   IRI taken verbatim, as are urn: and mailto:
//   "lex"@en "lex"^^<dt> "lex"^^p:dt
//   42 4.2         xsd:integer / xsd:decimal literal
//   _:id           blank node
//   a              rdf:type
//   anything else  IRI in the default namespace
// Malformed tokens raise term_error.
term_t read_term(const std::string& token, const NamespaceMap& namespaces);

} // namespace rulegraph
