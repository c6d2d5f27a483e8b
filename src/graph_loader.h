#pragma once

#include "graph.h"
#include "namespace_map.h"

#include <string>

namespace rulegraph {

// Reads '.'-terminated triples written with the rule token syntax, plus
// optional "PREFIX p: <iri>" lines. Stands in for the document extraction
// step: malformed content raises extraction_failed.
Graph parse_graph(const std::string& text, const NamespaceMap& namespaces, const std::string& source = "graph");

// source_unavailable when the file cannot be read
Graph load_graph(const std::string& path, const NamespaceMap& namespaces);

} // namespace rulegraph
