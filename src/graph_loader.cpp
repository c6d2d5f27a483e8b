#include "graph_loader.h"
#include "errors.h"
#include "log.h"
#include "rule_grammar.h"

#include <fstream>
#include <sstream>

namespace rulegraph {

Graph parse_graph(const std::string& text, const NamespaceMap& namespaces, const std::string& source) {
    tao::pegtl::string_input<> input(text, source);
    actions::parse_state state(namespaces);
    try {
        tao::pegtl::parse<grammar::document, actions::action>(input, state);
    } catch (const tao::pegtl::parse_error& e) {
        const auto p = e.positions().front();
        throw extraction_failed(source + ":" + std::to_string(p.line) + ":" + std::to_string(p.column) +
                                ": malformed triple");
    } catch (const error& e) {
        throw extraction_failed(source + ": " + e.what());
    }

    Graph graph;
    for (const auto& t : state.statements)
        graph.add(t);
    log(log_level::info) << "Loaded " << graph.size() << " triples from " << source << "\n";
    return graph;
}

Graph load_graph(const std::string& path, const NamespaceMap& namespaces) {
    std::ifstream file(path);
    if (!file) throw source_unavailable("could not read file '" + path + "'");
    std::ostringstream text;
    text << file.rdbuf();
    return parse_graph(text.str(), namespaces, path);
}

} // namespace rulegraph
