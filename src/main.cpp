// main.cpp
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <boost/program_options.hpp>

#include "errors.h"
#include "graph.h"
#include "graph_loader.h"
#include "log.h"
#include "namespace_map.h"
#include "query_engine.h"
#include "rule_engine.h"

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw rulegraph::source_unavailable("could not read file '" + path + "'");
    std::ostringstream text;
    text << file.rdbuf();
    return text.str();
}

void print_result(const rulegraph::query_result_t& result) {
    if (auto select = std::get_if<rulegraph::select_result_t>(&result)) {
        for (std::size_t i = 0; i < select->headers.size(); ++i)
            std::cout << (i ? "\t" : "") << select->headers[i];
        std::cout << "\n";
        for (const auto& row : select->rows) {
            for (std::size_t i = 0; i < row.size(); ++i)
                std::cout << (i ? "\t" : "") << row[i];
            std::cout << "\n";
        }
    } else if (auto ask = std::get_if<bool>(&result)) {
        std::cout << (*ask ? "true" : "false") << "\n";
    } else {
        std::cout << std::get<rulegraph::Graph>(result);
    }
}

}

int main(int argc, const char* argv[]) {
    std::string graphFile, query, queryFile, form, rules, rulesFile, cwmRulesFile;
    std::string namespacesFile, defaultNamespace, recommend, logLevel;
    bool writtenBy = false, printGraph = false, verbose = false;

    namespace po = boost::program_options;
    po::options_description desc("options");
    desc.add_options()
        ("help,h", "produce this help message")
        ("graph,g", po::value<std::string>(&graphFile), "triples file (s p o . per statement)")
        ("query,q", po::value<std::string>(&query), "query text")
        ("query-file", po::value<std::string>(&queryFile), "file holding the query text")
        ("form,f", po::value<std::string>(&form), "expected query form (select, ask, construct, describe)")
        ("rules,r", po::value<std::string>(&rules)->default_value("none"),
         "rule mode (none, basic, advanced, custom, declarative)")
        ("rules-file", po::value<std::string>(&rulesFile), "rule text for the custom and declarative modes")
        ("cwm-rules-file", po::value<std::string>(&cwmRulesFile), "declarative rules applied after the rule mode")
        ("namespaces", po::value<std::string>(&namespacesFile), "namespace configuration file")
        ("default-namespace", po::value<std::string>(&defaultNamespace), "IRI base for bare tokens")
        ("recommend", po::value<std::string>(&recommend)->default_value("preferences"),
         "recommendation strategy (preferences, borrowing)")
        ("written-by", po::bool_switch(&writtenBy), "also derive writtenBy during author inversion")
        ("print-graph,p", po::bool_switch(&printGraph), "write the extended graph in ntriples format to stdout")
        ("log-level", po::value<std::string>(&logLevel)->default_value("warning"),
         "debug, info, warning, error, off")
        ("verbose,v", po::bool_switch(&verbose), "same as --log-level info")
    ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::clog << e.what() << "\n" << desc << std::endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || graphFile.empty() || (query.empty() && queryFile.empty() && !printGraph)) {
        std::clog << "usage: rulegraph --graph FILE (--query TEXT | --query-file FILE | --print-graph) [options]\n"
                  << desc << std::endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    try {
        rulegraph::set_log_level(verbose ? rulegraph::log_level::info : rulegraph::parse_log_level(logLevel));

        rulegraph::NamespaceMap namespaces;
        if (!defaultNamespace.empty()) namespaces = rulegraph::NamespaceMap(defaultNamespace);
        if (!namespacesFile.empty()) namespaces.load_file(namespacesFile);

        rulegraph::engine_options options;
        if (recommend == "borrowing")
            options.recommend = rulegraph::recommendation_strategy::borrowing;
        else if (recommend != "preferences")
            throw rulegraph::config_error("unknown recommendation strategy '" + recommend + "'");
        options.emit_written_by = writtenBy;

        std::vector<rulegraph::rule_mode> modes;
        modes.push_back(rulegraph::make_rule_mode(rules, rulesFile.empty() ? std::string() : read_file(rulesFile)));
        if (!cwmRulesFile.empty()) modes.push_back(rulegraph::modes::declarative_rules{read_file(cwmRulesFile)});

        auto graph = rulegraph::load_graph(graphFile, namespaces);
        rulegraph::RuleEngine engine(namespaces, options);
        auto report = engine.apply(graph, modes);
        for (const auto& skipped : report.skipped)
            std::clog << "skipped rule at line " << skipped.line << ": " << skipped.message << "\n";

        if (printGraph) std::cout << report.graph;

        if (!query.empty() || !queryFile.empty()) {
            std::string text = query.empty() ? read_file(queryFile) : query;
            auto result = form.empty()
                ? rulegraph::run_query(report.graph, text, namespaces)
                : rulegraph::run_query(report.graph, text, rulegraph::parse_query_form(form), namespaces);
            print_result(result);
        }
    } catch (const rulegraph::config_error& e) {
        std::clog << "configuration error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const rulegraph::error& e) {
        std::clog << "error: " << e.what() << std::endl;
        return 2;
    }

    return EXIT_SUCCESS;
}
