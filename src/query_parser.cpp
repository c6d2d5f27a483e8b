#include "query_parser.h"
#include "errors.h"
#include "log.h"
#include "query_grammar.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rulegraph {

std::string to_string(query_form form) {
    switch (form) {
    case query_form::select: return "SELECT";
    case query_form::ask: return "ASK";
    case query_form::construct: return "CONSTRUCT";
    case query_form::describe: return "DESCRIBE";
    }
    return "UNKNOWN";
}

query_form parse_query_form(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "SELECT") return query_form::select;
    if (upper == "ASK") return query_form::ask;
    if (upper == "CONSTRUCT") return query_form::construct;
    if (upper == "DESCRIBE") return query_form::describe;
    throw query_evaluation_error("unsupported query form '" + name + "'");
}

query_t parse_query(const std::string& text, const NamespaceMap& namespaces) {
    tao::pegtl::string_input<> input(text, "query");
    query_actions::query_state state(namespaces);
    try {
        tao::pegtl::parse<query_grammar::query, query_actions::action>(input, state);
    } catch (const tao::pegtl::parse_error& e) {
        const auto p = e.positions().front();
        log(log_level::debug) << "Query parse error: " << e.what() << "\n";
        throw query_syntax_error("syntax error at line " + std::to_string(p.line) + ", column " +
                                 std::to_string(p.column));
    } catch (const reference_error& e) {
        throw query_syntax_error(e.what());
    } catch (const term_error& e) {
        throw query_syntax_error(e.what());
    } catch (const std::out_of_range&) {
        throw query_syntax_error("LIMIT value out of range");
    }

    log(log_level::debug) << "Parsed " << to_string(state.query.form) << " query, patterns: "
                          << state.query.patterns.size() << "\n";
    return std::move(state.query);
}

} // namespace rulegraph
