#include "query_engine.h"
#include "errors.h"
#include "log.h"

#include <set>

namespace rulegraph {

const std::string not_applicable = "N/A";

namespace {
    term_t substitute(const term_t& t, const binding_t& binding) {
        if (auto v = std::get_if<variable_t>(&t)) {
            auto it = binding.find(v->name);
            if (it != binding.end()) return it->second;
        }
        return t;
    }

    // binds a still-free pattern position; false when the same variable already holds another term
    bool unify(const term_t& pattern, const term_t& value, binding_t& binding) {
        auto v = std::get_if<variable_t>(&pattern);
        if (!v) return true;
        auto [it, inserted] = binding.emplace(v->name, value);
        return inserted || it->second == value;
    }
}

std::vector<binding_t> evaluate(const Graph& graph, const std::vector<triple_pattern_t>& patterns) {
    std::vector<binding_t> rows(1);
    for (const auto& pattern : patterns) {
        std::vector<binding_t> next;
        for (const auto& row : rows) {
            triple_pattern_t bound{substitute(pattern.subject, row), substitute(pattern.predicate, row),
                                   substitute(pattern.object, row)};
            for (const auto& t : graph.match(bound)) {
                binding_t extended = row;
                if (unify(bound.subject, t.subject, extended) &&
                    unify(bound.predicate, t.predicate, extended) &&
                    unify(bound.object, t.object, extended)) {
                    next.push_back(std::move(extended));
                }
            }
        }
        rows = std::move(next);
        if (rows.empty()) break;
    }
    log(log_level::debug) << "Evaluated " << patterns.size() << " patterns, rows: " << rows.size() << "\n";
    return rows;
}

std::optional<triple_t> instantiate(const triple_template_t& pattern, const binding_t& binding) {
    triple_t t{substitute(pattern.subject, binding), substitute(pattern.predicate, binding),
               substitute(pattern.object, binding)};
    if (!is_ground(t)) return std::nullopt;
    return t;
}

select_result_t project_select(const std::vector<std::string>& variables, const std::vector<binding_t>& rows) {
    select_result_t result;
    result.headers = variables;
    for (const auto& row : rows) {
        std::vector<std::string> record;
        for (const auto& name : variables) {
            auto it = row.find(name);
            record.push_back(it == row.end() ? not_applicable : to_string(it->second));
        }
        result.rows.push_back(std::move(record));
    }
    return result;
}

bool project_ask(const std::vector<binding_t>& rows) {
    return !rows.empty();
}

Graph project_construct(const std::vector<triple_template_t>& templates, const std::vector<binding_t>& rows) {
    Graph result;
    for (const auto& row : rows) {
        for (const auto& tmpl : templates) {
            if (auto t = instantiate(tmpl, row)) result.add(*t);
        }
    }
    return result;
}

Graph project_describe(const std::vector<triple_pattern_t>& patterns, const std::vector<binding_t>& rows) {
    return project_construct(patterns, rows);
}

query_result_t execute(const Graph& graph, const query_t& query) {
    auto rows = evaluate(graph, query.patterns);

    switch (query.form) {
    case query_form::select: {
        auto variables = query.all_variables ? variables_of(query.patterns) : query.variables;
        auto result = project_select(variables, rows);
        if (query.distinct) {
            std::set<std::vector<std::string>> seen;
            std::vector<std::vector<std::string>> unique;
            for (auto& record : result.rows) {
                if (seen.insert(record).second) unique.push_back(std::move(record));
            }
            result.rows = std::move(unique);
        }
        if (query.limit && result.rows.size() > *query.limit) result.rows.resize(*query.limit);
        return result;
    }
    case query_form::ask:
        return project_ask(rows);
    case query_form::construct: {
        if (query.limit && rows.size() > *query.limit) rows.resize(*query.limit);
        return project_construct(query.templates, rows);
    }
    case query_form::describe:
        return project_describe(query.patterns, rows);
    }
    throw query_evaluation_error("unsupported query form");
}

query_result_t run_query(const Graph& graph, const std::string& text, query_form form,
                         const NamespaceMap& namespaces) {
    auto query = parse_query(text, namespaces);
    if (query.form != form) {
        throw query_evaluation_error("unsupported query form: requested " + to_string(form) + " but the query is " +
                                     to_string(query.form));
    }
    return execute(graph, query);
}

query_result_t run_query(const Graph& graph, const std::string& text, const NamespaceMap& namespaces) {
    auto query = parse_query(text, namespaces);
    log(log_level::info) << "Running " << to_string(query.form) << " query over " << graph.size() << " triples\n";
    return execute(graph, query);
}

} // namespace rulegraph
