#include "graph.h"
#include "errors.h"

#include <sstream>

namespace rulegraph {

namespace {
    bool position_matches(const term_t& pattern, const term_t& term) {
        return is_variable(pattern) || pattern == term;
    }
}

Graph::Graph(std::initializer_list<triple_t> init) {
    for (const auto& t : init)
        add(t);
}

bool Graph::add(const triple_t& triple) {
    if (!is_ground(triple))
        throw term_error("cannot store a triple holding a variable: " + to_ntriples(triple));
    return triples.insert(triple).second;
}

bool Graph::add(const term_t& subject, const term_t& predicate, const term_t& object) {
    return add(triple_t{subject, predicate, object});
}

std::size_t Graph::add_all(const Graph& other) {
    std::size_t added = 0;
    for (const auto& t : other)
        if (triples.insert(t).second) ++added;
    return added;
}

bool Graph::contains(const triple_t& triple) const {
    return triples.count(triple) != 0;
}

std::vector<triple_t> Graph::match(const triple_pattern_t& pattern) const {
    std::vector<triple_t> result;
    for (const auto& t : triples) {
        if (position_matches(pattern.subject, t.subject) &&
            position_matches(pattern.predicate, t.predicate) &&
            position_matches(pattern.object, t.object)) {
            result.push_back(t);
        }
    }
    return result;
}

std::vector<std::pair<term_t, term_t>> Graph::subject_objects(const term_t& predicate) const {
    std::vector<std::pair<term_t, term_t>> result;
    for (const auto& t : match({make_variable("s"), predicate, make_variable("o")}))
        result.emplace_back(t.subject, t.object);
    return result;
}

std::vector<term_t> Graph::subjects(const term_t& predicate, const term_t& object) const {
    std::vector<term_t> result;
    for (const auto& t : match({make_variable("s"), predicate, object}))
        result.push_back(t.subject);
    return result;
}

std::vector<term_t> Graph::objects(const term_t& subject, const term_t& predicate) const {
    std::vector<term_t> result;
    for (const auto& t : match({subject, predicate, make_variable("o")}))
        result.push_back(t.object);
    return result;
}

std::string Graph::serialize() const {
    std::ostringstream out;
    out << *this;
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const Graph& graph) {
    for (const auto& t : graph)
        os << to_ntriples(t) << "\n";
    return os;
}

} // namespace rulegraph
