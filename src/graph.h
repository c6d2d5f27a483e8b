#pragma once

#include "term.h"

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rulegraph {

// A set of ground triples; adding a triple that is already present is a no-op.
class Graph {
public:
    using const_iterator = std::set<triple_t>::const_iterator;

    Graph() = default;
    Graph(std::initializer_list<triple_t> triples);

    // returns false when the triple was already present; throws term_error for a non-ground triple
    bool add(const triple_t& triple);
    bool add(const term_t& subject, const term_t& predicate, const term_t& object);
    // returns the number of triples that were new
    std::size_t add_all(const Graph& other);

    bool contains(const triple_t& triple) const;
    std::size_t size() const { return triples.size(); }
    bool empty() const { return triples.empty(); }

    const_iterator begin() const { return triples.begin(); }
    const_iterator end() const { return triples.end(); }

    // triples agreeing with every non-variable position of the pattern
    std::vector<triple_t> match(const triple_pattern_t& pattern) const;

    std::vector<std::pair<term_t, term_t>> subject_objects(const term_t& predicate) const;
    std::vector<term_t> subjects(const term_t& predicate, const term_t& object) const;
    std::vector<term_t> objects(const term_t& subject, const term_t& predicate) const;

    // one N-Triples statement per line
    std::string serialize() const;

    bool operator==(const Graph& g) const { return triples == g.triples; }
    bool operator!=(const Graph& g) const { return triples != g.triples; }

private:
    std::set<triple_t> triples;
};

std::ostream& operator<<(std::ostream& os, const Graph& graph);

} // namespace rulegraph
