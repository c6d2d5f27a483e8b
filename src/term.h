#pragma once

#include <functional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace rulegraph {

struct iri_t {
    std::string value;

    bool operator==(const iri_t& i) const { return value == i.value; }
    bool operator!=(const iri_t& i) const { return value != i.value; }
    bool operator<(const iri_t& i) const { return value < i.value; }
};

struct blank_t {
    std::string id;

    bool operator==(const blank_t& b) const { return id == b.id; }
    bool operator!=(const blank_t& b) const { return id != b.id; }
    bool operator<(const blank_t& b) const { return id < b.id; }
};

// datatype and language are empty when absent
struct literal_t {
    std::string lexical;
    std::string datatype;
    std::string language;

    bool operator==(const literal_t& l) const
    {
        return lexical == l.lexical && datatype == l.datatype && language == l.language;
    }

    bool operator!=(const literal_t& l) const { return !(*this == l); }

    bool operator<(const literal_t& l) const
    {
        return std::tie(lexical, datatype, language) < std::tie(l.lexical, l.datatype, l.language);
    }
};

struct variable_t {
    std::string name;

    bool operator==(const variable_t& v) const { return name == v.name; }
    bool operator!=(const variable_t& v) const { return name != v.name; }
    bool operator<(const variable_t& v) const { return name < v.name; }
};

using term_t = std::variant<iri_t, blank_t, literal_t, variable_t>;

struct triple_t {
    term_t subject;
    term_t predicate;
    term_t object;

    bool operator==(const triple_t& t) const
    {
        return subject == t.subject && predicate == t.predicate && object == t.object;
    }

    bool operator!=(const triple_t& t) const { return !(*this == t); }

    bool operator<(const triple_t& t) const
    {
        return std::tie(subject, predicate, object) < std::tie(t.subject, t.predicate, t.object);
    }
};

// Same shape as a triple; any position may hold a variable.
// Templates are patterns used on the producing side of a rule or CONSTRUCT.
using triple_pattern_t = triple_t;
using triple_template_t = triple_t;

namespace vocab {
    inline const std::string rdf = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    inline const std::string rdfs = "http://www.w3.org/2000/01/rdf-schema#";
    inline const std::string xsd = "http://www.w3.org/2001/XMLSchema#";
    inline const std::string rdf_type = rdf + "type";
}

inline term_t make_iri(const std::string& value) { return iri_t{value}; }
inline term_t make_blank(const std::string& id) { return blank_t{id}; }
inline term_t make_variable(const std::string& name) { return variable_t{name}; }
inline term_t make_literal(const std::string& lexical, const std::string& datatype = {},
                           const std::string& language = {}) {
    return literal_t{lexical, datatype, language};
}

inline bool is_variable(const term_t& t) { return std::holds_alternative<variable_t>(t); }
bool is_ground(const triple_t& t);

// Iri -> its string, Literal -> lexical value, BlankNode -> _:id, Variable -> ?name
std::string to_string(const term_t& t);

// <iri>, "lex", "lex"@lang, "lex"^^<dt>, _:id, ?name
std::string to_ntriples(const term_t& t);
std::string to_ntriples(const triple_t& t);

// variables in order of first appearance
std::vector<std::string> variables_of(const std::vector<triple_pattern_t>& patterns);

std::size_t hash_value(const term_t& t);
std::size_t hash_value(const triple_t& t);

} // namespace rulegraph

namespace std {
template<> struct hash<rulegraph::triple_t> {
    std::size_t operator()(const rulegraph::triple_t& t) const { return rulegraph::hash_value(t); }
};
}
