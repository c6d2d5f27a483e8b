#include "term.h"

#include <algorithm>
#include <type_traits>

namespace rulegraph {

namespace {
    std::string escape(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
            case '\\': result += "\\\\"; break;
            case '"': result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c;
            }
        }
        return result;
    }

    void hash_combine(std::size_t& seed, std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
}

bool is_ground(const triple_t& t) {
    return !is_variable(t.subject) && !is_variable(t.predicate) && !is_variable(t.object);
}

std::string to_string(const term_t& t) {
    return std::visit(
        [](const auto& term) -> std::string {
            using T = std::decay_t<decltype(term)>;
            if constexpr (std::is_same_v<T, iri_t>) {
                return term.value;
            } else if constexpr (std::is_same_v<T, blank_t>) {
                return "_:" + term.id;
            } else if constexpr (std::is_same_v<T, literal_t>) {
                return term.lexical;
            } else {
                return "?" + term.name;
            }
        },
        t);
}

std::string to_ntriples(const term_t& t) {
    return std::visit(
        [](const auto& term) -> std::string {
            using T = std::decay_t<decltype(term)>;
            if constexpr (std::is_same_v<T, iri_t>) {
                return "<" + term.value + ">";
            } else if constexpr (std::is_same_v<T, blank_t>) {
                return "_:" + term.id;
            } else if constexpr (std::is_same_v<T, literal_t>) {
                std::string result = "\"" + escape(term.lexical) + "\"";
                if (!term.language.empty())
                    result += "@" + term.language;
                else if (!term.datatype.empty())
                    result += "^^<" + term.datatype + ">";
                return result;
            } else {
                return "?" + term.name;
            }
        },
        t);
}

std::string to_ntriples(const triple_t& t) {
    return to_ntriples(t.subject) + " " + to_ntriples(t.predicate) + " " + to_ntriples(t.object) + " .";
}

std::vector<std::string> variables_of(const std::vector<triple_pattern_t>& patterns) {
    std::vector<std::string> names;
    auto note = [&](const term_t& t) {
        if (auto v = std::get_if<variable_t>(&t)) {
            if (std::find(names.begin(), names.end(), v->name) == names.end())
                names.push_back(v->name);
        }
    };
    for (const auto& p : patterns) {
        note(p.subject);
        note(p.predicate);
        note(p.object);
    }
    return names;
}

std::size_t hash_value(const term_t& t) {
    std::size_t seed = t.index();
    std::visit(
        [&](const auto& term) {
            using T = std::decay_t<decltype(term)>;
            std::hash<std::string> h;
            if constexpr (std::is_same_v<T, iri_t>) {
                hash_combine(seed, h(term.value));
            } else if constexpr (std::is_same_v<T, blank_t>) {
                hash_combine(seed, h(term.id));
            } else if constexpr (std::is_same_v<T, literal_t>) {
                hash_combine(seed, h(term.lexical));
                hash_combine(seed, h(term.datatype));
                hash_combine(seed, h(term.language));
            } else {
                hash_combine(seed, h(term.name));
            }
        },
        t);
    return seed;
}

std::size_t hash_value(const triple_t& t) {
    std::size_t seed = hash_value(t.subject);
    hash_combine(seed, hash_value(t.predicate));
    hash_combine(seed, hash_value(t.object));
    return seed;
}

} // namespace rulegraph
