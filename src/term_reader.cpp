#include "term_reader.h"
#include "errors.h"

#include <cctype>

namespace rulegraph {

namespace {
    bool is_name_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool is_number(const std::string& s) {
        std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
        if (i >= s.size()) return false;
        bool digits = false, dot = false;
        for (; i < s.size(); ++i) {
            if (std::isdigit(static_cast<unsigned char>(s[i]))) {
                digits = true;
            } else if (s[i] == '.' && !dot && digits && i + 1 < s.size()) {
                dot = true;
            } else {
                return false;
            }
        }
        return digits;
    }

    std::string unescape(const std::string& s, const std::string& token) {
        std::string result;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] != '\\') {
                result += s[i];
                continue;
            }
            if (++i == s.size()) throw term_error("dangling escape in literal " + token);
            switch (s[i]) {
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case '"': result += '"'; break;
            case '\'': result += '\''; break;
            case '\\': result += '\\'; break;
            default: throw term_error(std::string("unknown escape \\") + s[i] + " in literal " + token);
            }
        }
        return result;
    }

    std::string read_iri(const std::string& token, const NamespaceMap& namespaces);

    term_t read_literal(const std::string& token, const NamespaceMap& namespaces) {
        std::size_t close = std::string::npos;
        for (std::size_t i = 1; i < token.size(); ++i) {
            if (token[i] == '\\') {
                ++i;
            } else if (token[i] == '"') {
                close = i;
                break;
            }
        }
        if (close == std::string::npos) throw term_error("unterminated literal " + token);

        literal_t lit;
        lit.lexical = unescape(token.substr(1, close - 1), token);
        std::string suffix = token.substr(close + 1);
        if (suffix.empty()) return lit;
        if (suffix[0] == '@' && suffix.size() > 1) {
            lit.language = suffix.substr(1);
        } else if (suffix.compare(0, 2, "^^") == 0 && suffix.size() > 2) {
            lit.datatype = read_iri(suffix.substr(2), namespaces);
        } else {
            throw term_error("malformed literal suffix in " + token);
        }
        return lit;
    }

    std::string read_iri(const std::string& token, const NamespaceMap& namespaces) {
        if (token.front() == '<') {
            if (token.size() < 2 || token.back() != '>') throw term_error("unterminated IRI " + token);
            return token.substr(1, token.size() - 2);
        }
        auto colon = token.find(':');
        if (colon == std::string::npos) return namespaces.expand_bare(token);

        std::string prefix = token.substr(0, colon);
        if (namespaces.contains(prefix)) return namespaces.resolve(token);
        if (token.compare(colon + 1, 2, "//") == 0 || prefix == "urn" || prefix == "mailto") return token;
        return namespaces.resolve(token);
    }
}

term_t read_term(const std::string& token, const NamespaceMap& namespaces) {
    if (token.empty()) throw term_error("empty token");

    if (token[0] == '?' || token[0] == '$') {
        std::string name = token.substr(1);
        if (name.empty()) throw term_error("variable without a name: " + token);
        for (char c : name) {
            if (!is_name_char(c)) throw term_error("malformed variable " + token);
        }
        return variable_t{name};
    }
    if (token[0] == '"') return read_literal(token, namespaces);
    if (token.compare(0, 2, "_:") == 0) {
        if (token.size() == 2) throw term_error("blank node without a label");
        return blank_t{token.substr(2)};
    }
    if (token == "a") return iri_t{vocab::rdf_type};
    if (is_number(token)) {
        bool decimal = token.find('.') != std::string::npos;
        return literal_t{token, vocab::xsd + (decimal ? "decimal" : "integer"), ""};
    }
    return iri_t{read_iri(token, namespaces)};
}

} // namespace rulegraph
