#pragma once

#include "errors.h"
#include "log.h"
#include "namespace_map.h"
#include "term.h"
#include "term_reader.h"

#include <tao/pegtl.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rulegraph {

// Line-oriented token grammar shared by declarative rules, graph documents
// and namespace configuration.
namespace grammar {
    using namespace tao::pegtl;

    // Whitespace and comments
    struct ws : star<blank> {};
    struct ws1 : plus<blank> {};
    struct comment : seq<one<'#'>, until<eolf>> {};
    struct ignored : sor<space, comment> {};

    struct arrow : string<'=', '>'> {};

    // Tokens
    struct iri_ref : seq<one<'<'>, star<not_one<'>', ' ', '\t', '\r', '\n'>>, one<'>'>> {};
    struct string_char : sor<seq<one<'\\'>, any>, not_one<'"', '\\', '\r', '\n'>> {};
    struct quoted : seq<one<'"'>, star<string_char>, one<'"'>> {};
    struct lang_tag : seq<one<'@'>, plus<alpha>, star<seq<one<'-'>, plus<alnum>>>> {};

    // a '.' belongs to a bare token only when more token text follows it
    struct bare_plain : not_one<' ', '\t', '\r', '\n', '.', '"', '<', '>', '{', '}'> {};
    struct bare_char : sor<bare_plain, seq<one<'.'>, at<bare_plain>>> {};
    struct bare_token : plus<not_at<arrow>, bare_char> {};
    // a '.' right after a variable always ends the clause
    struct var_token : seq<one<'?', '$'>, plus<sor<alnum, one<'_'>>>> {};

    struct datatype : seq<two<'^'>, sor<iri_ref, bare_token>> {};
    struct literal_token : seq<quoted, opt<sor<lang_tag, datatype>>> {};
    struct token : seq<not_at<arrow>, sor<var_token, iri_ref, literal_token, bare_token>> {};

    // Clauses: whitespace separated tokens, '.' between clauses
    struct clause : list<token, ws1> {};
    struct clause_sep : seq<ws, one<'.'>, ws> {};
    struct clauses : seq<ws, opt<clause>, star<clause_sep, opt<clause>>, ws> {};

    // Rule: antecedent => consequent
    struct antecedent : clauses {};
    struct consequent : clauses {};
    struct implies : arrow {};
    struct extra_implies : arrow {};
    struct rule : seq<antecedent, opt<implies, consequent, star<extra_implies, consequent>>, must<eof>> {};

    // PREFIX declarations
    struct keyword_prefix : sor<TAO_PEGTL_ISTRING("PREFIX"), TAO_PEGTL_ISTRING("@prefix")> {};
    struct keyword_default : TAO_PEGTL_ISTRING("DEFAULT") {};
    struct prefix_name : star<sor<alnum, one<'_', '-'>>> {};
    struct namespace_iri : iri_ref {};
    struct prefix_decl : seq<keyword_prefix, ws1, prefix_name, one<':'>, ws, must<namespace_iri>, ws, opt<one<'.'>>> {};
    struct default_iri : iri_ref {};
    struct default_decl : seq<keyword_default, ws1, must<default_iri>> {};

    // Graph document: prefix declarations and '.'-terminated statements
    struct statement : seq<clause, ws, must<one<'.'>>> {};
    struct document : seq<star<sor<ignored, prefix_decl, statement>>, must<eof>> {};

    // Namespace configuration
    struct config : seq<star<sor<ignored, prefix_decl, default_decl>>, must<eof>> {};
}

namespace actions {
    struct parse_state {
        explicit parse_state(NamespaceMap ns) : namespaces(std::move(ns)) {}

        NamespaceMap namespaces;
        std::vector<term_t> tokens;
        std::vector<triple_pattern_t> clauses;
        std::vector<triple_pattern_t> antecedent;
        std::vector<triple_template_t> consequent;
        std::vector<triple_t> statements;
        int arrows = 0;
        std::string prefix;
    };

    template<typename Rule>
    struct action : tao::pegtl::nothing<Rule> {};

    template<> struct action<grammar::token> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, parse_state& state) {
            state.tokens.push_back(read_term(in.string(), state.namespaces));
            log(log_level::debug) << "Parsed token: " << in.string() << "\n";
        }
    };

    template<> struct action<grammar::clause> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, parse_state& state) {
            if (state.tokens.size() != 3) {
                std::size_t count = state.tokens.size();
                state.tokens.clear();
                throw rule_syntax_error("clause '" + in.string() + "' has " + std::to_string(count) +
                                        " terms, expected 3");
            }
            state.clauses.push_back({state.tokens[0], state.tokens[1], state.tokens[2]});
            state.tokens.clear();
        }
    };

    template<> struct action<grammar::antecedent> {
        static void apply0(parse_state& state) {
            state.antecedent = std::move(state.clauses);
            state.clauses.clear();
            log(log_level::debug) << "Parsed antecedent, clauses: " << state.antecedent.size() << "\n";
        }
    };

    template<> struct action<grammar::consequent> {
        static void apply0(parse_state& state) {
            state.consequent.insert(state.consequent.end(), state.clauses.begin(), state.clauses.end());
            state.clauses.clear();
            log(log_level::debug) << "Parsed consequent, clauses: " << state.consequent.size() << "\n";
        }
    };

    template<> struct action<grammar::implies> {
        static void apply0(parse_state& state) {
            ++state.arrows;
        }
    };

    template<> struct action<grammar::extra_implies> {
        static void apply0(parse_state& state) {
            ++state.arrows;
        }
    };

    template<> struct action<grammar::prefix_name> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, parse_state& state) {
            state.prefix = in.string();
        }
    };

    template<> struct action<grammar::namespace_iri> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, parse_state& state) {
            std::string iri = in.string();
            state.namespaces.bind(state.prefix, iri.substr(1, iri.size() - 2));
            log(log_level::debug) << "ADD PREFIX: " << state.prefix << " -> " << iri << "\n";
            state.prefix.clear();
        }
    };

    template<> struct action<grammar::default_iri> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, parse_state& state) {
            std::string iri = in.string();
            state.namespaces.set_default_base(iri.substr(1, iri.size() - 2));
            log(log_level::debug) << "SET DEFAULT: " << iri << "\n";
        }
    };

    template<> struct action<grammar::statement> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, parse_state& state) {
            for (auto& t : state.clauses) {
                if (!is_ground(t))
                    throw term_error("statement holds a variable at " + tao::pegtl::to_string(in.position()));
                state.statements.push_back(std::move(t));
            }
            state.clauses.clear();
        }
    };
}   // namespace actions
}   // namespace rulegraph
