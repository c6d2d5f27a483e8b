#pragma once

#include "log.h"
#include "namespace_map.h"
#include "query_parser.h"
#include "rule_grammar.h"
#include "term.h"
#include "term_reader.h"

#include <tao/pegtl.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rulegraph {

// A basic-graph-pattern subset of SPARQL: PREFIX prologue, SELECT, ASK,
// CONSTRUCT and DESCRIBE over a single group of triple patterns.
namespace query_grammar {
    using namespace tao::pegtl;

    // Whitespace and comments
    struct comment : seq<one<'#'>, until<eolf>> {};
    struct sep : star<sor<space, comment>> {};

    // Keywords
    template<typename Key>
    struct keyword : seq<Key, not_at<identifier_other>> {};

    struct keyword_prefix : keyword<TAO_PEGTL_ISTRING("PREFIX")> {};
    struct keyword_select : keyword<TAO_PEGTL_ISTRING("SELECT")> {};
    struct keyword_distinct : keyword<TAO_PEGTL_ISTRING("DISTINCT")> {};
    struct keyword_where : keyword<TAO_PEGTL_ISTRING("WHERE")> {};
    struct keyword_ask : keyword<TAO_PEGTL_ISTRING("ASK")> {};
    struct keyword_construct : keyword<TAO_PEGTL_ISTRING("CONSTRUCT")> {};
    struct keyword_describe : keyword<TAO_PEGTL_ISTRING("DESCRIBE")> {};
    struct keyword_limit : keyword<TAO_PEGTL_ISTRING("LIMIT")> {};

    // Terms
    struct variable : seq<one<'?', '$'>, plus<sor<alnum, one<'_'>>>> {};
    using grammar::iri_ref;
    struct pn_prefix : seq<alpha, star<sor<alnum, one<'_', '-'>>>> {};
    struct pn_local_char : sor<alnum, one<'_', '-', '%'>> {};
    struct pn_local : star<sor<pn_local_char, seq<one<'.'>, at<pn_local_char>>>> {};
    struct prefixed_name : seq<opt<pn_prefix>, one<':'>, pn_local> {};
    struct numeric : seq<opt<one<'+', '-'>>, plus<digit>, opt<one<'.'>, plus<digit>>> {};
    struct literal : seq<grammar::quoted, opt<sor<grammar::lang_tag, seq<two<'^'>, sor<iri_ref, prefixed_name>>>>> {};
    struct type_keyword : seq<one<'a'>, not_at<identifier_other>> {};
    struct term : sor<variable, iri_ref, literal, numeric, prefixed_name, type_keyword> {};

    // Triple patterns
    // once a subject is read the pattern must be complete
    struct triple : seq<term, sep, must<term>, sep, must<term>> {};
    struct triple_sep : seq<sep, one<'.'>, sep> {};
    struct triples_block : seq<opt<list<triple, triple_sep>>, sep, opt<one<'.'>>> {};
    struct group : seq<one<'{'>, sep, triples_block, sep, must<one<'}'>>> {};
    struct template_group : group {};
    struct where_group : group {};
    struct where : seq<opt<keyword_where, sep>, must<where_group>> {};

    // Prologue
    struct prefix_label : seq<opt<pn_prefix>, one<':'>> {};
    struct prefix_iri : iri_ref {};
    struct prefix_decl : seq<keyword_prefix, sep, must<prefix_label>, sep, must<prefix_iri>> {};
    struct prologue : star<prefix_decl, sep> {};

    // Modifiers
    struct all_variables : one<'*'> {};
    struct projection_var : variable {};
    struct limit_value : plus<digit> {};
    struct limit_clause : seq<keyword_limit, sep, must<limit_value>> {};

    // Query forms
    struct select_query : seq<keyword_select, sep, opt<keyword_distinct, sep>,
                              must<sor<all_variables, list<projection_var, sep>>>, sep,
                              where, sep, opt<limit_clause>> {};
    struct ask_query : seq<keyword_ask, sep, where> {};
    struct construct_query : seq<keyword_construct, sep, must<template_group>, sep,
                                 where, sep, opt<limit_clause>> {};
    struct describe_target : sor<variable, iri_ref, prefixed_name> {};
    struct describe_query : seq<keyword_describe, sep,
                                must<sor<all_variables, list<describe_target, sep>>>, sep,
                                opt<sor<at<keyword_where>, at<one<'{'>>>, where>> {};

    struct query : seq<sep, prologue, sep,
                       must<sor<select_query, ask_query, construct_query, describe_query>>,
                       sep, must<eof>> {};
}

namespace query_actions {
    struct query_state {
        explicit query_state(NamespaceMap ns) : namespaces(std::move(ns)) {}

        NamespaceMap namespaces;
        query_t query;
        std::vector<term_t> terms;
        std::vector<triple_pattern_t> triples;
        std::string prefix;
    };

    template<typename Rule>
    struct action : tao::pegtl::nothing<Rule> {};

    template<> struct action<query_grammar::term> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, query_state& state) {
            state.terms.push_back(read_term(in.string(), state.namespaces));
        }
    };

    template<> struct action<query_grammar::triple> {
        static void apply0(query_state& state) {
            auto n = state.terms.size();
            state.triples.push_back({state.terms[n - 3], state.terms[n - 2], state.terms[n - 1]});
            state.terms.clear();
        }
    };

    template<> struct action<query_grammar::template_group> {
        static void apply0(query_state& state) {
            state.query.templates = std::move(state.triples);
            state.triples.clear();
            log(log_level::debug) << "Parsed template, triples: " << state.query.templates.size() << "\n";
        }
    };

    template<> struct action<query_grammar::where_group> {
        static void apply0(query_state& state) {
            state.query.patterns = std::move(state.triples);
            state.triples.clear();
            log(log_level::debug) << "Parsed where clause, patterns: " << state.query.patterns.size() << "\n";
        }
    };

    template<> struct action<query_grammar::prefix_label> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, query_state& state) {
            std::string label = in.string();
            state.prefix = label.substr(0, label.size() - 1);
        }
    };

    template<> struct action<query_grammar::prefix_iri> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, query_state& state) {
            std::string iri = in.string();
            state.namespaces.bind(state.prefix, iri.substr(1, iri.size() - 2));
            log(log_level::debug) << "ADD PREFIX: " << state.prefix << " -> " << iri << "\n";
        }
    };

    template<> struct action<query_grammar::keyword_select> {
        static void apply0(query_state& state) {
            state.query.form = query_form::select;
        }
    };

    template<> struct action<query_grammar::keyword_ask> {
        static void apply0(query_state& state) {
            state.query.form = query_form::ask;
        }
    };

    template<> struct action<query_grammar::keyword_construct> {
        static void apply0(query_state& state) {
            state.query.form = query_form::construct;
        }
    };

    template<> struct action<query_grammar::keyword_describe> {
        static void apply0(query_state& state) {
            state.query.form = query_form::describe;
        }
    };

    template<> struct action<query_grammar::keyword_distinct> {
        static void apply0(query_state& state) {
            state.query.distinct = true;
        }
    };

    template<> struct action<query_grammar::all_variables> {
        static void apply0(query_state& state) {
            state.query.all_variables = true;
        }
    };

    template<> struct action<query_grammar::projection_var> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, query_state& state) {
            state.query.variables.push_back(in.string().substr(1));
        }
    };

    template<> struct action<query_grammar::describe_target> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, query_state& state) {
            state.query.describe_targets.push_back(read_term(in.string(), state.namespaces));
        }
    };

    template<> struct action<query_grammar::limit_value> {
        template<typename ActionInput>
        static void apply(const ActionInput& in, query_state& state) {
            state.query.limit = std::stoul(in.string());
        }
    };
}   // namespace query_actions
}   // namespace rulegraph
