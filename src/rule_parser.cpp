#include "rule_parser.h"
#include "errors.h"
#include "log.h"
#include "rule_grammar.h"

namespace rulegraph {

rule_t parse_rule(const std::string& text, const NamespaceMap& namespaces) {
    tao::pegtl::string_input<> input(text, "rule");
    actions::parse_state state(namespaces);
    try {
        tao::pegtl::parse<grammar::rule, actions::action>(input, state);
    } catch (const tao::pegtl::parse_error& e) {
        const auto p = e.positions().front();
        throw rule_syntax_error("unexpected input at column " + std::to_string(p.column) + " of rule: " + text);
    } catch (const reference_error& e) {
        throw rule_syntax_error(e.what());
    } catch (const term_error& e) {
        throw rule_syntax_error(e.what());
    }

    if (state.arrows == 0) throw rule_syntax_error("rule has no '=>': " + text);
    if (state.arrows > 1) throw rule_syntax_error("rule has more than one '=>': " + text);

    log(log_level::debug) << "Parsed rule: antecedent=" << state.antecedent.size()
                          << ", consequent=" << state.consequent.size() << "\n";
    return rule_t{std::move(state.antecedent), std::move(state.consequent)};
}

} // namespace rulegraph
