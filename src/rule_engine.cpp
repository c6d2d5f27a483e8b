#include "rule_engine.h"
#include "errors.h"
#include "log.h"
#include "query_engine.h"
#include "rule_parser.h"

#include <cctype>
#include <sstream>
#include <type_traits>

namespace rulegraph {

namespace {
    std::string trim(const std::string& s) {
        const char* space = " \t\r\n";
        auto begin = s.find_first_not_of(space);
        if (begin == std::string::npos) return {};
        auto end = s.find_last_not_of(space);
        return s.substr(begin, end - begin + 1);
    }

    std::size_t count_of(const std::string& s, const std::string& needle) {
        std::size_t count = 0;
        for (auto pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + needle.size()))
            ++count;
        return count;
    }

    bool mentions(const std::string& s, const std::string& word) {
        return s.find(word) != std::string::npos;
    }

    // "IF" as a whole word: "IF x", "IF(x)", but not "IFFY"
    bool starts_with_if(const std::string& line) {
        if (line.compare(0, 2, "IF") != 0) return false;
        return line.size() == 2 || !(std::isalnum(static_cast<unsigned char>(line[2])) || line[2] == '_');
    }

    // non-blank lines with their 1-based line numbers
    std::vector<std::pair<std::size_t, std::string>> rule_lines(const std::string& text) {
        std::vector<std::pair<std::size_t, std::string>> lines;
        std::istringstream in(text);
        std::string line;
        for (std::size_t number = 1; std::getline(in, line); ++number) {
            line = trim(line);
            if (!line.empty()) lines.emplace_back(number, line);
        }
        return lines;
    }
}

std::string mode_name(const rule_mode& mode) {
    return std::visit(
        [](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, modes::no_rules>) {
                return "none";
            } else if constexpr (std::is_same_v<T, modes::basic_rules>) {
                return "basic";
            } else if constexpr (std::is_same_v<T, modes::advanced_rules>) {
                return "advanced";
            } else if constexpr (std::is_same_v<T, modes::custom_rules>) {
                return "custom";
            } else {
                return "declarative";
            }
        },
        mode);
}

rule_mode make_rule_mode(const std::string& name, const std::string& text) {
    if (name == "none") return modes::no_rules{};
    if (name == "basic") return modes::basic_rules{};
    if (name == "advanced") return modes::advanced_rules{};
    if (name == "custom") return modes::custom_rules{text};
    if (name == "declarative" || name == "cwm") return modes::declarative_rules{text};
    throw config_error("unknown rule mode '" + name + "'");
}

RuleEngine::RuleEngine(NamespaceMap namespaces, engine_options options)
    : ns(std::move(namespaces)), opts(options) {
    auto term = [this](const std::string& local) { return make_iri(ns.expand_bare(local)); };
    words.type = make_iri(vocab::rdf_type);
    words.book = term("Book");
    words.loan = term("Loan");
    words.frequent_borrower = term("FrequentBorrower");
    words.has_author = term("hasAuthor");
    words.has_genre = term("hasGenre");
    words.borrowed_by = term("borrowedBy");
    words.prefers_genre = term("prefersGenre");
    words.wrote = term("wrote");
    words.written_by = term("writtenBy");
    words.related_to = term("relatedTo");
    words.has_expertise = term("hasExpertise");
    words.recommended_for = term("recommendedFor");
}

rule_report_t RuleEngine::apply(const Graph& graph, const rule_mode& mode) const {
    return apply(graph, std::vector<rule_mode>{mode});
}

rule_report_t RuleEngine::apply(const Graph& graph, const std::vector<rule_mode>& mode_list) const {
    rule_report_t report;
    report.graph = graph;
    for (const auto& mode : mode_list) {
        log(log_level::info) << "Rule mode: " << mode_name(mode) << "\n";
        std::visit(
            [&](const auto& m) {
                using T = std::decay_t<decltype(m)>;
                if constexpr (std::is_same_v<T, modes::basic_rules>) {
                    apply_basic(report.graph);
                } else if constexpr (std::is_same_v<T, modes::advanced_rules>) {
                    apply_advanced(report.graph);
                } else if constexpr (std::is_same_v<T, modes::custom_rules>) {
                    apply_custom(report.graph, m.text);
                } else if constexpr (std::is_same_v<T, modes::declarative_rules>) {
                    auto skipped = apply_declarative(report.graph, m.text);
                    report.skipped.insert(report.skipped.end(), skipped.begin(), skipped.end());
                }
            },
            mode);
    }
    report.derived = report.graph.size() - graph.size();
    log(log_level::info) << "Rule application complete. New triples: " << report.derived
                         << ", skipped rules: " << report.skipped.size() << "\n";
    return report;
}

// Minimal matcher: the only recognized rule is "IF ... hasAuthor ... THEN ... wrote ..."
// (or the same with "=>"), which triggers author inversion. Everything else is ignored.
void RuleEngine::apply_custom(Graph& graph, const std::string& text) const {
    bool invert = false;
    for (const auto& [number, line] : rule_lines(text)) {
        bool if_shape = starts_with_if(line);
        if (!if_shape && !mentions(line, "=>")) {
            log(log_level::debug) << "    Ignoring line " << number << ": " << line << "\n";
            continue;
        }

        const std::string separator = (if_shape && mentions(line, "THEN")) ? "THEN" : "=>";
        auto body = if_shape ? line.substr(2) : line;
        if (count_of(body, separator) != 1) {
            if (mentions(line, "hasAuthor") && mentions(line, "wrote")) {
                throw rule_syntax_error("line " + std::to_string(number) + ": expected exactly one '" + separator +
                                        "' in rule: " + line);
            }
            log(log_level::debug) << "    Ignoring line " << number << ": " << line << "\n";
            continue;
        }

        auto split = body.find(separator);
        auto condition = trim(body.substr(0, split));
        auto action = trim(body.substr(split + separator.size()));
        if (mentions(condition, "hasAuthor") && mentions(action, "wrote")) {
            log(log_level::debug) << "    Line " << number << " triggers author inversion\n";
            invert = true;
        } else {
            log(log_level::debug) << "    No implementation for line " << number << ": " << line << "\n";
        }
    }
    if (invert) invert_authors(graph);
}

std::vector<rule_diagnostic_t> RuleEngine::apply_declarative(Graph& graph, const std::string& text) const {
    std::vector<rule_diagnostic_t> skipped;
    for (const auto& [number, line] : rule_lines(text)) {
        if (line[0] == '#') continue;
        try {
            auto rule = parse_rule(line, ns);
            auto rows = evaluate(graph, rule.antecedent);
            std::size_t added = graph.add_all(project_construct(rule.consequent, rows));
            log(log_level::info) << "    Rule " << number << ": " << rows.size() << " matches, " << added
                                 << " new triples\n";
        } catch (const error& e) {
            log(log_level::warning) << "Skipping rule " << number << " (" << line << "): " << e.what() << "\n";
            skipped.push_back({number, line, e.what()});
        }
    }
    return skipped;
}

} // namespace rulegraph
