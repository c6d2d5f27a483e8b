// Fixed library rule sets. Every step reads the graph as it stands when the
// step starts, collects its derivations separately and merges them at the end,
// so later steps see the output of earlier ones.

#include "rule_engine.h"
#include "log.h"

#include <map>
#include <set>

namespace rulegraph {

void RuleEngine::apply_basic(Graph& graph) const {
    log(log_level::info) << "Applying basic library rules to " << graph.size() << " triples\n";
    std::size_t derived = invert_authors(graph);
    derived += relate_genres(graph);
    derived += classify_borrowers(graph);
    log(log_level::info) << "Basic library rules derived " << derived << " triples\n";
}

void RuleEngine::apply_advanced(Graph& graph) const {
    apply_basic(graph);
    log(log_level::info) << "Applying advanced library rules\n";
    std::size_t derived = derive_expertise(graph);
    if (opts.recommend == recommendation_strategy::borrowing)
        derived += recommend_by_borrowing(graph);
    else
        derived += recommend_by_preference(graph);
    log(log_level::info) << "Advanced library rules derived " << derived << " triples\n";
}

std::size_t RuleEngine::invert_authors(Graph& graph) const {
    Graph derived;
    for (const auto& [book, author] : graph.subject_objects(words.has_author)) {
        derived.add(author, words.wrote, book);
        if (opts.emit_written_by) derived.add(book, words.written_by, author);
    }
    std::size_t added = graph.add_all(derived);
    log(log_level::debug) << "    Rule author_inversion: " << added << " new triples\n";
    return added;
}

std::size_t RuleEngine::relate_genres(Graph& graph) const {
    std::map<term_t, std::vector<term_t>> genre_members;
    for (const auto& [subject, genre] : graph.subject_objects(words.has_genre))
        genre_members[genre].push_back(subject);

    Graph derived;
    for (const auto& [genre, members] : genre_members) {
        for (const auto& first : members) {
            for (const auto& second : members) {
                if (first != second) derived.add(first, words.related_to, second);
            }
        }
    }
    std::size_t added = graph.add_all(derived);
    log(log_level::debug) << "    Rule genre_co_membership: " << added << " new triples\n";
    return added;
}

std::size_t RuleEngine::classify_borrowers(Graph& graph) const {
    std::map<term_t, std::set<term_t>> member_loans;
    for (const auto& [loan, member] : graph.subject_objects(words.borrowed_by))
        member_loans[member].insert(loan);

    Graph derived;
    for (const auto& [member, loans] : member_loans) {
        if (loans.size() > 1) derived.add(member, words.type, words.frequent_borrower);
    }
    std::size_t added = graph.add_all(derived);
    log(log_level::debug) << "    Rule frequent_borrower: " << added << " new triples\n";
    return added;
}

std::size_t RuleEngine::derive_expertise(Graph& graph) const {
    Graph derived;
    for (const auto& book : graph.subjects(words.type, words.book)) {
        auto genres = graph.objects(book, words.has_genre);
        for (const auto& author : graph.objects(book, words.has_author)) {
            for (const auto& genre : genres)
                derived.add(author, words.has_expertise, genre);
        }
    }
    std::size_t added = graph.add_all(derived);
    log(log_level::debug) << "    Rule author_expertise: " << added << " new triples\n";
    return added;
}

std::size_t RuleEngine::recommend_by_preference(Graph& graph) const {
    Graph derived;
    for (const auto& [reader, genre] : graph.subject_objects(words.prefers_genre)) {
        for (const auto& book : graph.subjects(words.has_genre, genre))
            derived.add(book, words.recommended_for, reader);
    }
    std::size_t added = graph.add_all(derived);
    log(log_level::debug) << "    Rule recommendation (preferences): " << added << " new triples\n";
    return added;
}

// genres of a loan: its own hasGenre values and those of everything it points at
std::size_t RuleEngine::recommend_by_borrowing(Graph& graph) const {
    Graph derived;
    for (const auto& loan : graph.subjects(words.type, words.loan)) {
        auto members = graph.objects(loan, words.borrowed_by);
        if (members.empty()) continue;

        std::set<term_t> genres;
        for (const auto& genre : graph.objects(loan, words.has_genre))
            genres.insert(genre);
        for (const auto& t : graph.match({loan, make_variable("p"), make_variable("item")})) {
            for (const auto& genre : graph.objects(t.object, words.has_genre))
                genres.insert(genre);
        }

        for (const auto& genre : genres) {
            for (const auto& book : graph.subjects(words.has_genre, genre)) {
                if (book == loan) continue;
                for (const auto& member : members)
                    derived.add(book, words.recommended_for, member);
            }
        }
    }
    std::size_t added = graph.add_all(derived);
    log(log_level::debug) << "    Rule recommendation (borrowing): " << added << " new triples\n";
    return added;
}

} // namespace rulegraph
