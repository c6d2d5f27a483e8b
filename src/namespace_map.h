#pragma once

#include <map>
#include <string>

namespace rulegraph {

// Prefix -> IRI base table with one default base for bare tokens.
// rdf, rdfs and xsd are always bound; "ex" is bound to the default base.
class NamespaceMap {
public:
    static const std::string default_base_iri;

    NamespaceMap();
    explicit NamespaceMap(const std::string& default_base);

    void bind(const std::string& prefix, const std::string& base);
    bool contains(const std::string& prefix) const;

    // "ex:hasAuthor" -> base + "hasAuthor"; throws reference_error for an unbound prefix
    std::string resolve(const std::string& compact) const;
    std::string expand_bare(const std::string& local) const { return base + local; }

    const std::string& default_base() const { return base; }
    // rebinds "ex" as well when it still points at the previous default
    void set_default_base(const std::string& iri);

    // PREFIX p: <iri> and DEFAULT <iri> lines; throws config_error
    void load(const std::string& text);
    void load_file(const std::string& path);

private:
    std::string base;
    std::map<std::string, std::string> bindings;
};

} // namespace rulegraph
