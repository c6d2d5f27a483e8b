#pragma once

#include <stdexcept>
#include <string>

namespace rulegraph {

struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// prefix of a compact identifier is not bound in the active namespace map
struct reference_error : error {
    using error::error;
};

// token that is not a well-formed term
struct term_error : error {
    using error::error;
};

struct rule_syntax_error : error {
    using error::error;
};

struct query_syntax_error : error {
    using error::error;
};

struct query_evaluation_error : error {
    using error::error;
};

struct config_error : error {
    using error::error;
};

// raised by the graph loader, which stands in for the document fetch and extraction step
struct source_unavailable : error {
    using error::error;
};

struct extraction_failed : error {
    using error::error;
};

} // namespace rulegraph
