#ifndef USML_GRAPH_BUILDER_HPP
#define USML_GRAPH_BUILDER_HPP

#include "parser/document.hpp"
#include "resolver/resolved_schema.hpp"
#include "validator/symbol_table.hpp"
#include "visualizer/graph_model.hpp"

namespace visualizer {

// Builds the field -> unit -> table model. The document is trusted as is;
// nothing here re-validates it.
GraphModel build_graph(const parser::usml::Document& doc,
                       const resolver::ResolvedTableSchema& tables);

GraphModel build_graph(const parser::usml::Document& doc,
                       const resolver::ResolvedTableSchema& tables,
                       const validator::ScopeIndex& scopes);

} // namespace visualizer

#endif // USML_GRAPH_BUILDER_HPP
