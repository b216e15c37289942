#include "validator/symbol_table.hpp"
#include <stdexcept>

namespace validator {

ScopeIndex ScopeIndex::build(const parser::usml::Document& doc) {
    ScopeIndex index;
    const std::string root_table = doc.import_tables.empty() ? "" : doc.import_tables.front().table;
    for (const auto& mapping : doc.response_mappings) {
        index.visit(mapping, nullptr, 0, SymbolTable{}, root_table);
    }
    return index;
}

const NodeScope& ScopeIndex::scope_of(const parser::usml::MappingNode& node) const {
    auto it = scopes_.find(&node);
    if (it == scopes_.end()) {
        throw std::out_of_range("Mapping node '" + node.field + "' is not part of the indexed document");
    }
    return it->second;
}

void ScopeIndex::visit(const parser::usml::MappingNode& node,
                       const parser::usml::MappingNode* parent,
                       size_t depth,
                       const SymbolTable& inherited,
                       const std::string& root_table) {
    NodeScope scope;
    scope.parent = parent;
    scope.depth = depth;
    scope.root_table = root_table;
    scope.inherited = inherited;

    if (node.join) {
        SymbolTable step = inherited;
        step.bind(node.join->binding_name(), node.join->table);
        scope.steps.push_back(step);
        for (const auto& link : node.join_chain) {
            step.bind(link.binding_name(), link.table);
            scope.steps.push_back(step);
        }
    }

    order_.push_back(&node);
    auto& stored = scopes_.emplace(&node, std::move(scope)).first->second;

    if (const auto* array = node.array()) {
        const SymbolTable& visible = stored.table();
        const auto child_root = visible.resolve(array->source_table);
        for (const auto& child : array->children) {
            visit(child, &node, depth + 1, visible, child_root);
        }
    }
}

} // namespace validator
