#ifndef USML_SYMBOL_TABLE_HPP
#define USML_SYMBOL_TABLE_HPP

#include "parser/document.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace validator {

struct Binding {
    std::string name;   // alias, or the bare table name when unaliased
    std::string table;  // physical table
};

// Ordered alias -> physical table bindings visible at one point of a mapping tree
class SymbolTable {
public:
    void bind(const std::string& name, const std::string& table) {
        bindings_.push_back({name, table});
    }

    // Most recent binding wins
    std::optional<std::string> lookup(const std::string& name) const {
        for (auto it = bindings_.rbegin(); it != bindings_.rend(); ++it) {
            if (it->name == name) {
                return it->table;
            }
        }
        return std::nullopt;
    }

    // Physical table for a column qualifier; unbound names are taken as table names
    std::string resolve(const std::string& qualifier) const {
        auto table = lookup(qualifier);
        return table ? *table : qualifier;
    }

    const std::vector<Binding>& bindings() const { return bindings_; }

private:
    std::vector<Binding> bindings_;
};

// Bindings of one mapping node
struct NodeScope {
    const parser::usml::MappingNode* parent{nullptr};  // enclosing array, if any
    size_t depth{0};
    std::string root_table;  // first imported table, or the enclosing array's table
    SymbolTable inherited;   // bindings before the node's own joins
    std::vector<SymbolTable> steps;  // after join, then after each join_chain entry

    // Bindings after all of the node's joins
    const SymbolTable& table() const { return steps.empty() ? inherited : steps.back(); }
};

// Scopes of every node of a document, computed in one pass
class ScopeIndex {
public:
    static ScopeIndex build(const parser::usml::Document& doc);

    const NodeScope& scope_of(const parser::usml::MappingNode& node) const;

    // Nodes in pre-order
    const std::vector<const parser::usml::MappingNode*>& nodes() const { return order_; }

private:
    void visit(const parser::usml::MappingNode& node,
               const parser::usml::MappingNode* parent,
               size_t depth,
               const SymbolTable& inherited,
               const std::string& root_table);

    std::unordered_map<const parser::usml::MappingNode*, NodeScope> scopes_;
    std::vector<const parser::usml::MappingNode*> order_;
};

} // namespace validator

#endif // USML_SYMBOL_TABLE_HPP
