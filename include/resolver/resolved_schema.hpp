#ifndef USML_RESOLVED_SCHEMA_HPP
#define USML_RESOLVED_SCHEMA_HPP

#include "common/result.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace resolver {

// A reference expression that could not be resolved against its file.
// `reference` holds the expression (or file path) that failed.
struct ResolutionError : common::Error {
    std::string reference;

    ResolutionError(const std::string& msg, const std::string& ref)
        : common::Error(msg, ref), reference(ref) {}
};

template<typename T>
using Result = common::Result<T, ResolutionError>;

struct ApiField {
    std::string name;
    std::string type;
};

// Response fields and parameters of one API operation
struct ResolvedApiSchema {
    std::vector<ApiField> fields;
    std::vector<std::string> parameters;

    bool has_field(const std::string& name) const {
        return std::any_of(fields.begin(), fields.end(),
            [&name](const ApiField& field) { return field.name == name; });
    }

    bool has_parameter(const std::string& name) const {
        return std::find(parameters.begin(), parameters.end(), name) != parameters.end();
    }
};

struct ColumnInfo {
    std::string name;
    std::string type;
    bool primary_key{false};
    bool not_null{false};
    bool unique{false};
};

enum class RelationKind {
    ManyToOne,   // >
    OneToMany,   // <
    OneToOne,    // -
    ManyToMany   // <>
};

struct ForeignKey {
    std::string from_table;
    std::string from_column;
    std::string to_table;
    std::string to_column;
    RelationKind kind{RelationKind::ManyToOne};

    bool operator==(const ForeignKey& other) const {
        return from_table == other.from_table && from_column == other.from_column &&
               to_table == other.to_table && to_column == other.to_column &&
               kind == other.kind;
    }
};

struct TableInfo {
    std::string name;
    std::optional<std::string> alias;  // DBML "Table name as alias"
    std::vector<ColumnInfo> columns;
    std::vector<std::string> primary_key;

    const ColumnInfo* find_column(const std::string& column) const {
        auto it = std::find_if(columns.begin(), columns.end(),
            [&column](const ColumnInfo& info) { return info.name == column; });
        return it == columns.end() ? nullptr : &*it;
    }

    bool has_column(const std::string& column) const {
        return find_column(column) != nullptr;
    }
};

// Projection of the imported tables, in import order
struct ResolvedTableSchema {
    std::vector<TableInfo> tables;
    std::vector<ForeignKey> foreign_keys;

    const TableInfo* find_table(const std::string& name) const {
        auto it = std::find_if(tables.begin(), tables.end(),
            [&name](const TableInfo& table) { return table.name == name; });
        return it == tables.end() ? nullptr : &*it;
    }

    bool has_table(const std::string& name) const {
        return find_table(name) != nullptr;
    }

    bool has_column(const std::string& table, const std::string& column) const {
        const auto* info = find_table(table);
        return info != nullptr && info->has_column(column);
    }
};

std::string to_string(RelationKind kind);

} // namespace resolver

#endif // USML_RESOLVED_SCHEMA_HPP
