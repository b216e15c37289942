#include "resolver/table_resolver.hpp"
#include "common/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace resolver {

namespace {

    Result<dbml::Schema> parse_schema(const std::string& content, const std::string& source) {
        auto parsed = dbml::parse(content);
        if (std::holds_alternative<dbml::ParseError>(parsed)) {
            const auto& error = std::get<dbml::ParseError>(parsed);
            return ResolutionError{"Invalid DBML at line " + std::to_string(error.line) + ": " +
                                   error.message, source};
        }
        return std::move(std::get<dbml::Schema>(parsed));
    }

    // Referenced part of one table
    struct Selection {
        const TableInfo* table;
        bool whole{false};
        std::set<std::string> columns;
    };

    // Table name behind a DBML alias, or the name itself
    std::string canonical_table(const dbml::Schema& schema, const std::string& name) {
        const auto* table = schema.find_table(name);
        return table ? table->name : name;
    }
}

TableSchemaResolver::TableSchemaResolver(std::string base_dir)
    : base_dir_(std::move(base_dir)) {}

std::string TableSchemaResolver::normalize(const std::string& file_path) const {
    std::filesystem::path path(file_path);
    if (path.is_relative() && !base_dir_.empty()) {
        path = std::filesystem::path(base_dir_) / path;
    }
    return path.lexically_normal().string();
}

Result<TableSchemaResolver::SchemaPtr> TableSchemaResolver::load(const std::string& file_path) {
    const auto key = normalize(file_path);
    {
        std::shared_lock read_lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    common::log::debug("Loading DBML file: " + key);
    std::ifstream file(key);
    if (!file) {
        return ResolutionError{"Cannot open file: " + key, key};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = parse_schema(buffer.str(), key);
    if (std::holds_alternative<ResolutionError>(parsed)) {
        return std::get<ResolutionError>(parsed);
    }

    std::unique_lock write_lock(cache_mutex_);
    auto [it, inserted] = cache_.emplace(
        key, std::make_shared<const dbml::Schema>(std::move(std::get<dbml::Schema>(parsed))));
    return it->second;
}

Result<common::Success> TableSchemaResolver::register_document(const std::string& file_path,
                                                               const std::string& content) {
    auto parsed = parse_schema(content, file_path);
    if (std::holds_alternative<ResolutionError>(parsed)) {
        return std::get<ResolutionError>(parsed);
    }
    std::unique_lock lock(cache_mutex_);
    cache_[normalize(file_path)] =
        std::make_shared<const dbml::Schema>(std::move(std::get<dbml::Schema>(parsed)));
    return common::Success{};
}

void TableSchemaResolver::clear_cache() {
    std::unique_lock lock(cache_mutex_);
    cache_.clear();
}

size_t TableSchemaResolver::cache_size() const {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

Result<ResolvedTableSchema> TableSchemaResolver::resolve(
    const std::vector<parser::reference::TableRef>& refs) {

    std::vector<SchemaPtr> schemas;
    std::vector<Selection> selections;

    for (const auto& ref : refs) {
        const auto expression = parser::reference::format_table_ref(ref);
        auto loaded = load(ref.file);
        if (std::holds_alternative<ResolutionError>(loaded)) {
            return std::get<ResolutionError>(loaded);
        }
        const auto& schema = std::get<SchemaPtr>(loaded);
        if (std::find(schemas.begin(), schemas.end(), schema) == schemas.end()) {
            schemas.push_back(schema);
        }

        const auto* table = schema->find_table(ref.table);
        if (!table) {
            return ResolutionError{"Table '" + ref.table + "' not found in " + ref.file, expression};
        }
        if (ref.column && !table->has_column(*ref.column)) {
            return ResolutionError{"Column '" + table->name + "." + *ref.column + "' not found in " +
                                   ref.file, expression};
        }

        auto selection = std::find_if(selections.begin(), selections.end(),
            [table](const Selection& existing) { return existing.table->name == table->name; });
        if (selection == selections.end()) {
            selections.push_back(Selection{table, false, {}});
            selection = selections.end() - 1;
        }
        if (ref.column) {
            selection->columns.insert(*ref.column);
        } else {
            selection->whole = true;
        }
    }

    ResolvedTableSchema resolved;
    for (const auto& selection : selections) {
        TableInfo projected;
        projected.name = selection.table->name;
        projected.alias = selection.table->alias;
        projected.primary_key = selection.table->primary_key;
        for (const auto& column : selection.table->columns) {
            if (selection.whole || selection.columns.count(column.name)) {
                projected.columns.push_back(column);
            }
        }
        resolved.tables.push_back(std::move(projected));
    }

    for (const auto& schema : schemas) {
        for (const auto& reference : schema->references) {
            ForeignKey edge = reference;
            edge.from_table = canonical_table(*schema, reference.from_table);
            edge.to_table = canonical_table(*schema, reference.to_table);
            if (!resolved.has_column(edge.from_table, edge.from_column) ||
                !resolved.has_column(edge.to_table, edge.to_column)) {
                continue;
            }
            if (std::find(resolved.foreign_keys.begin(), resolved.foreign_keys.end(), edge) ==
                resolved.foreign_keys.end()) {
                resolved.foreign_keys.push_back(std::move(edge));
            }
        }
    }

    common::log::info("Resolved " + std::to_string(resolved.tables.size()) + " tables and " +
                      std::to_string(resolved.foreign_keys.size()) + " foreign keys");
    return resolved;
}

} // namespace resolver
