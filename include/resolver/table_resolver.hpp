#ifndef USML_TABLE_RESOLVER_HPP
#define USML_TABLE_RESOLVER_HPP

#include "parser/reference.hpp"
#include "resolver/dbml_parser.hpp"
#include "resolver/resolved_schema.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace resolver {

// Resolves TableRefs against DBML files and projects the referenced tables.
// Parsed files are cached by normalized path; safe to share between threads.
class TableSchemaResolver {
public:
    explicit TableSchemaResolver(std::string base_dir = "");

    // Tables come out in first-reference order. A table referenced as a whole
    // keeps all its columns; otherwise the union of the referenced columns is kept.
    Result<ResolvedTableSchema> resolve(const std::vector<parser::reference::TableRef>& refs);

    Result<common::Success> register_document(const std::string& file_path,
                                              const std::string& content);

    void clear_cache();
    size_t cache_size() const;

    std::string normalize(const std::string& file_path) const;

private:
    using SchemaPtr = std::shared_ptr<const dbml::Schema>;

    Result<SchemaPtr> load(const std::string& file_path);

    std::string base_dir_;
    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<std::string, SchemaPtr> cache_;
};

} // namespace resolver

#endif // USML_TABLE_RESOLVER_HPP
