#ifndef USML_OPENAPI_RESOLVER_HPP
#define USML_OPENAPI_RESOLVER_HPP

#include "parser/reference.hpp"
#include "resolver/resolved_schema.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace resolver {

// Keys keep their declaration order so response fields come out as written
using OpenApiDocument = nlohmann::ordered_json;

// Resolves ApiRefs against OpenAPI descriptions (YAML or JSON).
// Loaded descriptions are cached by normalized path; safe to share between threads.
class ApiSchemaResolver {
public:
    explicit ApiSchemaResolver(std::string base_dir = "");

    Result<ResolvedApiSchema> resolve(const parser::reference::ApiRef& ref);

    // Seeds the cache with in-memory content for `file_path`
    Result<common::Success> register_document(const std::string& file_path,
                                              const std::string& content);

    void clear_cache();
    size_t cache_size() const;

    std::string normalize(const std::string& file_path) const;

private:
    using DocumentPtr = std::shared_ptr<const OpenApiDocument>;

    Result<DocumentPtr> load(const std::string& file_path);

    std::string base_dir_;
    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<std::string, DocumentPtr> cache_;
};

namespace detail {
    // Converts a yaml-cpp tree into the JSON document model; scalars stay strings
    OpenApiDocument from_yaml(const YAML::Node& node);

    Result<OpenApiDocument> parse_description(const std::string& content,
                                              const std::string& source);

    // Response fields of `schema`, following local $ref, allOf and array items
    Result<std::vector<ApiField>> collect_fields(const OpenApiDocument& doc,
                                                 const OpenApiDocument& schema,
                                                 std::set<std::string>& visiting);
}

} // namespace resolver

#endif // USML_OPENAPI_RESOLVER_HPP
