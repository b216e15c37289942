#include "resolver/openapi_resolver.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "parser/yaml_parser.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace resolver {

namespace {

    Result<std::string> read_file(const std::string& file_path) {
        std::ifstream file(file_path);
        if (!file) {
            return ResolutionError{"Cannot open file: " + file_path, file_path};
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    bool is_json_file(const std::string& path) {
        return common::utils::to_lower(std::filesystem::path(path).extension().string()) == ".json";
    }

    // Follows a chain of local "$ref" until a concrete object is reached
    Result<const OpenApiDocument*> dereference(const OpenApiDocument& doc,
                                               const OpenApiDocument& node,
                                               const std::string& expression) {
        const OpenApiDocument* current = &node;
        std::set<std::string> seen;
        while (current->is_object() && current->contains("$ref")) {
            const auto& target = (*current)["$ref"];
            if (!target.is_string()) {
                return ResolutionError{"'$ref' must be a string", expression};
            }
            const auto ref = target.get<std::string>();
            if (!seen.insert(ref).second) {
                return ResolutionError{"Circular $ref '" + ref + "'", expression};
            }
            if (!common::utils::starts_with(ref, "#/")) {
                return ResolutionError{"Only local $ref is supported, got '" + ref + "'", expression};
            }
            try {
                current = &doc.at(OpenApiDocument::json_pointer(ref.substr(1)));
            } catch (const OpenApiDocument::exception&) {
                return ResolutionError{"Unresolved $ref '" + ref + "'", expression};
            }
        }
        return current;
    }

    std::string type_name(const OpenApiDocument& schema) {
        if (!schema.is_object()) {
            return "";
        }
        if (schema.contains("$ref") && schema["$ref"].is_string()) {
            const auto ref = schema["$ref"].get<std::string>();
            return ref.substr(ref.find_last_of('/') + 1);
        }
        if (schema.contains("type") && schema["type"].is_string()) {
            auto type = schema["type"].get<std::string>();
            if (type == "array" && schema.contains("items")) {
                type += "<" + type_name(schema["items"]) + ">";
            }
            return type;
        }
        if (schema.contains("properties") || schema.contains("allOf")) {
            return "object";
        }
        return "";
    }

    Result<common::Success> collect_parameters(const OpenApiDocument& doc,
                                               const OpenApiDocument& owner,
                                               const std::string& expression,
                                               std::vector<std::string>& out) {
        auto list = owner.find("parameters");
        if (list == owner.end() || !list->is_array()) {
            return common::Success{};
        }
        for (const auto& entry : *list) {
            auto parameter = dereference(doc, entry, expression);
            if (std::holds_alternative<ResolutionError>(parameter)) {
                return std::get<ResolutionError>(parameter);
            }
            const auto* resolved = std::get<const OpenApiDocument*>(parameter);
            if (!resolved->is_object() || !resolved->contains("name") ||
                !(*resolved)["name"].is_string()) {
                continue;
            }
            auto name = (*resolved)["name"].get<std::string>();
            if (std::find(out.begin(), out.end(), name) == out.end()) {
                out.push_back(std::move(name));
            }
        }
        return common::Success{};
    }
}

namespace detail {

OpenApiDocument from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            auto object = OpenApiDocument::object();
            for (const auto& entry : node) {
                object[entry.first.Scalar()] = from_yaml(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            auto array = OpenApiDocument::array();
            for (const auto& entry : node) {
                array.push_back(from_yaml(entry));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
            return node.Scalar();
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

Result<OpenApiDocument> parse_description(const std::string& content, const std::string& source) {
    if (is_json_file(source)) {
        try {
            return OpenApiDocument::parse(content);
        } catch (const OpenApiDocument::parse_error& e) {
            return ResolutionError{"Invalid JSON in API description: " + std::string(e.what()), source};
        }
    }

    auto yaml = parser::yaml::parse(content);
    if (std::holds_alternative<parser::yaml::Error>(yaml)) {
        const auto& error = std::get<parser::yaml::Error>(yaml);
        auto message = "Invalid YAML in API description: " + error.message;
        if (error.line) {
            message += " at line " + std::to_string(*error.line);
        }
        return ResolutionError{message, source};
    }
    return from_yaml(std::get<YAML::Node>(yaml));
}

Result<std::vector<ApiField>> collect_fields(const OpenApiDocument& doc,
                                             const OpenApiDocument& schema,
                                             std::set<std::string>& visiting) {
    std::vector<ApiField> fields;
    std::vector<std::string> entered;
    const OpenApiDocument* current = &schema;

    while (current->is_object() && current->contains("$ref")) {
        const auto& target = (*current)["$ref"];
        const auto ref = target.is_string() ? target.get<std::string>() : "";
        if (visiting.count(ref)) {
            // recursive schema: the outer level already lists these fields
            for (const auto& name : entered) visiting.erase(name);
            return fields;
        }
        auto resolved = dereference(doc, *current, ref);
        if (std::holds_alternative<ResolutionError>(resolved)) {
            return std::get<ResolutionError>(resolved);
        }
        visiting.insert(ref);
        entered.push_back(ref);
        current = std::get<const OpenApiDocument*>(resolved);
    }

    auto add = [&fields](ApiField field) {
        auto it = std::find_if(fields.begin(), fields.end(),
            [&field](const ApiField& existing) { return existing.name == field.name; });
        if (it == fields.end()) {
            fields.push_back(std::move(field));
        }
    };

    if (current->is_object()) {
        if (current->contains("allOf") && (*current)["allOf"].is_array()) {
            for (const auto& part : (*current)["allOf"]) {
                auto nested = collect_fields(doc, part, visiting);
                if (std::holds_alternative<ResolutionError>(nested)) {
                    return nested;
                }
                for (auto& field : std::get<std::vector<ApiField>>(nested)) {
                    add(std::move(field));
                }
            }
        }

        if (current->contains("properties") && (*current)["properties"].is_object()) {
            const auto& properties = (*current)["properties"];
            for (auto it = properties.begin(); it != properties.end(); ++it) {
                add(ApiField{it.key(), type_name(it.value())});
            }
        } else if (current->contains("items")) {
            auto nested = collect_fields(doc, (*current)["items"], visiting);
            if (std::holds_alternative<ResolutionError>(nested)) {
                return nested;
            }
            for (auto& field : std::get<std::vector<ApiField>>(nested)) {
                add(std::move(field));
            }
        }
    }

    for (const auto& ref : entered) {
        visiting.erase(ref);
    }
    return fields;
}

} // namespace detail

ApiSchemaResolver::ApiSchemaResolver(std::string base_dir)
    : base_dir_(std::move(base_dir)) {}

std::string ApiSchemaResolver::normalize(const std::string& file_path) const {
    std::filesystem::path path(file_path);
    if (path.is_relative() && !base_dir_.empty()) {
        path = std::filesystem::path(base_dir_) / path;
    }
    return path.lexically_normal().string();
}

Result<ApiSchemaResolver::DocumentPtr> ApiSchemaResolver::load(const std::string& file_path) {
    const auto key = normalize(file_path);
    {
        std::shared_lock read_lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    common::log::debug("Loading API description: " + key);
    auto content = read_file(key);
    if (std::holds_alternative<ResolutionError>(content)) {
        return std::get<ResolutionError>(content);
    }
    auto parsed = detail::parse_description(std::get<std::string>(content), key);
    if (std::holds_alternative<ResolutionError>(parsed)) {
        return std::get<ResolutionError>(parsed);
    }

    std::unique_lock write_lock(cache_mutex_);
    // Another thread may have loaded the same file meanwhile
    auto [it, inserted] = cache_.emplace(
        key, std::make_shared<const OpenApiDocument>(std::move(std::get<OpenApiDocument>(parsed))));
    return it->second;
}

Result<common::Success> ApiSchemaResolver::register_document(const std::string& file_path,
                                                             const std::string& content) {
    auto parsed = detail::parse_description(content, file_path);
    if (std::holds_alternative<ResolutionError>(parsed)) {
        return std::get<ResolutionError>(parsed);
    }
    std::unique_lock lock(cache_mutex_);
    cache_[normalize(file_path)] =
        std::make_shared<const OpenApiDocument>(std::move(std::get<OpenApiDocument>(parsed)));
    return common::Success{};
}

void ApiSchemaResolver::clear_cache() {
    std::unique_lock lock(cache_mutex_);
    cache_.clear();
}

size_t ApiSchemaResolver::cache_size() const {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

Result<ResolvedApiSchema> ApiSchemaResolver::resolve(const parser::reference::ApiRef& ref) {
    const auto expression = parser::reference::format_api_ref(ref);
    auto loaded = load(ref.file);
    if (std::holds_alternative<ResolutionError>(loaded)) {
        return std::get<ResolutionError>(loaded);
    }
    const auto& doc = *std::get<DocumentPtr>(loaded);

    auto paths = doc.find("paths");
    if (paths == doc.end() || !paths->is_object()) {
        return ResolutionError{"API description has no 'paths'", expression};
    }
    auto path_entry = paths->find(ref.path);
    if (path_entry == paths->end()) {
        return ResolutionError{"Path '" + ref.path + "' not found", expression};
    }
    auto path_item = dereference(doc, *path_entry, expression);
    if (std::holds_alternative<ResolutionError>(path_item)) {
        return std::get<ResolutionError>(path_item);
    }
    const auto& item = *std::get<const OpenApiDocument*>(path_item);

    auto operation = item.find(ref.method);
    if (operation == item.end() || !operation->is_object()) {
        return ResolutionError{"Operation '" + common::utils::to_upper(ref.method) + " " +
                               ref.path + "' not found", expression};
    }

    ResolvedApiSchema schema;
    for (const auto* owner : {&item, &*operation}) {
        auto collected = collect_parameters(doc, *owner, expression, schema.parameters);
        if (std::holds_alternative<ResolutionError>(collected)) {
            return std::get<ResolutionError>(collected);
        }
    }

    auto responses = operation->find("responses");
    if (responses == operation->end() || !responses->is_object()) {
        return ResolutionError{"Operation has no 'responses'", expression};
    }
    auto response_entry = responses->find(ref.status_code);
    if (response_entry == responses->end()) {
        return ResolutionError{"Response '" + ref.status_code + "' not found", expression};
    }
    auto response = dereference(doc, *response_entry, expression);
    if (std::holds_alternative<ResolutionError>(response)) {
        return std::get<ResolutionError>(response);
    }
    const auto& body = *std::get<const OpenApiDocument*>(response);

    const OpenApiDocument* response_schema = nullptr;
    auto content = body.find("content");
    if (content != body.end() && content->is_object() && !content->empty()) {
        auto media = content->find("application/json");
        if (media == content->end()) {
            media = content->begin();
        }
        if (media->is_object() && media->contains("schema")) {
            response_schema = &(*media)["schema"];
        }
    } else if (body.contains("schema")) {
        response_schema = &body["schema"];
    }

    if (response_schema) {
        std::set<std::string> visiting;
        auto fields = detail::collect_fields(doc, *response_schema, visiting);
        if (std::holds_alternative<ResolutionError>(fields)) {
            auto error = std::get<ResolutionError>(fields);
            return ResolutionError{error.message, expression};
        }
        schema.fields = std::move(std::get<std::vector<ApiField>>(fields));
    } else {
        common::log::debug("Response of " + expression + " declares no schema");
    }

    common::log::info("Resolved " + expression + ": " + std::to_string(schema.fields.size()) +
                      " fields, " + std::to_string(schema.parameters.size()) + " parameters");
    return schema;
}

} // namespace resolver
