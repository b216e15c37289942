#include "pipeline/pipeline.hpp"
#include "common/string_utils.hpp"
#include "common/yaml_error_utils.hpp"
#include "parser/document_parser.hpp"
#include "parser/yaml_parser.hpp"
#include "validator/validator.hpp"
#include "visualizer/graph_builder.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <system_error>

namespace pipeline {

namespace {

    const std::vector<std::string> OPTION_KEYS = {
        "base_dir", "output_dir", "parallel_resolution", "log_level"
    };

    std::string qualify(const std::string& file, const std::string& base_dir) {
        std::filesystem::path path(file);
        if (path.is_relative() && !base_dir.empty()) {
            path = std::filesystem::path(base_dir) / path;
        }
        return path.lexically_normal().string();
    }

    PipelineError resolution_failure(const resolver::ResolutionError& error) {
        common::log::error("Cannot resolve " + error.reference + ": " + error.message);
        return PipelineError{Stage::Resolve, error.message, error.reference};
    }
}

std::string to_string(Stage stage) {
    switch (stage) {
        case Stage::Config: return "config";
        case Stage::Read: return "read";
        case Stage::Parse: return "parse";
        case Stage::Resolve: return "resolve";
    }
    return "unknown";
}

Result<PipelineOptions> load_options(const YAML::Node& node) {
    PipelineOptions options;
    if (!node || node.IsNull()) {
        return options;
    }
    if (!node.IsMap()) {
        return PipelineError{Stage::Config, "Options must be a mapping"};
    }
    if (auto unknown = common::yaml::find_unknown_key(node, OPTION_KEYS)) {
        return PipelineError{Stage::Config, "Unknown option '" + *unknown + "'"};
    }

    if (node["base_dir"]) {
        auto value = parser::yaml::scalar_as<std::string>(node["base_dir"]);
        if (!value) {
            return PipelineError{Stage::Config, "Option 'base_dir' must be a string"};
        }
        options.base_dir = *value;
    }
    if (node["output_dir"]) {
        auto value = parser::yaml::scalar_as<std::string>(node["output_dir"]);
        if (!value || value->empty()) {
            return PipelineError{Stage::Config, "Option 'output_dir' must be a non-empty string"};
        }
        options.output_dir = *value;
    }
    if (node["parallel_resolution"]) {
        auto value = parser::yaml::scalar_as<bool>(node["parallel_resolution"]);
        if (!value) {
            return PipelineError{Stage::Config, "Option 'parallel_resolution' must be a boolean"};
        }
        options.parallel_resolution = *value;
    }
    if (node["log_level"]) {
        auto name = parser::yaml::scalar_as<std::string>(node["log_level"]);
        auto level = name ? common::log::parse_level(common::utils::to_lower(*name)) : std::nullopt;
        if (!level) {
            return PipelineError{Stage::Config,
                "Option 'log_level' must be one of debug, info, warning, error, off"};
        }
        options.log_level = *level;
    }
    return options;
}

Result<PipelineOptions> load_options_file(const std::string& file_path) {
    auto yaml = parser::yaml::parse_file(file_path);
    if (std::holds_alternative<parser::yaml::Error>(yaml)) {
        return PipelineError{Stage::Config, std::get<parser::yaml::Error>(yaml).message, file_path};
    }
    return load_options(std::get<YAML::Node>(yaml));
}

Pipeline::Pipeline(PipelineOptions options)
    : options_(std::move(options)) {
    if (options_.log_level) {
        common::log::set_level(*options_.log_level);
    }
}

Result<RunResult> Pipeline::run_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file) {
        return PipelineError{Stage::Read, "Cannot open mapping file: " + file_path, file_path};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    const auto base_dir = options_.base_dir.empty()
        ? std::filesystem::path(file_path).parent_path().string()
        : options_.base_dir;
    return run_content(buffer.str(), base_dir, file_path);
}

Result<RunResult> Pipeline::run_content(const std::string& content,
                                        const std::string& base_dir,
                                        const std::string& file_label) {
    common::log::info("Processing " + file_label);
    auto parsed = parser::usml::parse_document(content);
    if (std::holds_alternative<parser::usml::ParseError>(parsed)) {
        const auto& error = std::get<parser::usml::ParseError>(parsed);
        common::log::error("Cannot parse " + file_label + ": " + error.describe());
        PipelineError failure{Stage::Parse, error.message, error.context};
        failure.line = error.line;
        failure.column = error.column;
        return failure;
    }
    return run_document(std::move(std::get<parser::usml::Document>(parsed)), base_dir, file_label);
}

Result<RunResult> Pipeline::run_document(parser::usml::Document doc,
                                         const std::string& base_dir,
                                         const std::string& file_label) {
    auto api_ref = doc.import_api;
    api_ref.file = qualify(api_ref.file, base_dir);
    auto table_refs = doc.import_tables;
    for (auto& ref : table_refs) {
        ref.file = qualify(ref.file, base_dir);
    }

    resolver::Result<resolver::ResolvedApiSchema> api;
    resolver::Result<resolver::ResolvedTableSchema> tables;
    if (options_.parallel_resolution) {
        try {
            auto pending = std::async(std::launch::async,
                [this, &api_ref] { return api_resolver_.resolve(api_ref); });
            tables = table_resolver_.resolve(table_refs);
            api = pending.get();
        } catch (const std::system_error& e) {
            return PipelineError{Stage::Resolve,
                "Could not run schema resolution concurrently: " + std::string(e.what())};
        }
    } else {
        api = api_resolver_.resolve(api_ref);
        tables = table_resolver_.resolve(table_refs);
    }

    if (std::holds_alternative<resolver::ResolutionError>(api)) {
        return resolution_failure(std::get<resolver::ResolutionError>(api));
    }
    if (std::holds_alternative<resolver::ResolutionError>(tables)) {
        return resolution_failure(std::get<resolver::ResolutionError>(tables));
    }

    RunResult result;
    result.file = file_label;
    result.document = std::move(doc);
    result.api = std::move(std::get<resolver::ResolvedApiSchema>(api));
    result.tables = std::move(std::get<resolver::ResolvedTableSchema>(tables));

    // Nodes are indexed by address, so the index is built on the document's final home
    const auto scopes = validator::ScopeIndex::build(result.document);
    result.validation = validator::validate(result.document, result.api, result.tables, scopes);
    result.graph = visualizer::build_graph(result.document, result.tables, scopes);
    if (!result.validation.ok()) {
        common::log::warning(file_label + ": " + std::to_string(result.validation.error_count()) +
                             " validation error(s)");
    }
    return result;
}

std::string sanitize_file_name(const std::string& name) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || uc >= 0x80) {
            sanitized += c;
        } else {
            sanitized += '-';
        }
    }
    return sanitized.empty() ? "usecase" : sanitized;
}

std::string resolve_output_path(const std::optional<std::string>& override_path,
                                const parser::usml::Document& doc,
                                const PipelineOptions& options) {
    if (override_path && !override_path->empty()) {
        return *override_path;
    }
    const auto name = doc.output_name && !doc.output_name->empty()
        ? *doc.output_name
        : sanitize_file_name(doc.usecase_name) + ".html";
    return (std::filesystem::path(options.output_dir) / name).string();
}

std::string validation_report(const validator::ValidationResult& result, const std::string& file) {
    return validator::to_json(result, file).dump(2);
}

} // namespace pipeline
