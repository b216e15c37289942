#ifndef USML_PIPELINE_HPP
#define USML_PIPELINE_HPP

#include "common/logging.hpp"
#include "common/result.hpp"
#include "parser/document.hpp"
#include "resolver/openapi_resolver.hpp"
#include "resolver/table_resolver.hpp"
#include "validator/diagnostic.hpp"
#include "visualizer/graph_model.hpp"
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>

namespace pipeline {

enum class Stage {
    Config,
    Read,
    Parse,
    Resolve
};

struct PipelineError : common::Error {
    Stage stage;
    std::optional<size_t> line{std::nullopt};
    std::optional<size_t> column{std::nullopt};

    PipelineError(Stage s,
                  const std::string& msg,
                  const std::optional<std::string>& ctx = std::nullopt)
        : common::Error(msg, ctx), stage(s) {}
};

template<typename T>
using Result = common::Result<T, PipelineError>;

struct PipelineOptions {
    // Directory relative import paths are resolved against; empty means the mapping file's directory
    std::string base_dir;
    std::string output_dir{"output"};
    bool parallel_resolution{true};
    std::optional<common::log::Level> log_level;
};

// Reads options from a YAML mapping; unknown keys are rejected
Result<PipelineOptions> load_options(const YAML::Node& node);
Result<PipelineOptions> load_options_file(const std::string& file_path);

struct RunResult {
    std::string file;
    parser::usml::Document document;
    resolver::ResolvedApiSchema api;
    resolver::ResolvedTableSchema tables;
    validator::ValidationResult validation;
    visualizer::GraphModel graph;
};

// read -> parse -> resolve (API and tables, concurrently if enabled) -> validate + build graph
class Pipeline {
public:
    explicit Pipeline(PipelineOptions options = {});

    Result<RunResult> run_file(const std::string& file_path);

    // For documents that were not read from disk; imports resolve against `base_dir`
    Result<RunResult> run_content(const std::string& content,
                                  const std::string& base_dir,
                                  const std::string& file_label = "<memory>");

    resolver::ApiSchemaResolver& api_resolver() { return api_resolver_; }
    resolver::TableSchemaResolver& table_resolver() { return table_resolver_; }
    const PipelineOptions& options() const { return options_; }

private:
    Result<RunResult> run_document(parser::usml::Document doc,
                                   const std::string& base_dir,
                                   const std::string& file_label);

    PipelineOptions options_;
    resolver::ApiSchemaResolver api_resolver_;
    resolver::TableSchemaResolver table_resolver_;
};

// Replaces everything but ASCII alphanumerics, '-', '_' and non-ASCII bytes with '-'
std::string sanitize_file_name(const std::string& name);

// Explicit override, else the document's output name, else "<usecase name>.html",
// the latter two placed in the output directory
std::string resolve_output_path(const std::optional<std::string>& override_path,
                                const parser::usml::Document& doc,
                                const PipelineOptions& options);

// Validation result as pretty-printed JSON
std::string validation_report(const validator::ValidationResult& result, const std::string& file);

std::string to_string(Stage stage);

} // namespace pipeline

#endif // USML_PIPELINE_HPP
