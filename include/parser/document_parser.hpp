#ifndef USML_DOCUMENT_PARSER_HPP
#define USML_DOCUMENT_PARSER_HPP

#include "common/result.hpp"
#include "parser/document.hpp"
#include "parser/yaml_parser.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace parser::usml {

// Only language version accepted by this parser
inline constexpr const char* SUPPORTED_VERSION = "0.1";

// Malformed mapping document. `context` holds the YAML path of the offending construct.
struct ParseError : common::Error {
    std::optional<size_t> line{std::nullopt};
    std::optional<size_t> column{std::nullopt};

    ParseError(const std::string& msg,
               const std::optional<std::string>& ctx = std::nullopt,
               std::optional<size_t> l = std::nullopt,
               std::optional<size_t> col = std::nullopt)
        : common::Error(msg, ctx), line(l), column(col) {}
};

template<typename T>
using Result = common::Result<T, ParseError>;

// Parse mapping-language text into a document
Result<Document> parse_document(const std::string& content);
Result<Document> parse_document_file(const std::string& file_path);

// Build a document from an already loaded YAML tree
Result<Document> create_document(const YAML::Node& root);

// Parse "table.column"
Result<ColumnRef> parse_column_ref(const std::string& text, const std::string& context);
// Parse "a.x = b.y"
Result<JoinCondition> parse_join_condition(const std::string& text, const std::string& context);

namespace detail {
    Result<MappingNode> create_mapping_node(const YAML::Node& node, const std::string& context);
    Result<JoinSpec> create_join(const YAML::Node& node, const std::string& context);
    Result<JoinLink> create_join_link(const YAML::Node& node, const std::string& context);
    Result<AggregateSpec> create_aggregate(const YAML::Node& node, const std::string& context);
    Result<Filter> create_filter(const YAML::Node& node, const std::string& context);
    Result<Transform> create_transform(const YAML::Node& node, const std::string& context);
}

} // namespace parser::usml

#endif // USML_DOCUMENT_PARSER_HPP
