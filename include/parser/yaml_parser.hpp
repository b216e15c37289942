#ifndef USML_YAML_PARSER_HPP
#define USML_YAML_PARSER_HPP

#include "common/result.hpp"
#include <yaml-cpp/yaml.h>
#include <string>
#include <optional>

namespace parser::yaml {

    // YAML-specific error type
    struct Error : common::Error {
        std::optional<size_t> line{std::nullopt};
        std::optional<size_t> column{std::nullopt};

        Error(const std::string& msg,
              std::optional<size_t> l = std::nullopt,
              std::optional<size_t> col = std::nullopt)
            : common::Error(msg), line(l), column(col) {}
    };

    // Use common Result with YAML Error
    template<typename T>
    using Result = common::Result<T, Error>;

    // Parser functions. Also accept JSON, which is a YAML subset.
    Result<YAML::Node> parse(const std::string& content);
    Result<YAML::Node> parse_file(const std::string& file_path);

    // Reads a scalar, failing instead of throwing on a type mismatch
    template<typename T>
    std::optional<T> scalar_as(const YAML::Node& node) {
        if (!node || !node.IsScalar()) {
            return std::nullopt;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return std::nullopt;
        }
    }

} // namespace parser::yaml

#endif // USML_YAML_PARSER_HPP
