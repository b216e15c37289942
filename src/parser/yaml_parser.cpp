#include "parser/yaml_parser.hpp"
#include "common/logging.hpp"

namespace parser::yaml {

    Result<YAML::Node> parse(const std::string& content) {
        try {
            YAML::Node config = YAML::Load(content);
            return config;
        } catch (const YAML::Exception& e) {
            return Error{
                "Failed to parse YAML content: " + std::string(e.what()),
                static_cast<size_t>(e.mark.line) + 1,
                static_cast<size_t>(e.mark.column) + 1
            };
        }
    }

    Result<YAML::Node> parse_file(const std::string& file_path) {
        common::log::debug("Loading YAML file: " + file_path);
        try {
            YAML::Node config = YAML::LoadFile(file_path);
            return config;
        } catch (const YAML::BadFile&) {
            return Error{"Cannot open file: " + file_path};
        } catch (const YAML::Exception& e) {
            return Error{
                "Failed to load YAML file: " + std::string(e.what()),
                static_cast<size_t>(e.mark.line) + 1,
                static_cast<size_t>(e.mark.column) + 1
            };
        }
    }

} // namespace parser::yaml
