#include "parser/document_parser.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "common/yaml_error_utils.hpp"
#include <set>

namespace parser::usml {

namespace {

    const std::vector<std::string> ROOT_KEYS = {"version", "import", "usecase"};
    const std::vector<std::string> IMPORT_KEYS = {"openapi", "dbml"};
    const std::vector<std::string> USECASE_KEYS = {
        "name", "summary", "output", "response_mapping", "filters", "transforms"
    };
    const std::vector<std::string> MAPPING_KEYS = {
        "field", "type", "source", "source_table", "join", "join_chain", "aggregate", "fields"
    };
    const std::vector<std::string> JOIN_KEYS = {"table", "alias", "on", "type"};
    const std::vector<std::string> JOIN_LINK_KEYS = {"table", "alias", "on"};
    const std::vector<std::string> AGGREGATE_KEYS = {"type", "group_by"};
    const std::vector<std::string> WHERE_KEYS = {"param", "maps_to", "condition"};
    const std::vector<std::string> PAGINATION_KEYS = {
        "param", "maps_to", "strategy", "page_size", "limit_param", "max_page_size", "cursor_field"
    };
    const std::vector<std::string> ORDER_BY_KEYS = {
        "param", "maps_to", "default_column", "default_direction",
        "allowed_columns", "allowed_directions"
    };
    const std::vector<std::string> CONDITION_KEYS = {"param", "field", "source", "operator", "value"};
    const std::vector<std::string> CASE_BRANCH_KEYS = {"value", "then"};

    ParseError error_at(const YAML::Node& node,
                        const std::string& message,
                        const std::string& context) {
        auto position = common::yaml::position_of(node);
        if (position) {
            return ParseError{message, context, position->first, position->second};
        }
        return ParseError{message, context};
    }

    SourceLocation location_of(const YAML::Node& node) {
        SourceLocation location;
        if (auto position = common::yaml::position_of(node)) {
            location.line = position->first;
            location.column = position->second;
        }
        return location;
    }

    std::optional<ParseError> expect_map(const YAML::Node& node,
                                         const std::vector<std::string>& allowed_keys,
                                         const std::string& context) {
        if (!node.IsMap()) {
            return error_at(node,
                std::string("Expected a mapping but found a ") + common::yaml::node_type_name(node),
                context);
        }
        if (auto unknown = common::yaml::find_unknown_key(node, allowed_keys)) {
            return error_at(node[*unknown], "Unknown key '" + *unknown + "'", context);
        }
        common::yaml::log_node_keys(node, context);
        return std::nullopt;
    }

    Result<std::string> required_string(const YAML::Node& parent,
                                        const std::string& key,
                                        const std::string& context) {
        const auto node = parent[key];
        if (!node) {
            return error_at(parent, "Missing required field '" + key + "'", context);
        }
        auto value = parser::yaml::scalar_as<std::string>(node);
        if (!value) {
            return error_at(node, "Field '" + key + "' must be a string", context + "." + key);
        }
        return *value;
    }

    Result<std::optional<std::string>> optional_string(const YAML::Node& parent,
                                                       const std::string& key,
                                                       const std::string& context) {
        const auto node = parent[key];
        if (!node) {
            return std::optional<std::string>{};
        }
        auto value = parser::yaml::scalar_as<std::string>(node);
        if (!value) {
            return error_at(node, "Field '" + key + "' must be a string", context + "." + key);
        }
        return value;
    }

    Result<std::optional<unsigned>> optional_unsigned(const YAML::Node& parent,
                                                      const std::string& key,
                                                      const std::string& context) {
        const auto node = parent[key];
        if (!node) {
            return std::optional<unsigned>{};
        }
        auto value = parser::yaml::scalar_as<unsigned>(node);
        if (!value) {
            return error_at(node, "Field '" + key + "' must be a non-negative integer",
                            context + "." + key);
        }
        return value;
    }

    Result<std::vector<std::string>> string_list(const YAML::Node& parent,
                                                 const std::string& key,
                                                 const std::string& context) {
        std::vector<std::string> values;
        const auto node = parent[key];
        if (!node) {
            return values;
        }
        if (!node.IsSequence()) {
            return error_at(node, "Field '" + key + "' must be a sequence of strings",
                            context + "." + key);
        }
        for (size_t i = 0; i < node.size(); ++i) {
            auto value = parser::yaml::scalar_as<std::string>(node[i]);
            if (!value) {
                return error_at(node[i], "Entries of '" + key + "' must be strings",
                                context + "." + key + "[" + std::to_string(i) + "]");
            }
            values.push_back(*value);
        }
        return values;
    }

    std::string indexed(const std::string& context, const std::string& key, size_t i) {
        return context + "." + key + "[" + std::to_string(i) + "]";
    }

    Result<std::vector<MappingNode>> create_mapping_list(const YAML::Node& node,
                                                         const std::string& context) {
        if (!node.IsSequence()) {
            return error_at(node, "Expected a sequence of mappings", context);
        }

        std::vector<MappingNode> mappings;
        std::set<std::string> seen;
        for (size_t i = 0; i < node.size(); ++i) {
            const auto child_context = context + "[" + std::to_string(i) + "]";
            auto mapping = detail::create_mapping_node(node[i], child_context);
            if (std::holds_alternative<ParseError>(mapping)) {
                return std::get<ParseError>(mapping);
            }
            auto& parsed = std::get<MappingNode>(mapping);
            if (!seen.insert(parsed.field).second) {
                return error_at(node[i], "Duplicate field '" + parsed.field + "' among siblings",
                                child_context);
            }
            mappings.push_back(std::move(parsed));
        }
        return mappings;
    }

    Result<JoinType> parse_join_type(const YAML::Node& node, const std::string& context) {
        auto text = parser::yaml::scalar_as<std::string>(node);
        if (!text) {
            return error_at(node, "Join type must be a string", context);
        }
        auto upper = common::utils::to_upper(common::utils::trim(*text));
        const std::string suffix = " JOIN";
        if (upper.size() > suffix.size() &&
            upper.compare(upper.size() - suffix.size(), suffix.size(), suffix) == 0) {
            upper = common::utils::trim(upper.substr(0, upper.size() - suffix.size()));
        }
        if (upper == "INNER") return JoinType::Inner;
        if (upper == "LEFT" || upper == "LEFT OUTER") return JoinType::Left;
        if (upper == "RIGHT" || upper == "RIGHT OUTER") return JoinType::Right;
        return error_at(node, "Unknown join type '" + *text + "'", context);
    }

    Result<std::optional<std::string>> optional_alias(const YAML::Node& node,
                                                      const std::string& context) {
        auto alias = optional_string(node, "alias", context);
        if (std::holds_alternative<ParseError>(alias)) {
            return std::get<ParseError>(alias);
        }
        const auto& value = std::get<std::optional<std::string>>(alias);
        if (value && !common::utils::is_identifier(*value)) {
            return error_at(node["alias"], "Alias '" + *value + "' is not a valid identifier",
                            context + ".alias");
        }
        return value;
    }

    Result<TransformCondition> create_condition(const YAML::Node& node, const std::string& context) {
        if (auto error = expect_map(node, CONDITION_KEYS, context)) {
            return *error;
        }

        TransformCondition condition;
        int subjects = 0;
        const std::pair<const char*, ConditionSubject> candidates[] = {
            {"param", ConditionSubject::Param},
            {"field", ConditionSubject::Field},
            {"source", ConditionSubject::Source}
        };
        for (const auto& [key, subject] : candidates) {
            if (!node[key]) continue;
            auto name = required_string(node, key, context);
            if (std::holds_alternative<ParseError>(name)) {
                return std::get<ParseError>(name);
            }
            condition.subject = subject;
            condition.name = std::get<std::string>(name);
            ++subjects;
        }
        if (subjects != 1) {
            return error_at(node, "Condition must reference exactly one of 'param', 'field' or 'source'",
                            context);
        }

        auto op = required_string(node, "operator", context);
        if (std::holds_alternative<ParseError>(op)) {
            return std::get<ParseError>(op);
        }
        condition.op = std::get<std::string>(op);

        auto value = required_string(node, "value", context);
        if (std::holds_alternative<ParseError>(value)) {
            return std::get<ParseError>(value);
        }
        condition.value = std::get<std::string>(value);
        return condition;
    }

    std::vector<std::string> transform_keys(const std::vector<std::string>& specific) {
        std::vector<std::string> keys = {"target", "type", "condition"};
        keys.insert(keys.end(), specific.begin(), specific.end());
        return keys;
    }

    std::optional<TransformType> transform_type_from(const std::string& name) {
        const auto upper = common::utils::to_upper(name);
        if (upper == "COALESCE") return TransformType::Coalesce;
        if (upper == "CONCAT") return TransformType::Concat;
        if (upper == "CASE") return TransformType::Case;
        if (upper == "MASK") return TransformType::Mask;
        if (upper == "CONDITIONAL_SOURCE") return TransformType::ConditionalSource;
        return std::nullopt;
    }

    Result<std::vector<std::string>> required_list(const YAML::Node& node,
                                                   const std::string& key,
                                                   const std::string& context) {
        if (!node[key]) {
            return error_at(node, "Missing required field '" + key + "'", context);
        }
        auto list = string_list(node, key, context);
        if (std::holds_alternative<ParseError>(list)) {
            return list;
        }
        if (std::get<std::vector<std::string>>(list).empty()) {
            return error_at(node[key], "Field '" + key + "' must not be empty", context + "." + key);
        }
        return list;
    }

    Result<std::vector<CaseBranch>> create_case_branches(const YAML::Node& node,
                                                         const std::string& context) {
        const auto when = node["when"];
        if (!when) {
            return error_at(node, "Missing required field 'when'", context);
        }
        if (!when.IsSequence() || when.size() == 0) {
            return error_at(when, "Field 'when' must be a non-empty sequence", context + ".when");
        }

        std::vector<CaseBranch> branches;
        for (size_t i = 0; i < when.size(); ++i) {
            const auto branch_context = indexed(context, "when", i);
            if (auto error = expect_map(when[i], CASE_BRANCH_KEYS, branch_context)) {
                return *error;
            }
            auto value = required_string(when[i], "value", branch_context);
            if (std::holds_alternative<ParseError>(value)) {
                return std::get<ParseError>(value);
            }
            auto then = required_string(when[i], "then", branch_context);
            if (std::holds_alternative<ParseError>(then)) {
                return std::get<ParseError>(then);
            }
            branches.push_back({std::get<std::string>(value), std::get<std::string>(then)});
        }
        return branches;
    }
}

Result<ColumnRef> parse_column_ref(const std::string& text, const std::string& context) {
    const auto trimmed = common::utils::trim(text);
    const auto parts = common::utils::split_string(trimmed, '.');
    if (parts.size() != 2 ||
        !common::utils::is_identifier(parts[0]) ||
        !common::utils::is_identifier(parts[1])) {
        return ParseError{"Expected a qualified column 'table.column' but found '" + text + "'",
                          context};
    }
    return ColumnRef{parts[0], parts[1]};
}

Result<JoinCondition> parse_join_condition(const std::string& text, const std::string& context) {
    const auto eq = text.find('=');
    if (eq == std::string::npos || text.find('=', eq + 1) != std::string::npos ||
        (eq > 0 && (text[eq - 1] == '!' || text[eq - 1] == '<' || text[eq - 1] == '>'))) {
        return ParseError{"Join condition must be a single equality 'a.x = b.y' but found '" +
                          text + "'", context};
    }

    auto left = parse_column_ref(text.substr(0, eq), context);
    if (std::holds_alternative<ParseError>(left)) {
        return std::get<ParseError>(left);
    }
    auto right = parse_column_ref(text.substr(eq + 1), context);
    if (std::holds_alternative<ParseError>(right)) {
        return std::get<ParseError>(right);
    }
    return JoinCondition{std::get<ColumnRef>(left), std::get<ColumnRef>(right)};
}

Result<Document> parse_document(const std::string& content) {
    auto yaml_result = parser::yaml::parse(content);
    if (std::holds_alternative<parser::yaml::Error>(yaml_result)) {
        const auto& error = std::get<parser::yaml::Error>(yaml_result);
        return ParseError{error.message, std::nullopt, error.line, error.column};
    }
    return create_document(std::get<YAML::Node>(yaml_result));
}

Result<Document> parse_document_file(const std::string& file_path) {
    auto yaml_result = parser::yaml::parse_file(file_path);
    if (std::holds_alternative<parser::yaml::Error>(yaml_result)) {
        const auto& error = std::get<parser::yaml::Error>(yaml_result);
        return ParseError{error.message, file_path, error.line, error.column};
    }
    return create_document(std::get<YAML::Node>(yaml_result));
}

Result<Document> create_document(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return ParseError{"Mapping document is empty"};
    }

    try {
        if (auto error = expect_map(root, ROOT_KEYS, "document")) {
            return *error;
        }

        Document doc;

        auto version = required_string(root, "version", "document");
        if (std::holds_alternative<ParseError>(version)) {
            return std::get<ParseError>(version);
        }
        doc.version = std::get<std::string>(version);
        if (doc.version != SUPPORTED_VERSION) {
            return error_at(root["version"],
                "Unsupported version: expected '" + std::string(SUPPORTED_VERSION) +
                "', got '" + doc.version + "'", "version");
        }

        // import
        const auto imports = root["import"];
        if (!imports) {
            return error_at(root, "Missing required field 'import'", "document");
        }
        if (auto error = expect_map(imports, IMPORT_KEYS, "import")) {
            return *error;
        }

        auto openapi = required_string(imports, "openapi", "import");
        if (std::holds_alternative<ParseError>(openapi)) {
            return std::get<ParseError>(openapi);
        }
        auto api_ref = reference::parse_api_ref(std::get<std::string>(openapi));
        if (std::holds_alternative<reference::Error>(api_ref)) {
            return error_at(imports["openapi"], std::get<reference::Error>(api_ref).message,
                            "import.openapi");
        }
        doc.import_api = std::get<ApiRef>(api_ref);

        auto dbml = string_list(imports, "dbml", "import");
        if (std::holds_alternative<ParseError>(dbml)) {
            return std::get<ParseError>(dbml);
        }
        const auto& dbml_refs = std::get<std::vector<std::string>>(dbml);
        for (size_t i = 0; i < dbml_refs.size(); ++i) {
            auto table_ref = reference::parse_table_ref(dbml_refs[i]);
            if (std::holds_alternative<reference::Error>(table_ref)) {
                return error_at(imports["dbml"][i], std::get<reference::Error>(table_ref).message,
                                indexed("import", "dbml", i));
            }
            doc.import_tables.push_back(std::get<TableRef>(table_ref));
        }

        // usecase
        const auto usecase = root["usecase"];
        if (!usecase) {
            return error_at(root, "Missing required field 'usecase'", "document");
        }
        if (auto error = expect_map(usecase, USECASE_KEYS, "usecase")) {
            return *error;
        }

        auto name = required_string(usecase, "name", "usecase");
        if (std::holds_alternative<ParseError>(name)) {
            return std::get<ParseError>(name);
        }
        doc.usecase_name = std::get<std::string>(name);

        auto summary = optional_string(usecase, "summary", "usecase");
        if (std::holds_alternative<ParseError>(summary)) {
            return std::get<ParseError>(summary);
        }
        doc.usecase_summary = std::get<std::optional<std::string>>(summary);

        auto output = optional_string(usecase, "output", "usecase");
        if (std::holds_alternative<ParseError>(output)) {
            return std::get<ParseError>(output);
        }
        doc.output_name = std::get<std::optional<std::string>>(output);

        if (!usecase["response_mapping"]) {
            return error_at(usecase, "Missing required field 'response_mapping'", "usecase");
        }
        auto mappings = create_mapping_list(usecase["response_mapping"], "usecase.response_mapping");
        if (std::holds_alternative<ParseError>(mappings)) {
            return std::get<ParseError>(mappings);
        }
        doc.response_mappings = std::move(std::get<std::vector<MappingNode>>(mappings));

        if (const auto filters = usecase["filters"]) {
            if (!filters.IsSequence()) {
                return error_at(filters, "Field 'filters' must be a sequence", "usecase.filters");
            }
            for (size_t i = 0; i < filters.size(); ++i) {
                auto filter = detail::create_filter(filters[i], indexed("usecase", "filters", i));
                if (std::holds_alternative<ParseError>(filter)) {
                    return std::get<ParseError>(filter);
                }
                doc.filters.push_back(std::move(std::get<Filter>(filter)));
            }
        }

        if (const auto transforms = usecase["transforms"]) {
            if (!transforms.IsSequence()) {
                return error_at(transforms, "Field 'transforms' must be a sequence", "usecase.transforms");
            }
            for (size_t i = 0; i < transforms.size(); ++i) {
                auto transform = detail::create_transform(transforms[i],
                                                          indexed("usecase", "transforms", i));
                if (std::holds_alternative<ParseError>(transform)) {
                    return std::get<ParseError>(transform);
                }
                doc.transforms.push_back(std::move(std::get<Transform>(transform)));
            }
        }

        common::log::debug("Parsed usecase '" + doc.usecase_name + "' with " +
                           std::to_string(doc.response_mappings.size()) + " top-level mappings");
        return doc;
    } catch (const YAML::Exception& e) {
        return ParseError{"YAML error while reading document: " + std::string(e.what()),
                          std::nullopt,
                          static_cast<size_t>(e.mark.line) + 1,
                          static_cast<size_t>(e.mark.column) + 1};
    }
}

namespace detail {

Result<MappingNode> create_mapping_node(const YAML::Node& node, const std::string& context) {
    if (auto error = expect_map(node, MAPPING_KEYS, context)) {
        return *error;
    }

    MappingNode mapping;
    mapping.location = location_of(node);

    auto field = required_string(node, "field", context);
    if (std::holds_alternative<ParseError>(field)) {
        return std::get<ParseError>(field);
    }
    mapping.field = std::get<std::string>(field);
    if (mapping.field.empty()) {
        return error_at(node["field"], "Field name must not be empty", context + ".field");
    }

    auto type = optional_string(node, "type", context);
    if (std::holds_alternative<ParseError>(type)) {
        return std::get<ParseError>(type);
    }
    const auto& type_name = std::get<std::optional<std::string>>(type);
    MappingKind kind = MappingKind::Scalar;
    if (type_name) {
        const auto lower = common::utils::to_lower(*type_name);
        if (lower == "array") {
            kind = MappingKind::Array;
        } else if (lower != "scalar") {
            return error_at(node["type"], "Unknown mapping type '" + *type_name + "'",
                            context + ".type");
        }
    }

    if (kind == MappingKind::Scalar) {
        if (node["source_table"] || node["fields"]) {
            return error_at(node, "'source_table' and 'fields' are only valid for array mappings",
                            context);
        }
        auto source_text = required_string(node, "source", context);
        if (std::holds_alternative<ParseError>(source_text)) {
            return std::get<ParseError>(source_text);
        }
        auto source = parse_column_ref(std::get<std::string>(source_text), context + ".source");
        if (std::holds_alternative<ParseError>(source)) {
            return error_at(node["source"], std::get<ParseError>(source).message, context + ".source");
        }
        mapping.body = ScalarMapping{std::get<ColumnRef>(source)};
    } else {
        if (node["source"]) {
            return error_at(node["source"], "Array mappings take 'source_table', not 'source'",
                            context + ".source");
        }
        ArrayMapping array;
        auto source_table = required_string(node, "source_table", context);
        if (std::holds_alternative<ParseError>(source_table)) {
            return std::get<ParseError>(source_table);
        }
        array.source_table = std::get<std::string>(source_table);

        const auto fields = node["fields"];
        if (!fields || !fields.IsSequence() || fields.size() == 0) {
            return error_at(node, "Array mapping '" + mapping.field + "' must declare its 'fields'",
                            context);
        }
        auto children = create_mapping_list(fields, context + ".fields");
        if (std::holds_alternative<ParseError>(children)) {
            return std::get<ParseError>(children);
        }
        array.children = std::move(std::get<std::vector<MappingNode>>(children));
        mapping.body = std::move(array);
    }

    if (node["join"]) {
        auto join = create_join(node["join"], context + ".join");
        if (std::holds_alternative<ParseError>(join)) {
            return std::get<ParseError>(join);
        }
        mapping.join = std::get<JoinSpec>(join);
    }

    if (const auto chain = node["join_chain"]) {
        if (!mapping.join) {
            return error_at(chain, "'join_chain' requires a primary 'join'", context + ".join_chain");
        }
        if (!chain.IsSequence()) {
            return error_at(chain, "Field 'join_chain' must be a sequence", context + ".join_chain");
        }
        for (size_t i = 0; i < chain.size(); ++i) {
            auto link = create_join_link(chain[i], indexed(context, "join_chain", i));
            if (std::holds_alternative<ParseError>(link)) {
                return std::get<ParseError>(link);
            }
            mapping.join_chain.push_back(std::get<JoinLink>(link));
        }
    }

    if (node["aggregate"]) {
        auto aggregate = create_aggregate(node["aggregate"], context + ".aggregate");
        if (std::holds_alternative<ParseError>(aggregate)) {
            return std::get<ParseError>(aggregate);
        }
        mapping.aggregate = std::get<AggregateSpec>(aggregate);
    }

    return mapping;
}

Result<JoinSpec> create_join(const YAML::Node& node, const std::string& context) {
    if (auto error = expect_map(node, JOIN_KEYS, context)) {
        return *error;
    }

    JoinSpec join;
    join.location = location_of(node);

    auto table = required_string(node, "table", context);
    if (std::holds_alternative<ParseError>(table)) {
        return std::get<ParseError>(table);
    }
    join.table = std::get<std::string>(table);

    auto alias = optional_alias(node, context);
    if (std::holds_alternative<ParseError>(alias)) {
        return std::get<ParseError>(alias);
    }
    join.alias = std::get<std::optional<std::string>>(alias);

    auto on = required_string(node, "on", context);
    if (std::holds_alternative<ParseError>(on)) {
        return std::get<ParseError>(on);
    }
    auto condition = parse_join_condition(std::get<std::string>(on), context + ".on");
    if (std::holds_alternative<ParseError>(condition)) {
        return error_at(node["on"], std::get<ParseError>(condition).message, context + ".on");
    }
    join.on = std::get<JoinCondition>(condition);

    if (node["type"]) {
        auto type = parse_join_type(node["type"], context + ".type");
        if (std::holds_alternative<ParseError>(type)) {
            return std::get<ParseError>(type);
        }
        join.type = std::get<JoinType>(type);
    }

    return join;
}

Result<JoinLink> create_join_link(const YAML::Node& node, const std::string& context) {
    if (auto error = expect_map(node, JOIN_LINK_KEYS, context)) {
        return *error;
    }

    JoinLink link;
    link.location = location_of(node);

    auto table = required_string(node, "table", context);
    if (std::holds_alternative<ParseError>(table)) {
        return std::get<ParseError>(table);
    }
    link.table = std::get<std::string>(table);

    auto alias = optional_alias(node, context);
    if (std::holds_alternative<ParseError>(alias)) {
        return std::get<ParseError>(alias);
    }
    link.alias = std::get<std::optional<std::string>>(alias);

    auto on = required_string(node, "on", context);
    if (std::holds_alternative<ParseError>(on)) {
        return std::get<ParseError>(on);
    }
    auto condition = parse_join_condition(std::get<std::string>(on), context + ".on");
    if (std::holds_alternative<ParseError>(condition)) {
        return error_at(node["on"], std::get<ParseError>(condition).message, context + ".on");
    }
    link.on = std::get<JoinCondition>(condition);

    return link;
}

Result<AggregateSpec> create_aggregate(const YAML::Node& node, const std::string& context) {
    if (auto error = expect_map(node, AGGREGATE_KEYS, context)) {
        return *error;
    }

    AggregateSpec aggregate;
    auto type = required_string(node, "type", context);
    if (std::holds_alternative<ParseError>(type)) {
        return std::get<ParseError>(type);
    }
    aggregate.type_name = std::get<std::string>(type);

    const auto upper = common::utils::to_upper(aggregate.type_name);
    if (upper == "COUNT") aggregate.type = AggregateType::Count;
    else if (upper == "SUM") aggregate.type = AggregateType::Sum;
    else if (upper == "AVG") aggregate.type = AggregateType::Avg;
    else if (upper == "MIN") aggregate.type = AggregateType::Min;
    else if (upper == "MAX") aggregate.type = AggregateType::Max;
    else aggregate.type = AggregateType::Unknown;

    auto group_by = optional_string(node, "group_by", context);
    if (std::holds_alternative<ParseError>(group_by)) {
        return std::get<ParseError>(group_by);
    }
    if (const auto& text = std::get<std::optional<std::string>>(group_by)) {
        auto column = parse_column_ref(*text, context + ".group_by");
        if (std::holds_alternative<ParseError>(column)) {
            return error_at(node["group_by"], std::get<ParseError>(column).message,
                            context + ".group_by");
        }
        aggregate.group_by = std::get<ColumnRef>(column);
    }

    return aggregate;
}

Result<Filter> create_filter(const YAML::Node& node, const std::string& context) {
    if (!node.IsMap()) {
        return error_at(node, "Filter must be a mapping", context);
    }

    Filter filter;
    filter.location = location_of(node);

    auto param = required_string(node, "param", context);
    if (std::holds_alternative<ParseError>(param)) {
        return std::get<ParseError>(param);
    }
    filter.param = std::get<std::string>(param);

    auto maps_to = required_string(node, "maps_to", context);
    if (std::holds_alternative<ParseError>(maps_to)) {
        return std::get<ParseError>(maps_to);
    }
    const auto target = common::utils::to_upper(std::get<std::string>(maps_to));

    if (target == "WHERE") {
        if (auto error = expect_map(node, WHERE_KEYS, context)) {
            return *error;
        }
        auto condition = required_string(node, "condition", context);
        if (std::holds_alternative<ParseError>(condition)) {
            return std::get<ParseError>(condition);
        }
        filter.payload = WhereFilter{std::get<std::string>(condition)};
    } else if (target == "PAGINATION") {
        if (auto error = expect_map(node, PAGINATION_KEYS, context)) {
            return *error;
        }
        PaginationFilter pagination;

        auto strategy = optional_string(node, "strategy", context);
        if (std::holds_alternative<ParseError>(strategy)) {
            return std::get<ParseError>(strategy);
        }
        if (const auto& name = std::get<std::optional<std::string>>(strategy)) {
            const auto lower = common::utils::to_lower(*name);
            if (lower == "offset") {
                pagination.strategy = PaginationStrategy::Offset;
            } else if (lower == "cursor") {
                pagination.strategy = PaginationStrategy::Cursor;
            } else {
                return error_at(node["strategy"], "Unknown pagination strategy '" + *name + "'",
                                context + ".strategy");
            }
        }

        auto page_size = optional_unsigned(node, "page_size", context);
        if (std::holds_alternative<ParseError>(page_size)) {
            return std::get<ParseError>(page_size);
        }
        pagination.page_size = std::get<std::optional<unsigned>>(page_size);

        auto max_page_size = optional_unsigned(node, "max_page_size", context);
        if (std::holds_alternative<ParseError>(max_page_size)) {
            return std::get<ParseError>(max_page_size);
        }
        pagination.max_page_size = std::get<std::optional<unsigned>>(max_page_size);

        auto limit_param = optional_string(node, "limit_param", context);
        if (std::holds_alternative<ParseError>(limit_param)) {
            return std::get<ParseError>(limit_param);
        }
        pagination.limit_param = std::get<std::optional<std::string>>(limit_param);

        auto cursor_field = optional_string(node, "cursor_field", context);
        if (std::holds_alternative<ParseError>(cursor_field)) {
            return std::get<ParseError>(cursor_field);
        }
        pagination.cursor_field = std::get<std::optional<std::string>>(cursor_field);

        filter.payload = pagination;
    } else if (target == "ORDER_BY") {
        if (auto error = expect_map(node, ORDER_BY_KEYS, context)) {
            return *error;
        }
        OrderByFilter order_by;

        auto default_column = optional_string(node, "default_column", context);
        if (std::holds_alternative<ParseError>(default_column)) {
            return std::get<ParseError>(default_column);
        }
        order_by.default_column = std::get<std::optional<std::string>>(default_column);

        auto default_direction = optional_string(node, "default_direction", context);
        if (std::holds_alternative<ParseError>(default_direction)) {
            return std::get<ParseError>(default_direction);
        }
        order_by.default_direction = std::get<std::optional<std::string>>(default_direction);

        auto allowed_columns = string_list(node, "allowed_columns", context);
        if (std::holds_alternative<ParseError>(allowed_columns)) {
            return std::get<ParseError>(allowed_columns);
        }
        order_by.allowed_columns = std::get<std::vector<std::string>>(allowed_columns);

        auto allowed_directions = string_list(node, "allowed_directions", context);
        if (std::holds_alternative<ParseError>(allowed_directions)) {
            return std::get<ParseError>(allowed_directions);
        }
        order_by.allowed_directions = std::get<std::vector<std::string>>(allowed_directions);

        filter.payload = order_by;
    } else {
        return error_at(node["maps_to"],
            "Unknown filter target '" + std::get<std::string>(maps_to) +
            "' (expected WHERE, PAGINATION or ORDER_BY)", context + ".maps_to");
    }

    return filter;
}

Result<Transform> create_transform(const YAML::Node& node, const std::string& context) {
    if (!node.IsMap()) {
        return error_at(node, "Transform must be a mapping", context);
    }

    Transform transform;
    transform.location = location_of(node);

    auto target = required_string(node, "target", context);
    if (std::holds_alternative<ParseError>(target)) {
        return std::get<ParseError>(target);
    }
    transform.target = std::get<std::string>(target);

    auto type = required_string(node, "type", context);
    if (std::holds_alternative<ParseError>(type)) {
        return std::get<ParseError>(type);
    }
    const auto& type_name = std::get<std::string>(type);
    const auto known_type = transform_type_from(type_name);

    if (!known_type) {
        // Unknown kinds are kept verbatim and reported by the validator
        common::log::debug("Keeping transform of unknown type '" + type_name + "' for " +
                           transform.target);
        transform.payload = UnknownPayload{type_name};
    } else {
        switch (*known_type) {
            case TransformType::Coalesce: {
                if (auto error = expect_map(node, transform_keys({"sources", "fallback"}), context)) {
                    return *error;
                }
                CoalescePayload payload;
                auto sources = required_list(node, "sources", context);
                if (std::holds_alternative<ParseError>(sources)) {
                    return std::get<ParseError>(sources);
                }
                payload.sources = std::get<std::vector<std::string>>(sources);
                auto fallback = optional_string(node, "fallback", context);
                if (std::holds_alternative<ParseError>(fallback)) {
                    return std::get<ParseError>(fallback);
                }
                payload.fallback = std::get<std::optional<std::string>>(fallback);
                transform.payload = payload;
                break;
            }
            case TransformType::Concat: {
                if (auto error = expect_map(node, transform_keys({"sources", "separator"}), context)) {
                    return *error;
                }
                ConcatPayload payload;
                auto sources = required_list(node, "sources", context);
                if (std::holds_alternative<ParseError>(sources)) {
                    return std::get<ParseError>(sources);
                }
                payload.sources = std::get<std::vector<std::string>>(sources);
                auto separator = optional_string(node, "separator", context);
                if (std::holds_alternative<ParseError>(separator)) {
                    return std::get<ParseError>(separator);
                }
                payload.separator = std::get<std::optional<std::string>>(separator);
                transform.payload = payload;
                break;
            }
            case TransformType::Case: {
                if (auto error = expect_map(node, transform_keys({"source", "when", "else_value"}), context)) {
                    return *error;
                }
                CasePayload payload;
                auto source = required_string(node, "source", context);
                if (std::holds_alternative<ParseError>(source)) {
                    return std::get<ParseError>(source);
                }
                payload.source = std::get<std::string>(source);
                auto branches = create_case_branches(node, context);
                if (std::holds_alternative<ParseError>(branches)) {
                    return std::get<ParseError>(branches);
                }
                payload.branches = std::get<std::vector<CaseBranch>>(branches);
                auto else_value = optional_string(node, "else_value", context);
                if (std::holds_alternative<ParseError>(else_value)) {
                    return std::get<ParseError>(else_value);
                }
                payload.else_value = std::get<std::optional<std::string>>(else_value);
                transform.payload = payload;
                break;
            }
            case TransformType::Mask: {
                if (auto error = expect_map(node, transform_keys({"source", "mask_pattern"}), context)) {
                    return *error;
                }
                MaskPayload payload;
                auto source = required_string(node, "source", context);
                if (std::holds_alternative<ParseError>(source)) {
                    return std::get<ParseError>(source);
                }
                payload.source = std::get<std::string>(source);
                auto pattern = optional_string(node, "mask_pattern", context);
                if (std::holds_alternative<ParseError>(pattern)) {
                    return std::get<ParseError>(pattern);
                }
                payload.mask_pattern = std::get<std::optional<std::string>>(pattern);
                transform.payload = payload;
                break;
            }
            case TransformType::ConditionalSource: {
                if (auto error = expect_map(node, transform_keys({"then_source", "else_source"}), context)) {
                    return *error;
                }
                ConditionalSourcePayload payload;
                auto then_source = required_string(node, "then_source", context);
                if (std::holds_alternative<ParseError>(then_source)) {
                    return std::get<ParseError>(then_source);
                }
                payload.then_source = std::get<std::string>(then_source);
                auto else_source = required_string(node, "else_source", context);
                if (std::holds_alternative<ParseError>(else_source)) {
                    return std::get<ParseError>(else_source);
                }
                payload.else_source = std::get<std::string>(else_source);
                if (!node["condition"]) {
                    return error_at(node, "CONDITIONAL_SOURCE requires a 'condition'", context);
                }
                transform.payload = payload;
                break;
            }
            case TransformType::Unknown:
                break;
        }
    }

    if (const auto conditions = node["condition"]) {
        if (!conditions.IsSequence()) {
            return error_at(conditions, "Field 'condition' must be a sequence", context + ".condition");
        }
        for (size_t i = 0; i < conditions.size(); ++i) {
            auto condition = create_condition(conditions[i], indexed(context, "condition", i));
            if (std::holds_alternative<ParseError>(condition)) {
                return std::get<ParseError>(condition);
            }
            transform.conditions.push_back(std::get<TransformCondition>(condition));
        }
    }

    return transform;
}

} // namespace detail
} // namespace parser::usml
