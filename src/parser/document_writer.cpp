#include "parser/document_writer.hpp"
#include <yaml-cpp/yaml.h>

namespace parser::usml {

namespace {

    void emit_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& value) {
        if (value) {
            out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << *value;
        }
    }

    void emit_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& values) {
        out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
        for (const auto& value : values) {
            out << YAML::DoubleQuoted << value;
        }
        out << YAML::EndSeq;
    }

    void emit_mapping(YAML::Emitter& out, const MappingNode& node) {
        out << YAML::BeginMap;
        out << YAML::Key << "field" << YAML::Value << YAML::DoubleQuoted << node.field;

        if (const auto* scalar = node.scalar()) {
            out << YAML::Key << "source" << YAML::Value << scalar->source.to_string();
        } else {
            out << YAML::Key << "type" << YAML::Value << "array";
            out << YAML::Key << "source_table" << YAML::Value << node.array()->source_table;
        }

        if (node.join) {
            const auto& join = *node.join;
            out << YAML::Key << "join" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "table" << YAML::Value << join.table;
            if (join.alias) {
                out << YAML::Key << "alias" << YAML::Value << *join.alias;
            }
            out << YAML::Key << "on" << YAML::Value << join.on.to_string();
            out << YAML::Key << "type" << YAML::Value << to_string(join.type);
            out << YAML::EndMap;
        }

        if (!node.join_chain.empty()) {
            out << YAML::Key << "join_chain" << YAML::Value << YAML::BeginSeq;
            for (const auto& link : node.join_chain) {
                out << YAML::BeginMap;
                out << YAML::Key << "table" << YAML::Value << link.table;
                if (link.alias) {
                    out << YAML::Key << "alias" << YAML::Value << *link.alias;
                }
                out << YAML::Key << "on" << YAML::Value << link.on.to_string();
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        }

        if (node.aggregate) {
            out << YAML::Key << "aggregate" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "type" << YAML::Value << YAML::DoubleQuoted << node.aggregate->type_name;
            if (node.aggregate->group_by) {
                out << YAML::Key << "group_by" << YAML::Value << node.aggregate->group_by->to_string();
            }
            out << YAML::EndMap;
        }

        if (const auto* array = node.array()) {
            out << YAML::Key << "fields" << YAML::Value << YAML::BeginSeq;
            for (const auto& child : array->children) {
                emit_mapping(out, child);
            }
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;
    }

    void emit_filter(YAML::Emitter& out, const Filter& filter) {
        out << YAML::BeginMap;
        out << YAML::Key << "param" << YAML::Value << YAML::DoubleQuoted << filter.param;
        out << YAML::Key << "maps_to" << YAML::Value << to_string(filter.maps_to());

        if (const auto* where = std::get_if<WhereFilter>(&filter.payload)) {
            out << YAML::Key << "condition" << YAML::Value << YAML::DoubleQuoted << where->condition;
        } else if (const auto* pagination = std::get_if<PaginationFilter>(&filter.payload)) {
            out << YAML::Key << "strategy" << YAML::Value << to_string(pagination->strategy);
            if (pagination->page_size) {
                out << YAML::Key << "page_size" << YAML::Value << *pagination->page_size;
            }
            emit_optional(out, "limit_param", pagination->limit_param);
            if (pagination->max_page_size) {
                out << YAML::Key << "max_page_size" << YAML::Value << *pagination->max_page_size;
            }
            emit_optional(out, "cursor_field", pagination->cursor_field);
        } else if (const auto* order_by = std::get_if<OrderByFilter>(&filter.payload)) {
            emit_optional(out, "default_column", order_by->default_column);
            emit_optional(out, "default_direction", order_by->default_direction);
            if (!order_by->allowed_columns.empty()) {
                emit_list(out, "allowed_columns", order_by->allowed_columns);
            }
            if (!order_by->allowed_directions.empty()) {
                emit_list(out, "allowed_directions", order_by->allowed_directions);
            }
        }
        out << YAML::EndMap;
    }

    struct PayloadEmitter {
        YAML::Emitter& out;

        void operator()(const CoalescePayload& payload) const {
            emit_list(out, "sources", payload.sources);
            emit_optional(out, "fallback", payload.fallback);
        }
        void operator()(const ConcatPayload& payload) const {
            emit_list(out, "sources", payload.sources);
            emit_optional(out, "separator", payload.separator);
        }
        void operator()(const CasePayload& payload) const {
            out << YAML::Key << "source" << YAML::Value << YAML::DoubleQuoted << payload.source;
            out << YAML::Key << "when" << YAML::Value << YAML::BeginSeq;
            for (const auto& branch : payload.branches) {
                out << YAML::BeginMap;
                out << YAML::Key << "value" << YAML::Value << YAML::DoubleQuoted << branch.value;
                out << YAML::Key << "then" << YAML::Value << YAML::DoubleQuoted << branch.then;
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
            emit_optional(out, "else_value", payload.else_value);
        }
        void operator()(const MaskPayload& payload) const {
            out << YAML::Key << "source" << YAML::Value << YAML::DoubleQuoted << payload.source;
            emit_optional(out, "mask_pattern", payload.mask_pattern);
        }
        void operator()(const ConditionalSourcePayload& payload) const {
            out << YAML::Key << "then_source" << YAML::Value << YAML::DoubleQuoted << payload.then_source;
            out << YAML::Key << "else_source" << YAML::Value << YAML::DoubleQuoted << payload.else_source;
        }
        void operator()(const UnknownPayload&) const {}
    };

    void emit_transform(YAML::Emitter& out, const Transform& transform) {
        out << YAML::BeginMap;
        out << YAML::Key << "target" << YAML::Value << YAML::DoubleQuoted << transform.target;
        if (const auto* unknown = std::get_if<UnknownPayload>(&transform.payload)) {
            out << YAML::Key << "type" << YAML::Value << YAML::DoubleQuoted << unknown->type_name;
        } else {
            out << YAML::Key << "type" << YAML::Value << to_string(transform.type());
        }
        std::visit(PayloadEmitter{out}, transform.payload);

        if (!transform.conditions.empty()) {
            out << YAML::Key << "condition" << YAML::Value << YAML::BeginSeq;
            for (const auto& condition : transform.conditions) {
                out << YAML::BeginMap;
                out << YAML::Key << to_string(condition.subject)
                    << YAML::Value << YAML::DoubleQuoted << condition.name;
                out << YAML::Key << "operator" << YAML::Value << YAML::DoubleQuoted << condition.op;
                out << YAML::Key << "value" << YAML::Value << YAML::DoubleQuoted << condition.value;
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;
    }
}

std::string write_document(const Document& doc) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << doc.version;

    out << YAML::Key << "import" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "openapi" << YAML::Value << YAML::SingleQuoted
        << reference::format_api_ref(doc.import_api);
    if (!doc.import_tables.empty()) {
        out << YAML::Key << "dbml" << YAML::Value << YAML::BeginSeq;
        for (const auto& table : doc.import_tables) {
            out << YAML::SingleQuoted << reference::format_table_ref(table);
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    out << YAML::Key << "usecase" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << doc.usecase_name;
    emit_optional(out, "summary", doc.usecase_summary);
    emit_optional(out, "output", doc.output_name);

    out << YAML::Key << "response_mapping" << YAML::Value << YAML::BeginSeq;
    for (const auto& mapping : doc.response_mappings) {
        emit_mapping(out, mapping);
    }
    out << YAML::EndSeq;

    if (!doc.filters.empty()) {
        out << YAML::Key << "filters" << YAML::Value << YAML::BeginSeq;
        for (const auto& filter : doc.filters) {
            emit_filter(out, filter);
        }
        out << YAML::EndSeq;
    }

    if (!doc.transforms.empty()) {
        out << YAML::Key << "transforms" << YAML::Value << YAML::BeginSeq;
        for (const auto& transform : doc.transforms) {
            emit_transform(out, transform);
        }
        out << YAML::EndSeq;
    }

    out << YAML::EndMap;
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace parser::usml
