#ifndef USML_DOCUMENT_HPP
#define USML_DOCUMENT_HPP

#include "parser/reference.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace parser::usml {

using reference::ApiRef;
using reference::TableRef;

// Position in the mapping file, one-based. Never part of equality.
struct SourceLocation {
    size_t line{0};
    size_t column{0};
};

// Qualified column reference "table.column" (the qualifier may be an alias)
struct ColumnRef {
    std::string table;
    std::string column;

    std::string to_string() const { return table + "." + column; }

    bool operator==(const ColumnRef& other) const {
        return table == other.table && column == other.column;
    }
    bool operator!=(const ColumnRef& other) const { return !(*this == other); }
};

// Binary equality "left = right" used by join conditions
struct JoinCondition {
    ColumnRef left;
    ColumnRef right;

    std::string to_string() const { return left.to_string() + " = " + right.to_string(); }

    // Symmetric: "a.x = b.y" matches "b.y = a.x"
    bool same_as(const JoinCondition& other) const {
        return (left == other.left && right == other.right) ||
               (left == other.right && right == other.left);
    }

    bool operator==(const JoinCondition& other) const {
        return left == other.left && right == other.right;
    }
    bool operator!=(const JoinCondition& other) const { return !(*this == other); }
};

enum class JoinType {
    Inner,
    Left,
    Right
};

struct JoinSpec {
    std::string table;
    std::optional<std::string> alias;
    JoinCondition on;
    JoinType type{JoinType::Left};
    SourceLocation location;

    // Name the joined table is visible under
    const std::string& binding_name() const { return alias ? *alias : table; }

    bool operator==(const JoinSpec& other) const {
        return table == other.table && alias == other.alias &&
               on == other.on && type == other.type;
    }
    bool operator!=(const JoinSpec& other) const { return !(*this == other); }
};

struct JoinLink {
    std::string table;
    std::optional<std::string> alias;
    JoinCondition on;
    SourceLocation location;

    const std::string& binding_name() const { return alias ? *alias : table; }

    bool operator==(const JoinLink& other) const {
        return table == other.table && alias == other.alias && on == other.on;
    }
};

enum class AggregateType {
    Count,
    Sum,
    Avg,
    Min,
    Max,
    Unknown
};

struct AggregateSpec {
    AggregateType type{AggregateType::Count};
    std::string type_name;  // as written, kept for Unknown
    std::optional<ColumnRef> group_by;

    bool operator==(const AggregateSpec& other) const {
        return type == other.type && type_name == other.type_name &&
               group_by == other.group_by;
    }
    bool operator!=(const AggregateSpec& other) const { return !(*this == other); }
};

enum class MappingKind {
    Scalar,
    Array
};

struct MappingNode;

struct ScalarMapping {
    ColumnRef source;
};

struct ArrayMapping {
    std::string source_table;
    std::vector<MappingNode> children;
};

struct MappingNode {
    std::string field;
    std::variant<ScalarMapping, ArrayMapping> body;
    std::optional<JoinSpec> join;
    std::vector<JoinLink> join_chain;
    std::optional<AggregateSpec> aggregate;
    SourceLocation location;

    MappingKind kind() const {
        return std::holds_alternative<ArrayMapping>(body) ? MappingKind::Array : MappingKind::Scalar;
    }

    const ScalarMapping* scalar() const { return std::get_if<ScalarMapping>(&body); }
    const ArrayMapping* array() const { return std::get_if<ArrayMapping>(&body); }

    // Table reached by the join tail, if the node joins at all
    std::optional<std::string> join_tail_table() const;
    // Binding name (alias or table) of the join tail
    std::optional<std::string> join_tail_binding() const;

    bool operator==(const MappingNode& other) const;
    bool operator!=(const MappingNode& other) const { return !(*this == other); }
};

enum class FilterTarget {
    Where,
    Pagination,
    OrderBy
};

struct WhereFilter {
    std::string condition;

    bool operator==(const WhereFilter& other) const { return condition == other.condition; }
};

enum class PaginationStrategy {
    Offset,
    Cursor
};

struct PaginationFilter {
    PaginationStrategy strategy{PaginationStrategy::Offset};
    std::optional<unsigned> page_size;
    std::optional<std::string> limit_param;
    std::optional<unsigned> max_page_size;
    std::optional<std::string> cursor_field;

    bool operator==(const PaginationFilter& other) const {
        return strategy == other.strategy && page_size == other.page_size &&
               limit_param == other.limit_param && max_page_size == other.max_page_size &&
               cursor_field == other.cursor_field;
    }
};

struct OrderByFilter {
    std::optional<std::string> default_column;
    std::optional<std::string> default_direction;
    std::vector<std::string> allowed_columns;
    std::vector<std::string> allowed_directions;

    bool operator==(const OrderByFilter& other) const {
        return default_column == other.default_column &&
               default_direction == other.default_direction &&
               allowed_columns == other.allowed_columns &&
               allowed_directions == other.allowed_directions;
    }
};

struct Filter {
    std::string param;
    std::variant<WhereFilter, PaginationFilter, OrderByFilter> payload;
    SourceLocation location;

    FilterTarget maps_to() const {
        switch (payload.index()) {
            case 0: return FilterTarget::Where;
            case 1: return FilterTarget::Pagination;
            default: return FilterTarget::OrderBy;
        }
    }

    bool operator==(const Filter& other) const {
        return param == other.param && payload == other.payload;
    }
};

enum class TransformType {
    Coalesce,
    Concat,
    Case,
    Mask,
    ConditionalSource,
    Unknown
};

struct CoalescePayload {
    std::vector<std::string> sources;
    std::optional<std::string> fallback;

    bool operator==(const CoalescePayload& other) const {
        return sources == other.sources && fallback == other.fallback;
    }
};

struct ConcatPayload {
    std::vector<std::string> sources;
    std::optional<std::string> separator;

    bool operator==(const ConcatPayload& other) const {
        return sources == other.sources && separator == other.separator;
    }
};

struct CaseBranch {
    std::string value;
    std::string then;

    bool operator==(const CaseBranch& other) const {
        return value == other.value && then == other.then;
    }
};

struct CasePayload {
    std::string source;
    std::vector<CaseBranch> branches;
    std::optional<std::string> else_value;

    bool operator==(const CasePayload& other) const {
        return source == other.source && branches == other.branches &&
               else_value == other.else_value;
    }
};

struct MaskPayload {
    std::string source;
    std::optional<std::string> mask_pattern;

    bool operator==(const MaskPayload& other) const {
        return source == other.source && mask_pattern == other.mask_pattern;
    }
};

struct ConditionalSourcePayload {
    std::string then_source;
    std::string else_source;

    bool operator==(const ConditionalSourcePayload& other) const {
        return then_source == other.then_source && else_source == other.else_source;
    }
};

// Payload of a transform type this version does not know
struct UnknownPayload {
    std::string type_name;

    bool operator==(const UnknownPayload& other) const { return type_name == other.type_name; }
};

enum class ConditionSubject {
    Param,
    Field,
    Source
};

struct TransformCondition {
    ConditionSubject subject{ConditionSubject::Param};
    std::string name;
    std::string op;
    std::string value;

    bool operator==(const TransformCondition& other) const {
        return subject == other.subject && name == other.name &&
               op == other.op && value == other.value;
    }
};

struct Transform {
    std::string target;
    std::variant<CoalescePayload, ConcatPayload, CasePayload, MaskPayload,
                 ConditionalSourcePayload, UnknownPayload> payload;
    std::vector<TransformCondition> conditions;
    SourceLocation location;

    TransformType type() const {
        return static_cast<TransformType>(payload.index());
    }

    bool operator==(const Transform& other) const {
        return target == other.target && payload == other.payload &&
               conditions == other.conditions;
    }
};

struct Document {
    std::string version;
    ApiRef import_api;
    std::vector<TableRef> import_tables;
    std::string usecase_name;
    std::optional<std::string> usecase_summary;
    std::optional<std::string> output_name;
    std::vector<MappingNode> response_mappings;
    std::vector<Filter> filters;
    std::vector<Transform> transforms;

    bool operator==(const Document& other) const {
        return version == other.version && import_api == other.import_api &&
               import_tables == other.import_tables &&
               usecase_name == other.usecase_name &&
               usecase_summary == other.usecase_summary &&
               output_name == other.output_name &&
               response_mappings == other.response_mappings &&
               filters == other.filters && transforms == other.transforms;
    }
    bool operator!=(const Document& other) const { return !(*this == other); }
};

// Spellings used in the mapping language
std::string to_string(JoinType type);
std::string to_string(AggregateType type);
std::string to_string(FilterTarget target);
std::string to_string(PaginationStrategy strategy);
std::string to_string(TransformType type);
std::string to_string(ConditionSubject subject);

} // namespace parser::usml

#endif // USML_DOCUMENT_HPP
