#include "validator/rules.hpp"
#include "common/string_utils.hpp"
#include <algorithm>
#include <map>

namespace validator {

using namespace parser::usml;

namespace {

    std::optional<SourceLocation> known(const SourceLocation& location) {
        if (location.line == 0) {
            return std::nullopt;
        }
        return location;
    }

    void report(std::vector<Diagnostic>& out,
                const char* rule,
                const std::string& message,
                const SourceLocation& location,
                Severity severity = Severity::Error) {
        out.push_back(Diagnostic{severity, rule, message, known(location)});
    }

    bool contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

    bool has_leaf(const std::vector<MappingNode>& nodes, const std::string& name) {
        for (const auto& node : nodes) {
            if (node.scalar() && node.field == name) {
                return true;
            }
            if (const auto* array = node.array(); array && has_leaf(array->children, name)) {
                return true;
            }
        }
        return false;
    }

    bool has_top_level(const std::vector<MappingNode>& nodes, const std::string& name) {
        return std::any_of(nodes.begin(), nodes.end(),
            [&name](const MappingNode& node) { return node.field == name; });
    }

    // Walks "a.b.c" through nested array scopes
    bool has_path(const std::vector<MappingNode>& nodes,
                  const std::vector<std::string>& parts,
                  size_t index) {
        for (const auto& node : nodes) {
            if (node.field != parts[index]) {
                continue;
            }
            if (index + 1 == parts.size()) {
                return true;
            }
            if (const auto* array = node.array(); array && has_path(array->children, parts, index + 1)) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> declared_filter_params(const Document& doc) {
        std::vector<std::string> params;
        for (const auto& filter : doc.filters) {
            params.push_back(filter.param);
        }
        return params;
    }

    // One join or join_chain entry, as seen by the alias conflict check
    struct JoinEntry {
        const std::string& field;
        const std::string& table;
        const std::optional<std::string>& alias;
        const JoinCondition& on;
        const SourceLocation& location;
    };
}

std::vector<std::string> extract_placeholders(const std::string& condition) {
    std::vector<std::string> names;
    for (size_t i = 0; i < condition.size(); ++i) {
        if (condition[i] != ':') {
            continue;
        }
        if (i + 1 < condition.size() && condition[i + 1] == ':') {
            ++i;  // cast
            continue;
        }
        if (i > 0 && (common::utils::is_identifier_char(condition[i - 1]) || condition[i - 1] == ':')) {
            continue;
        }
        size_t end = i + 1;
        while (end < condition.size() && common::utils::is_identifier_char(condition[end])) {
            ++end;
        }
        if (end > i + 1) {
            names.push_back(condition.substr(i + 1, end - i - 1));
        }
        i = end - 1;
    }
    return names;
}

namespace checks {

void field_schema_match(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto& mapping : ctx.doc.response_mappings) {
        if (!ctx.api.has_field(mapping.field)) {
            report(out, rule_id::FIELD_SCHEMA_MATCH,
                   "Field '" + mapping.field + "' is not part of the API response schema",
                   mapping.location);
        }
    }
}

void table_coverage(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto* node : ctx.scopes.nodes()) {
        const auto& symbols = ctx.scopes.scope_of(*node).table();

        if (const auto* scalar = node->scalar()) {
            const auto table = symbols.resolve(scalar->source.table);
            if (!ctx.tables.has_table(table)) {
                report(out, rule_id::TABLE_COVERAGE,
                       "Table '" + table + "' used by field '" + node->field + "' is not imported",
                       node->location);
            } else if (!ctx.tables.has_column(table, scalar->source.column)) {
                report(out, rule_id::TABLE_COVERAGE,
                       "Column '" + table + "." + scalar->source.column + "' used by field '" +
                       node->field + "' does not exist",
                       node->location);
            }
        } else {
            const auto table = symbols.resolve(node->array()->source_table);
            if (!ctx.tables.has_table(table)) {
                report(out, rule_id::TABLE_COVERAGE,
                       "Source table '" + table + "' of array field '" + node->field + "' is not imported",
                       node->location);
            }
        }
    }
}

void join_table_imported(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto* node : ctx.scopes.nodes()) {
        if (!node->join) {
            continue;
        }
        if (!ctx.tables.has_table(node->join->table)) {
            report(out, rule_id::JOIN_TABLE_IMPORTED,
                   "Joined table '" + node->join->table + "' of field '" + node->field + "' is not imported",
                   node->join->location);
        }
        for (const auto& link : node->join_chain) {
            if (!ctx.tables.has_table(link.table)) {
                report(out, rule_id::JOIN_TABLE_IMPORTED,
                       "Join chain table '" + link.table + "' of field '" + node->field + "' is not imported",
                       link.location);
            }
        }
    }
}

void filter_param_declared(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto& filter : ctx.doc.filters) {
        if (!ctx.api.has_parameter(filter.param)) {
            report(out, rule_id::FILTER_PARAM_DECLARED,
                   "Filter parameter '" + filter.param + "' is not declared by the API operation",
                   filter.location);
        }
        const auto* pagination = std::get_if<PaginationFilter>(&filter.payload);
        if (pagination && pagination->limit_param && !ctx.api.has_parameter(*pagination->limit_param)) {
            report(out, rule_id::FILTER_PARAM_DECLARED,
                   "Limit parameter '" + *pagination->limit_param + "' of filter '" + filter.param +
                   "' is not declared by the API operation",
                   filter.location);
        }
    }
}

void transform_target_exists(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto& transform : ctx.doc.transforms) {
        const auto parts = common::utils::split_string(transform.target, '.');
        const bool found = parts.size() > 1
            ? has_path(ctx.doc.response_mappings, parts, 0)
            : has_top_level(ctx.doc.response_mappings, transform.target) ||
              has_leaf(ctx.doc.response_mappings, transform.target);
        if (!found) {
            report(out, rule_id::TRANSFORM_TARGET_EXISTS,
                   "Transform target '" + transform.target + "' does not match any mapped field",
                   transform.location);
        }

        if (const auto* unknown = std::get_if<UnknownPayload>(&transform.payload)) {
            report(out, rule_id::UNKNOWN_TRANSFORM_TYPE,
                   "Transform type '" + unknown->type_name + "' on '" + transform.target +
                   "' is not supported and will be ignored",
                   transform.location, Severity::Warning);
        }
    }
}

void join_condition_resolvable(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    auto check_side = [&](const ColumnRef& side, const SymbolTable& symbols,
                          const JoinCondition& on, const std::string& field,
                          const SourceLocation& location) {
        const auto table = symbols.resolve(side.table);
        if (!ctx.tables.has_column(table, side.column)) {
            report(out, rule_id::JOIN_CONDITION_RESOLVABLE,
                   "'" + side.to_string() + "' in join condition '" + on.to_string() +
                   "' of field '" + field + "' does not resolve to a known column",
                   location);
        }
    };

    for (const auto* node : ctx.scopes.nodes()) {
        if (!node->join) {
            continue;
        }
        const auto& scope = ctx.scopes.scope_of(*node);
        const auto& on = node->join->on;
        check_side(on.left, scope.steps[0], on, node->field, node->join->location);
        check_side(on.right, scope.steps[0], on, node->field, node->join->location);

        for (size_t i = 0; i < node->join_chain.size(); ++i) {
            const auto& link = node->join_chain[i];
            check_side(link.on.left, scope.steps[i + 1], link.on, node->field, link.location);
            check_side(link.on.right, scope.steps[i + 1], link.on, node->field, link.location);
        }
    }
}

void alias_required_on_conflict(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    std::vector<JoinEntry> entries;
    for (const auto* node : ctx.scopes.nodes()) {
        if (!node->join) {
            continue;
        }
        entries.push_back({node->field, node->join->table, node->join->alias,
                           node->join->on, node->join->location});
        for (const auto& link : node->join_chain) {
            entries.push_back({node->field, link.table, link.alias, link.on, link.location});
        }
    }

    // First unaliased join of each table fixes its canonical condition
    std::map<std::string, const JoinEntry*> canonical;
    for (const auto& entry : entries) {
        if (entry.alias) {
            continue;
        }
        auto it = canonical.find(entry.table);
        if (it == canonical.end()) {
            canonical.emplace(entry.table, &entry);
            continue;
        }
        if (!entry.on.same_as(it->second->on)) {
            report(out, rule_id::ALIAS_REQUIRED_ON_CONFLICT,
                   "Table '" + entry.table + "' is joined by field '" + entry.field + "' on '" +
                   entry.on.to_string() + "' but by field '" + it->second->field + "' on '" +
                   it->second->on.to_string() + "'; give one of them an alias",
                   entry.location);
        }
    }
}

void aggregate_group_by_resolvable(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto* node : ctx.scopes.nodes()) {
        if (!node->aggregate) {
            continue;
        }
        const auto& aggregate = *node->aggregate;
        const auto& scope = ctx.scopes.scope_of(*node);
        const auto& symbols = scope.table();

        if (aggregate.type == AggregateType::Unknown) {
            report(out, rule_id::UNKNOWN_AGGREGATE_TYPE,
                   "Aggregate type '" + aggregate.type_name + "' on field '" + node->field +
                   "' is not supported", node->location, Severity::Warning);
        }

        std::string grouping_table;
        if (aggregate.group_by) {
            grouping_table = symbols.resolve(aggregate.group_by->table);
            if (!ctx.tables.has_column(grouping_table, aggregate.group_by->column)) {
                report(out, rule_id::AGGREGATE_GROUP_BY_RESOLVABLE,
                       "group_by '" + aggregate.group_by->to_string() + "' of field '" + node->field +
                       "' does not resolve to a known column", node->location);
                continue;
            }
        } else {
            grouping_table = scope.root_table;
            const auto* root = ctx.tables.find_table(grouping_table);
            if (!root || root->primary_key.size() != 1) {
                report(out, rule_id::AGGREGATE_GROUP_BY_RESOLVABLE,
                       "Field '" + node->field + "' aggregates without group_by, but root table '" +
                       grouping_table + "' has no single-column primary key to group by",
                       node->location);
                continue;
            }
        }

        const auto* scalar = node->scalar();
        if (!node->join && scalar) {
            const auto source_table = symbols.resolve(scalar->source.table);
            if (source_table != grouping_table) {
                report(out, rule_id::AGGREGATE_GROUP_BY_RESOLVABLE,
                       "Field '" + node->field + "' aggregates '" + scalar->source.to_string() +
                       "' without a join, but groups by table '" + grouping_table + "'",
                       node->location);
            }
        }
    }
}

void filter_condition_params_declared(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    const auto declared = declared_filter_params(ctx.doc);
    for (const auto& filter : ctx.doc.filters) {
        const auto* where = std::get_if<WhereFilter>(&filter.payload);
        if (!where) {
            continue;
        }
        for (const auto& name : extract_placeholders(where->condition)) {
            if (!contains(declared, name)) {
                report(out, rule_id::FILTER_CONDITION_PARAMS_DECLARED,
                       "Placeholder ':" + name + "' in condition of filter '" + filter.param +
                       "' is not a declared filter parameter", filter.location);
            }
        }
    }
}

void transform_when_param_declared(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto& transform : ctx.doc.transforms) {
        for (const auto& condition : transform.conditions) {
            if (condition.subject == ConditionSubject::Param && !ctx.api.has_parameter(condition.name)) {
                report(out, rule_id::TRANSFORM_WHEN_PARAM_DECLARED,
                       "Parameter '" + condition.name + "' in condition of transform '" +
                       transform.target + "' is not declared by the API operation",
                       transform.location);
            }
        }
    }
}

void array_source_table_consistency(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto* node : ctx.scopes.nodes()) {
        const auto* array = node->array();
        if (!array || !node->join) {
            continue;
        }
        const auto tail_table = *node->join_tail_table();
        const auto tail_binding = *node->join_tail_binding();
        if (array->source_table != tail_table && array->source_table != tail_binding) {
            report(out, rule_id::ARRAY_SOURCE_TABLE_CONSISTENCY,
                   "Array field '" + node->field + "' reads from '" + array->source_table +
                   "' but its join reaches '" + tail_table + "'", node->location);
        }
    }
}

void sort_column_allowlisted(const ValidationContext& ctx, std::vector<Diagnostic>& out) {
    for (const auto& filter : ctx.doc.filters) {
        const auto* order_by = std::get_if<OrderByFilter>(&filter.payload);
        if (!order_by) {
            continue;
        }
        if (order_by->default_column && !order_by->allowed_columns.empty() &&
            !contains(order_by->allowed_columns, *order_by->default_column)) {
            report(out, rule_id::SORT_COLUMN_ALLOWLISTED,
                   "Default sort column '" + *order_by->default_column + "' of filter '" +
                   filter.param + "' is not in allowed_columns", filter.location);
        }
        if (order_by->default_direction && !order_by->allowed_directions.empty()) {
            const auto direction = common::utils::to_lower(*order_by->default_direction);
            const bool allowed = std::any_of(order_by->allowed_directions.begin(),
                                             order_by->allowed_directions.end(),
                [&direction](const std::string& candidate) {
                    return common::utils::to_lower(candidate) == direction;
                });
            if (!allowed) {
                report(out, rule_id::SORT_COLUMN_ALLOWLISTED,
                       "Default sort direction '" + *order_by->default_direction + "' of filter '" +
                       filter.param + "' is not in allowed_directions", filter.location);
            }
        }
    }
}

} // namespace checks

const std::vector<Rule>& rules() {
    static const std::vector<Rule> registry = {
        {rule_id::FIELD_SCHEMA_MATCH, checks::field_schema_match},
        {rule_id::TABLE_COVERAGE, checks::table_coverage},
        {rule_id::JOIN_TABLE_IMPORTED, checks::join_table_imported},
        {rule_id::FILTER_PARAM_DECLARED, checks::filter_param_declared},
        {rule_id::TRANSFORM_TARGET_EXISTS, checks::transform_target_exists},
        {rule_id::JOIN_CONDITION_RESOLVABLE, checks::join_condition_resolvable},
        {rule_id::ALIAS_REQUIRED_ON_CONFLICT, checks::alias_required_on_conflict},
        {rule_id::AGGREGATE_GROUP_BY_RESOLVABLE, checks::aggregate_group_by_resolvable},
        {rule_id::FILTER_CONDITION_PARAMS_DECLARED, checks::filter_condition_params_declared},
        {rule_id::TRANSFORM_WHEN_PARAM_DECLARED, checks::transform_when_param_declared},
        {rule_id::ARRAY_SOURCE_TABLE_CONSISTENCY, checks::array_source_table_consistency},
        {rule_id::SORT_COLUMN_ALLOWLISTED, checks::sort_column_allowlisted},
    };
    return registry;
}

} // namespace validator
