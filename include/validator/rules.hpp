#ifndef USML_VALIDATION_RULES_HPP
#define USML_VALIDATION_RULES_HPP

#include "parser/document.hpp"
#include "resolver/resolved_schema.hpp"
#include "validator/diagnostic.hpp"
#include "validator/symbol_table.hpp"
#include <string>
#include <vector>

namespace validator {

// Inputs shared by every check
struct ValidationContext {
    const parser::usml::Document& doc;
    const resolver::ResolvedApiSchema& api;
    const resolver::ResolvedTableSchema& tables;
    const ScopeIndex& scopes;
};

using Check = void (*)(const ValidationContext&, std::vector<Diagnostic>&);

struct Rule {
    const char* id;
    Check check;
};

namespace rule_id {
    inline constexpr const char* FIELD_SCHEMA_MATCH = "field-schema-match";
    inline constexpr const char* TABLE_COVERAGE = "table-coverage";
    inline constexpr const char* JOIN_TABLE_IMPORTED = "join-table-imported";
    inline constexpr const char* FILTER_PARAM_DECLARED = "filter-param-declared";
    inline constexpr const char* TRANSFORM_TARGET_EXISTS = "transform-target-exists";
    inline constexpr const char* JOIN_CONDITION_RESOLVABLE = "join-condition-resolvable";
    inline constexpr const char* ALIAS_REQUIRED_ON_CONFLICT = "alias-required-on-conflict";
    inline constexpr const char* AGGREGATE_GROUP_BY_RESOLVABLE = "aggregate-group-by-resolvable";
    inline constexpr const char* FILTER_CONDITION_PARAMS_DECLARED = "filter-condition-params-declared";
    inline constexpr const char* TRANSFORM_WHEN_PARAM_DECLARED = "transform-when-param-declared";
    inline constexpr const char* ARRAY_SOURCE_TABLE_CONSISTENCY = "array-source-table-consistency";
    inline constexpr const char* SORT_COLUMN_ALLOWLISTED = "sort-column-allowlisted";

    // Warnings raised by the checks above for kinds this version does not know
    inline constexpr const char* UNKNOWN_TRANSFORM_TYPE = "unknown-transform-type";
    inline constexpr const char* UNKNOWN_AGGREGATE_TYPE = "unknown-aggregate-type";
}

// The twelve checks, in the order their diagnostics are reported
const std::vector<Rule>& rules();

namespace checks {
    void field_schema_match(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void table_coverage(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void join_table_imported(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void filter_param_declared(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void transform_target_exists(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void join_condition_resolvable(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void alias_required_on_conflict(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void aggregate_group_by_resolvable(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void filter_condition_params_declared(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void transform_when_param_declared(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void array_source_table_consistency(const ValidationContext& ctx, std::vector<Diagnostic>& out);
    void sort_column_allowlisted(const ValidationContext& ctx, std::vector<Diagnostic>& out);
}

// Named ":param" placeholders of a WHERE condition, in order of appearance.
// "::type" casts and colons inside words ("10:30") are not placeholders.
std::vector<std::string> extract_placeholders(const std::string& condition);

} // namespace validator

#endif // USML_VALIDATION_RULES_HPP
