#include "validator/validator.hpp"
#include "common/logging.hpp"
#include "validator/rules.hpp"

namespace validator {

ValidationResult validate(const parser::usml::Document& doc,
                          const resolver::ResolvedApiSchema& api,
                          const resolver::ResolvedTableSchema& tables) {
    const auto scopes = ScopeIndex::build(doc);
    return validate(doc, api, tables, scopes);
}

ValidationResult validate(const parser::usml::Document& doc,
                          const resolver::ResolvedApiSchema& api,
                          const resolver::ResolvedTableSchema& tables,
                          const ScopeIndex& scopes) {
    const ValidationContext ctx{doc, api, tables, scopes};
    ValidationResult result;

    for (const auto& rule : rules()) {
        const auto before = result.diagnostics.size();
        rule.check(ctx, result.diagnostics);
        common::log::debug(std::string("Rule ") + rule.id + ": " +
                           std::to_string(result.diagnostics.size() - before) + " findings");
    }

    common::log::info("Validated '" + doc.usecase_name + "': " + result.status() + " (" +
                      std::to_string(result.error_count()) + " errors, " +
                      std::to_string(result.warning_count()) + " warnings)");
    return result;
}

} // namespace validator
