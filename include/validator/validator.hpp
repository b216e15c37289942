#ifndef USML_VALIDATOR_HPP
#define USML_VALIDATOR_HPP

#include "parser/document.hpp"
#include "resolver/resolved_schema.hpp"
#include "validator/diagnostic.hpp"
#include "validator/symbol_table.hpp"

namespace validator {

// Runs every check; never fails, findings are returned as diagnostics
ValidationResult validate(const parser::usml::Document& doc,
                          const resolver::ResolvedApiSchema& api,
                          const resolver::ResolvedTableSchema& tables);

// Same, reusing a scope index built for `doc`
ValidationResult validate(const parser::usml::Document& doc,
                          const resolver::ResolvedApiSchema& api,
                          const resolver::ResolvedTableSchema& tables,
                          const ScopeIndex& scopes);

} // namespace validator

#endif // USML_VALIDATOR_HPP
