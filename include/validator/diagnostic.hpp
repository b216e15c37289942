#ifndef USML_DIAGNOSTIC_HPP
#define USML_DIAGNOSTIC_HPP

#include "parser/document.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace validator {

enum class Severity {
    Error,
    Warning
};

struct Diagnostic {
    Severity severity;
    std::string rule;
    std::string message;
    std::optional<parser::usml::SourceLocation> location{std::nullopt};
};

struct ValidationResult {
    std::vector<Diagnostic> diagnostics;

    // ok iff no Error-severity diagnostic; warnings never change the status
    bool ok() const;
    size_t error_count() const;
    size_t warning_count() const;
    size_t count(const std::string& rule, Severity severity = Severity::Error) const;
    std::string status() const { return ok() ? "ok" : "error"; }
};

std::string to_string(Severity severity);

// {"file", "status", "diagnostics": [{"severity", "rule", "message"[, "line", "column"]}]}
nlohmann::ordered_json to_json(const ValidationResult& result, const std::string& file);

} // namespace validator

#endif // USML_DIAGNOSTIC_HPP
