#include "validator/diagnostic.hpp"
#include <algorithm>

namespace validator {

bool ValidationResult::ok() const {
    return error_count() == 0;
}

size_t ValidationResult::error_count() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const Diagnostic& d) { return d.severity == Severity::Error; }));
}

size_t ValidationResult::warning_count() const {
    return diagnostics.size() - error_count();
}

size_t ValidationResult::count(const std::string& rule, Severity severity) const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [&](const Diagnostic& d) { return d.rule == rule && d.severity == severity; }));
}

std::string to_string(Severity severity) {
    return severity == Severity::Error ? "error" : "warning";
}

nlohmann::ordered_json to_json(const ValidationResult& result, const std::string& file) {
    nlohmann::ordered_json out;
    out["file"] = file;
    out["status"] = result.status();
    out["diagnostics"] = nlohmann::ordered_json::array();
    for (const auto& diagnostic : result.diagnostics) {
        nlohmann::ordered_json entry;
        entry["severity"] = to_string(diagnostic.severity);
        entry["rule"] = diagnostic.rule;
        entry["message"] = diagnostic.message;
        if (diagnostic.location && diagnostic.location->line > 0) {
            entry["line"] = diagnostic.location->line;
            entry["column"] = diagnostic.location->column;
        }
        out["diagnostics"].push_back(std::move(entry));
    }
    return out;
}

} // namespace validator
