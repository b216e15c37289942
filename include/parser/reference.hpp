#ifndef USML_REFERENCE_HPP
#define USML_REFERENCE_HPP

#include "common/result.hpp"
#include <optional>
#include <string>

namespace parser::reference {

// Reference into an HTTP-API description:
//   ./api.yaml#paths["/users"].get.responses["200"]
struct ApiRef {
    std::string file;
    std::string path;
    std::string method;
    std::string status_code{"200"};

    bool operator==(const ApiRef& other) const {
        return file == other.file && path == other.path &&
               method == other.method && status_code == other.status_code;
    }
    bool operator!=(const ApiRef& other) const { return !(*this == other); }
};

// Reference into a database-schema description:
//   ./schema.dbml#tables["users"]
//   ./schema.dbml#tables["users"].columns["id"]
struct TableRef {
    std::string file;
    std::string table;
    std::optional<std::string> column;

    bool operator==(const TableRef& other) const {
        return file == other.file && table == other.table && column == other.column;
    }
    bool operator!=(const TableRef& other) const { return !(*this == other); }
};

struct Error : common::Error {
    std::string expression;

    Error(const std::string& msg, const std::string& expr)
        : common::Error(msg, expr), expression(expr) {}
};

template<typename T>
using Result = common::Result<T, Error>;

Result<ApiRef> parse_api_ref(const std::string& expression);
Result<TableRef> parse_table_ref(const std::string& expression);

std::string format_api_ref(const ApiRef& ref);
std::string format_table_ref(const TableRef& ref);

} // namespace parser::reference

#endif // USML_REFERENCE_HPP
