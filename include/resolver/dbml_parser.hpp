#ifndef USML_DBML_PARSER_HPP
#define USML_DBML_PARSER_HPP

#include "common/result.hpp"
#include "resolver/resolved_schema.hpp"
#include <string>
#include <vector>

namespace resolver::dbml {

struct ParseError : common::Error {
    size_t line{0};

    ParseError(const std::string& msg, size_t l)
        : common::Error(msg, "line " + std::to_string(l)), line(l) {}
};

template<typename T>
using Result = common::Result<T, ParseError>;

// Everything a DBML file declares that the mapper cares about
struct Schema {
    std::vector<TableInfo> tables;
    std::vector<ForeignKey> references;

    // Lookup by table name or DBML alias
    const TableInfo* find_table(const std::string& name) const;
};

enum class TokenKind {
    Identifier,  // bare or "double quoted"
    String,      // 'single' or '''triple''' quoted
    Expression,  // `backticks`
    Number,
    Symbol,
    Newline,
    End
};

struct Token {
    TokenKind kind;
    std::string text;
    size_t line;
};

// Splits DBML text into tokens, dropping comments
Result<std::vector<Token>> tokenize(const std::string& content);

// Parses the DBML subset: Table, Ref, indexes; Project/Enum/TableGroup/Note are skipped
Result<Schema> parse(const std::string& content);

} // namespace resolver::dbml

#endif // USML_DBML_PARSER_HPP
