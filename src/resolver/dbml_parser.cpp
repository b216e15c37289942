#include "resolver/dbml_parser.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include <cctype>
#include <cstring>

namespace resolver {

std::string to_string(RelationKind kind) {
    switch (kind) {
        case RelationKind::ManyToOne: return ">";
        case RelationKind::OneToMany: return "<";
        case RelationKind::OneToOne: return "-";
        case RelationKind::ManyToMany: return "<>";
    }
    return ">";
}

namespace dbml {

const TableInfo* Schema::find_table(const std::string& name) const {
    for (const auto& table : tables) {
        if (table.name == name || (table.alias && *table.alias == name)) {
            return &table;
        }
    }
    return nullptr;
}

namespace {

    bool is_name_start(char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalpha(uc) || c == '_' || uc >= 0x80;
    }

    bool is_name_char(char c) {
        return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c));
    }

    size_t count_lines(const std::string& text, size_t begin, size_t end) {
        size_t lines = 0;
        for (size_t i = begin; i < end && i < text.size(); ++i) {
            if (text[i] == '\n') ++lines;
        }
        return lines;
    }

    std::optional<RelationKind> relation_from(const Token& token) {
        if (token.kind != TokenKind::Symbol) return std::nullopt;
        if (token.text == ">") return RelationKind::ManyToOne;
        if (token.text == "<") return RelationKind::OneToMany;
        if (token.text == "-") return RelationKind::OneToOne;
        if (token.text == "<>") return RelationKind::ManyToMany;
        return std::nullopt;
    }

    // One side of a relationship: table plus one or more columns
    struct Endpoint {
        std::string table;
        std::vector<std::string> columns;
    };

    class Parser {
    public:
        explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

        Result<Schema> run() {
            while (true) {
                skip_newlines();
                const auto& token = peek();
                if (token.kind == TokenKind::End) {
                    break;
                }
                if (token.kind != TokenKind::Identifier) {
                    return error("Unexpected '" + token.text + "' at top level");
                }

                const auto keyword = common::utils::to_lower(token.text);
                std::optional<ParseError> failure;
                if (keyword == "table") {
                    advance();
                    failure = parse_table();
                } else if (keyword == "ref") {
                    advance();
                    failure = parse_ref();
                } else if (keyword == "project" || keyword == "enum" || keyword == "tablegroup" ||
                           keyword == "note" || keyword == "tablepartial" || keyword == "records") {
                    advance();
                    common::log::debug("Skipping DBML block '" + token.text + "'");
                    if (at_symbol(":")) {
                        skip_line();
                    } else {
                        failure = skip_block();
                    }
                } else {
                    return error("Unexpected '" + token.text + "' at top level");
                }

                if (failure) {
                    return *failure;
                }
            }
            return std::move(schema_);
        }

    private:
        const Token& peek(size_t ahead = 0) const {
            const auto index = pos_ + ahead;
            return index < tokens_.size() ? tokens_[index] : tokens_.back();
        }

        const Token& advance() {
            const auto& token = peek();
            if (pos_ < tokens_.size() - 1) {
                ++pos_;
            }
            return token;
        }

        bool at_symbol(const char* symbol, size_t ahead = 0) const {
            const auto& token = peek(ahead);
            return token.kind == TokenKind::Symbol && token.text == symbol;
        }

        bool at_keyword(const char* keyword, size_t ahead = 0) const {
            const auto& token = peek(ahead);
            return token.kind == TokenKind::Identifier && common::utils::to_lower(token.text) == keyword;
        }

        bool at_end_of_line() const {
            const auto kind = peek().kind;
            return kind == TokenKind::Newline || kind == TokenKind::End;
        }

        void skip_newlines() {
            while (peek().kind == TokenKind::Newline) {
                advance();
            }
        }

        void skip_line() {
            while (!at_end_of_line()) {
                advance();
            }
        }

        ParseError error(const std::string& message) const {
            return ParseError{message, peek().line};
        }

        std::optional<ParseError> expect_symbol(const char* symbol) {
            if (!at_symbol(symbol)) {
                return error(std::string("Expected '") + symbol + "' but found '" + peek().text + "'");
            }
            advance();
            return std::nullopt;
        }

        // Skips up to and including the '}' matching the next '{'
        std::optional<ParseError> skip_block() {
            while (!at_symbol("{")) {
                if (peek().kind == TokenKind::End) {
                    return error("Expected '{'");
                }
                advance();
            }
            int depth = 0;
            do {
                if (peek().kind == TokenKind::End) {
                    return error("Unterminated block");
                }
                if (at_symbol("{")) ++depth;
                if (at_symbol("}")) --depth;
                advance();
            } while (depth > 0);
            return std::nullopt;
        }

        // Consumes "[ a, b: c, ... ]" and returns each comma separated setting
        Result<std::vector<std::vector<Token>>> settings() {
            const auto start_line = peek().line;
            advance();

            std::vector<std::vector<Token>> groups;
            std::vector<Token> current;
            int depth = 0;
            while (true) {
                const auto& token = peek();
                if (token.kind == TokenKind::End) {
                    return ParseError{"Unterminated settings list", start_line};
                }
                if (token.kind == TokenKind::Newline) {
                    advance();
                    continue;
                }
                if (token.kind == TokenKind::Symbol) {
                    if (token.text == "]" && depth == 0) {
                        advance();
                        break;
                    }
                    if (token.text == "," && depth == 0) {
                        if (!current.empty()) groups.push_back(std::move(current));
                        current.clear();
                        advance();
                        continue;
                    }
                    if (token.text == "(" || token.text == "[") ++depth;
                    if (token.text == ")" || token.text == "]") --depth;
                }
                current.push_back(token);
                advance();
            }
            if (!current.empty()) {
                groups.push_back(std::move(current));
            }
            return groups;
        }

        std::optional<ParseError> parse_table() {
            if (peek().kind != TokenKind::Identifier) {
                return error("Expected table name");
            }
            TableInfo table;
            table.name = advance().text;
            // schema.table: the schema is not part of the table identity
            if (at_symbol(".") && peek(1).kind == TokenKind::Identifier) {
                advance();
                table.name = advance().text;
            }
            if (at_keyword("as")) {
                advance();
                if (peek().kind != TokenKind::Identifier) {
                    return error("Expected alias after 'as'");
                }
                table.alias = advance().text;
            }
            if (at_symbol("[")) {
                auto header = settings();
                if (std::holds_alternative<ParseError>(header)) {
                    return std::get<ParseError>(header);
                }
            }
            skip_newlines();
            if (auto failure = expect_symbol("{")) {
                return failure;
            }
            if (auto failure = parse_table_body(table)) {
                return failure;
            }

            if (table.primary_key.empty()) {
                for (const auto& column : table.columns) {
                    if (column.primary_key) {
                        table.primary_key.push_back(column.name);
                    }
                }
            }
            if (schema_.find_table(table.name)) {
                return error("Duplicate table '" + table.name + "'");
            }
            common::log::debug("DBML table '" + table.name + "' with " +
                               std::to_string(table.columns.size()) + " columns");
            schema_.tables.push_back(std::move(table));
            return std::nullopt;
        }

        std::optional<ParseError> parse_table_body(TableInfo& table) {
            while (true) {
                skip_newlines();
                if (at_symbol("}")) {
                    advance();
                    return std::nullopt;
                }
                if (peek().kind == TokenKind::End) {
                    return error("Unterminated table '" + table.name + "'");
                }

                std::optional<ParseError> failure;
                if (at_keyword("indexes") && (at_symbol("{", 1) || peek(1).kind == TokenKind::Newline)) {
                    advance();
                    failure = parse_indexes(table);
                } else if (at_keyword("note") && (at_symbol(":", 1) || at_symbol("{", 1))) {
                    advance();
                    if (at_symbol(":")) {
                        skip_line();
                    } else {
                        failure = skip_block();
                    }
                } else {
                    failure = parse_column(table);
                }
                if (failure) {
                    return failure;
                }
            }
        }

        std::optional<ParseError> parse_column(TableInfo& table) {
            if (peek().kind != TokenKind::Identifier) {
                return error("Expected column name in table '" + table.name + "' but found '" +
                             peek().text + "'");
            }
            ColumnInfo column;
            column.name = advance().text;

            TokenKind previous = TokenKind::Symbol;
            while (!at_end_of_line() && !at_symbol("}")) {
                if (at_symbol("[")) {
                    // "text[]" is an array type, anything else opens the settings
                    if (!at_symbol("]", 1)) {
                        break;
                    }
                    advance();
                    advance();
                    column.type += "[]";
                    previous = TokenKind::Symbol;
                    continue;
                }
                const auto& token = advance();
                if (token.kind == TokenKind::Identifier && previous == TokenKind::Identifier) {
                    column.type += " ";
                }
                column.type += token.text;
                previous = token.kind;
            }
            if (column.type.empty()) {
                return error("Column '" + table.name + "." + column.name + "' has no type");
            }

            if (at_symbol("[")) {
                auto groups = settings();
                if (std::holds_alternative<ParseError>(groups)) {
                    return std::get<ParseError>(groups);
                }
                if (auto failure = apply_column_settings(table, column,
                        std::get<std::vector<std::vector<Token>>>(groups))) {
                    return failure;
                }
            }
            if (!at_end_of_line() && !at_symbol("}")) {
                return error("Unexpected '" + peek().text + "' after column '" + column.name + "'");
            }
            if (table.has_column(column.name)) {
                return error("Duplicate column '" + table.name + "." + column.name + "'");
            }
            table.columns.push_back(std::move(column));
            return std::nullopt;
        }

        std::optional<ParseError> apply_column_settings(const TableInfo& table,
                                                        ColumnInfo& column,
                                                        const std::vector<std::vector<Token>>& groups) {
            for (const auto& group : groups) {
                const auto head = common::utils::to_lower(group.front().text);
                const auto second = group.size() > 1 ? common::utils::to_lower(group[1].text) : "";

                if (head == "pk" || (head == "primary" && second == "key")) {
                    column.primary_key = true;
                } else if (head == "not" && second == "null") {
                    column.not_null = true;
                } else if (head == "unique") {
                    column.unique = true;
                } else if (head == "ref") {
                    if (group.size() < 3 || group[1].text != ":") {
                        return ParseError{"Malformed inline ref on '" + column.name + "'", group.front().line};
                    }
                    auto kind = relation_from(group[2]);
                    if (!kind) {
                        return ParseError{"Unknown relationship '" + group[2].text + "'", group[2].line};
                    }
                    std::vector<std::string> names;
                    for (size_t i = 3; i < group.size(); ++i) {
                        if (group[i].kind == TokenKind::Identifier) {
                            names.push_back(group[i].text);
                        }
                    }
                    if (names.size() < 2) {
                        return ParseError{"Inline ref on '" + column.name + "' must name table.column",
                                          group.front().line};
                    }
                    schema_.references.push_back(ForeignKey{
                        table.name, column.name, names[names.size() - 2], names.back(), *kind
                    });
                }
                // default, note, increment, null and check carry nothing we keep
            }
            return std::nullopt;
        }

        std::optional<ParseError> parse_indexes(TableInfo& table) {
            skip_newlines();
            if (auto failure = expect_symbol("{")) {
                return failure;
            }
            while (true) {
                skip_newlines();
                if (at_symbol("}")) {
                    advance();
                    return std::nullopt;
                }
                if (peek().kind == TokenKind::End) {
                    return error("Unterminated indexes block");
                }

                std::vector<std::string> columns;
                if (at_symbol("(")) {
                    advance();
                    while (!at_symbol(")")) {
                        if (at_end_of_line()) {
                            return error("Unterminated composite index");
                        }
                        const auto& token = advance();
                        if (token.kind == TokenKind::Identifier) {
                            columns.push_back(token.text);
                        }
                    }
                    advance();
                } else if (peek().kind == TokenKind::Identifier) {
                    columns.push_back(advance().text);
                } else if (peek().kind == TokenKind::Expression) {
                    advance();
                } else {
                    return error("Unexpected '" + peek().text + "' in indexes block");
                }

                if (at_symbol("[")) {
                    auto groups = settings();
                    if (std::holds_alternative<ParseError>(groups)) {
                        return std::get<ParseError>(groups);
                    }
                    for (const auto& group : std::get<std::vector<std::vector<Token>>>(groups)) {
                        const auto head = common::utils::to_lower(group.front().text);
                        if (head == "pk" && !columns.empty()) {
                            table.primary_key = columns;
                        } else if (head == "unique" && columns.size() == 1) {
                            for (auto& column : table.columns) {
                                if (column.name == columns.front()) column.unique = true;
                            }
                        }
                    }
                }
                if (!at_end_of_line() && !at_symbol("}")) {
                    return error("Unexpected '" + peek().text + "' in indexes block");
                }
            }
        }

        std::optional<ParseError> parse_ref() {
            if (peek().kind == TokenKind::Identifier) {
                advance();  // relationship name
            }
            if (at_symbol(":")) {
                advance();
                return parse_ref_expression();
            }
            skip_newlines();
            if (auto failure = expect_symbol("{")) {
                return failure;
            }
            while (true) {
                skip_newlines();
                if (at_symbol("}")) {
                    advance();
                    return std::nullopt;
                }
                if (peek().kind == TokenKind::End) {
                    return error("Unterminated Ref block");
                }
                if (auto failure = parse_ref_expression()) {
                    return failure;
                }
            }
        }

        Result<Endpoint> parse_endpoint() {
            std::vector<std::string> names;
            Endpoint endpoint;
            while (peek().kind == TokenKind::Identifier) {
                names.push_back(advance().text);
                if (!at_symbol(".")) break;
                advance();
            }

            if (at_symbol("(")) {
                advance();
                while (!at_symbol(")")) {
                    if (at_end_of_line()) {
                        return error("Unterminated composite reference");
                    }
                    const auto& token = advance();
                    if (token.kind == TokenKind::Identifier) {
                        endpoint.columns.push_back(token.text);
                    }
                }
                advance();
                if (names.empty()) {
                    return error("Composite reference is missing its table");
                }
                endpoint.table = names.back();
            } else {
                if (names.size() < 2) {
                    return error("Reference endpoint must name table.column");
                }
                endpoint.table = names[names.size() - 2];
                endpoint.columns.push_back(names.back());
            }
            return endpoint;
        }

        std::optional<ParseError> parse_ref_expression() {
            auto from = parse_endpoint();
            if (std::holds_alternative<ParseError>(from)) {
                return std::get<ParseError>(from);
            }
            auto kind = relation_from(peek());
            if (!kind) {
                return error("Expected relationship operator but found '" + peek().text + "'");
            }
            advance();
            auto to = parse_endpoint();
            if (std::holds_alternative<ParseError>(to)) {
                return std::get<ParseError>(to);
            }
            if (at_symbol("[")) {
                auto ignored = settings();
                if (std::holds_alternative<ParseError>(ignored)) {
                    return std::get<ParseError>(ignored);
                }
            }

            const auto& left = std::get<Endpoint>(from);
            const auto& right = std::get<Endpoint>(to);
            if (left.columns.size() != right.columns.size()) {
                return error("Composite reference has mismatched column counts");
            }
            for (size_t i = 0; i < left.columns.size(); ++i) {
                schema_.references.push_back(ForeignKey{
                    left.table, left.columns[i], right.table, right.columns[i], *kind
                });
            }
            return std::nullopt;
        }

        std::vector<Token> tokens_;
        size_t pos_{0};
        Schema schema_;
    };
}

Result<std::vector<Token>> tokenize(const std::string& content) {
    std::vector<Token> tokens;
    size_t line = 1;
    size_t i = 0;
    const auto n = content.size();

    while (i < n) {
        const char c = content[i];
        const char next = i + 1 < n ? content[i + 1] : '\0';

        if (c == '\n') {
            tokens.push_back({TokenKind::Newline, "\n", line});
            ++line;
            ++i;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '/' && next == '/') {
            while (i < n && content[i] != '\n') ++i;
        } else if (c == '/' && next == '*') {
            const auto end = content.find("*/", i + 2);
            if (end == std::string::npos) {
                return ParseError{"Unterminated block comment", line};
            }
            line += count_lines(content, i, end);
            i = end + 2;
        } else if (content.compare(i, 3, "'''") == 0) {
            const auto end = content.find("'''", i + 3);
            if (end == std::string::npos) {
                return ParseError{"Unterminated multi-line string", line};
            }
            tokens.push_back({TokenKind::String, content.substr(i + 3, end - i - 3), line});
            line += count_lines(content, i, end);
            i = end + 3;
        } else if (c == '\'' || c == '"' || c == '`') {
            std::string text;
            size_t j = i + 1;
            while (j < n && content[j] != c) {
                if (content[j] == '\n') {
                    return ParseError{"Unterminated quoted text", line};
                }
                if (content[j] == '\\' && j + 1 < n) {
                    ++j;
                }
                text += content[j];
                ++j;
            }
            if (j >= n) {
                return ParseError{"Unterminated quoted text", line};
            }
            const auto kind = c == '"' ? TokenKind::Identifier
                            : c == '`' ? TokenKind::Expression
                            : TokenKind::String;
            tokens.push_back({kind, text, line});
            i = j + 1;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t j = i;
            while (j < n && (std::isdigit(static_cast<unsigned char>(content[j])) ||
                   (content[j] == '.' && j + 1 < n && std::isdigit(static_cast<unsigned char>(content[j + 1]))))) {
                ++j;
            }
            tokens.push_back({TokenKind::Number, content.substr(i, j - i), line});
            i = j;
        } else if (is_name_start(c)) {
            size_t j = i;
            while (j < n && is_name_char(content[j])) ++j;
            tokens.push_back({TokenKind::Identifier, content.substr(i, j - i), line});
            i = j;
        } else if (c == '<' && next == '>') {
            tokens.push_back({TokenKind::Symbol, "<>", line});
            i += 2;
        } else if (std::strchr("{}[]():,.<>-~#", c) != nullptr) {
            tokens.push_back({TokenKind::Symbol, std::string(1, c), line});
            ++i;
        } else {
            return ParseError{std::string("Unexpected character '") + c + "'", line};
        }
    }

    tokens.push_back({TokenKind::End, "<end of input>", line});
    return tokens;
}

Result<Schema> parse(const std::string& content) {
    auto tokens = tokenize(content);
    if (std::holds_alternative<ParseError>(tokens)) {
        return std::get<ParseError>(tokens);
    }
    Parser parser(std::move(std::get<std::vector<Token>>(tokens)));
    return parser.run();
}

} // namespace dbml
} // namespace resolver
