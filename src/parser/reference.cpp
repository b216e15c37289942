#include "parser/reference.hpp"
#include "common/string_utils.hpp"
#include <array>
#include <algorithm>

namespace parser::reference {

namespace {

    const std::array<const char*, 8> HTTP_METHODS = {
        "get", "put", "post", "delete", "options", "head", "patch", "trace"
    };

    // Cursor over the fragment part of a reference expression
    class Cursor {
    public:
        explicit Cursor(const std::string& text, size_t pos = 0)
            : text_(text), pos_(pos) {}

        bool consume(const std::string& literal) {
            if (text_.compare(pos_, literal.size(), literal) == 0) {
                pos_ += literal.size();
                return true;
            }
            return false;
        }

        std::optional<std::string> quoted() {
            if (pos_ >= text_.size() || (text_[pos_] != '"' && text_[pos_] != '\'')) {
                return std::nullopt;
            }
            const char quote = text_[pos_];
            const auto end = text_.find(quote, pos_ + 1);
            if (end == std::string::npos) {
                return std::nullopt;
            }
            auto value = text_.substr(pos_ + 1, end - pos_ - 1);
            pos_ = end + 1;
            return value;
        }

        std::string word() {
            const auto start = pos_;
            while (pos_ < text_.size() && common::utils::is_identifier_char(text_[pos_])) {
                ++pos_;
            }
            return text_.substr(start, pos_ - start);
        }

        bool at_end() const { return pos_ >= text_.size(); }

    private:
        const std::string& text_;
        size_t pos_;
    };

    // Splits "path#fragment"; the file part must be non-empty
    std::optional<std::pair<std::string, size_t>> split_file(const std::string& expression) {
        const auto hash = expression.find('#');
        if (hash == std::string::npos || hash == 0) {
            return std::nullopt;
        }
        return std::make_pair(expression.substr(0, hash), hash + 1);
    }

    // Subscript of the form name["value"]
    std::optional<std::string> subscript(Cursor& cursor, const std::string& name) {
        if (!cursor.consume(name + "[")) {
            return std::nullopt;
        }
        auto value = cursor.quoted();
        if (!value || value->empty() || !cursor.consume("]")) {
            return std::nullopt;
        }
        return value;
    }

    // A parsed value never holds both quote characters
    std::string quote(const std::string& value) {
        const char mark = value.find('"') == std::string::npos ? '"' : '\'';
        return mark + value + mark;
    }
}

Result<ApiRef> parse_api_ref(const std::string& raw) {
    const auto expression = common::utils::trim(raw);
    auto split = split_file(expression);
    if (!split) {
        return Error{"API reference must have the form <file>#paths[\"...\"].<method>", expression};
    }

    ApiRef ref;
    ref.file = split->first;

    Cursor cursor(expression, split->second);
    auto path = subscript(cursor, "paths");
    if (!path) {
        return Error{"API reference must select an operation with paths[\"...\"]", expression};
    }
    ref.path = *path;

    if (!cursor.consume(".")) {
        return Error{"API reference is missing the HTTP method", expression};
    }
    ref.method = cursor.word();
    if (std::find(HTTP_METHODS.begin(), HTTP_METHODS.end(), ref.method) == HTTP_METHODS.end()) {
        return Error{"Unsupported HTTP method '" + ref.method + "' in API reference", expression};
    }

    if (cursor.consume(".")) {
        auto status = subscript(cursor, "responses");
        if (!status) {
            return Error{"Expected responses[\"<status>\"] after the HTTP method", expression};
        }
        ref.status_code = *status;
    }

    if (!cursor.at_end()) {
        return Error{"Unexpected trailing text in API reference", expression};
    }
    return ref;
}

Result<TableRef> parse_table_ref(const std::string& raw) {
    const auto expression = common::utils::trim(raw);
    auto split = split_file(expression);
    if (!split) {
        return Error{"Table reference must have the form <file>#tables[\"...\"]", expression};
    }

    TableRef ref;
    ref.file = split->first;

    Cursor cursor(expression, split->second);
    auto table = subscript(cursor, "tables");
    if (!table) {
        return Error{"Table reference must select a table with tables[\"...\"]", expression};
    }
    ref.table = *table;

    if (cursor.consume(".")) {
        auto column = subscript(cursor, "columns");
        if (!column) {
            return Error{"Expected columns[\"<name>\"] after the table selector", expression};
        }
        ref.column = *column;
    }

    if (!cursor.at_end()) {
        return Error{"Unexpected trailing text in table reference", expression};
    }
    return ref;
}

std::string format_api_ref(const ApiRef& ref) {
    return ref.file + "#paths[" + quote(ref.path) + "]." + ref.method +
           ".responses[" + quote(ref.status_code) + "]";
}

std::string format_table_ref(const TableRef& ref) {
    auto text = ref.file + "#tables[" + quote(ref.table) + "]";
    if (ref.column) {
        text += ".columns[" + quote(*ref.column) + "]";
    }
    return text;
}

} // namespace parser::reference
