#include "parser/reference.hpp"
#include <gtest/gtest.h>

namespace {

using namespace parser::reference;

// Test full API reference with an explicit status
TEST(ReferenceTest, ParsesApiReference) {
    auto result = parse_api_ref(R"(./api.yaml#paths["/users/{id}"].get.responses["201"])");
    ASSERT_TRUE(std::holds_alternative<ApiRef>(result));

    const auto& ref = std::get<ApiRef>(result);
    EXPECT_EQ(ref.file, "./api.yaml");
    EXPECT_EQ(ref.path, "/users/{id}");
    EXPECT_EQ(ref.method, "get");
    EXPECT_EQ(ref.status_code, "201");
}

TEST(ReferenceTest, ApiReferenceDefaultsToStatus200) {
    auto result = parse_api_ref(R"(specs/api.json#paths['/posts'].post)");
    ASSERT_TRUE(std::holds_alternative<ApiRef>(result));
    EXPECT_EQ(std::get<ApiRef>(result).status_code, "200");
    EXPECT_EQ(std::get<ApiRef>(result).method, "post");
}

// Test malformed API references
TEST(ReferenceTest, RejectsMalformedApiReferences) {
    EXPECT_TRUE(std::holds_alternative<Error>(parse_api_ref("api.yaml")));
    EXPECT_TRUE(std::holds_alternative<Error>(parse_api_ref(R"(#paths["/users"].get)")));
    EXPECT_TRUE(std::holds_alternative<Error>(parse_api_ref(R"(api.yaml#paths["/users"])")));
    EXPECT_TRUE(std::holds_alternative<Error>(parse_api_ref(R"(api.yaml#paths["/users"].fetch)")));
    EXPECT_TRUE(std::holds_alternative<Error>(parse_api_ref(R"(api.yaml#paths[""].get)")));
    EXPECT_TRUE(std::holds_alternative<Error>(
        parse_api_ref(R"(api.yaml#paths["/users"].get.responses["200"].extra)")));

    auto result = parse_api_ref(R"(api.yaml#paths["/users"].fetch)");
    ASSERT_TRUE(std::holds_alternative<Error>(result));
    EXPECT_EQ(std::get<Error>(result).expression, R"(api.yaml#paths["/users"].fetch)");
}

// Test table and column references
TEST(ReferenceTest, ParsesTableReferences) {
    auto table = parse_table_ref(R"(./schema.dbml#tables["users"])");
    ASSERT_TRUE(std::holds_alternative<TableRef>(table));
    EXPECT_EQ(std::get<TableRef>(table).file, "./schema.dbml");
    EXPECT_EQ(std::get<TableRef>(table).table, "users");
    EXPECT_FALSE(std::get<TableRef>(table).column.has_value());

    auto column = parse_table_ref(R"(./schema.dbml#tables["users"].columns["email"])");
    ASSERT_TRUE(std::holds_alternative<TableRef>(column));
    ASSERT_TRUE(std::get<TableRef>(column).column.has_value());
    EXPECT_EQ(*std::get<TableRef>(column).column, "email");
}

TEST(ReferenceTest, RejectsMalformedTableReferences) {
    EXPECT_TRUE(std::holds_alternative<Error>(parse_table_ref("schema.dbml")));
    EXPECT_TRUE(std::holds_alternative<Error>(parse_table_ref(R"(schema.dbml#table["users"])")));
    EXPECT_TRUE(std::holds_alternative<Error>(parse_table_ref(R"(schema.dbml#tables["users")")));
    EXPECT_TRUE(std::holds_alternative<Error>(
        parse_table_ref(R"(schema.dbml#tables["users"].column["id"])")));
}

// Test that formatting yields text the parser reads back
TEST(ReferenceTest, FormatParsesBack) {
    ApiRef api{"./api.yaml", "/users", "get", "200"};
    auto reparsed_api = parse_api_ref(format_api_ref(api));
    ASSERT_TRUE(std::holds_alternative<ApiRef>(reparsed_api));
    EXPECT_EQ(std::get<ApiRef>(reparsed_api), api);

    TableRef table{"./schema.dbml", "users", std::string("id")};
    EXPECT_EQ(format_table_ref(table), R"(./schema.dbml#tables["users"].columns["id"])");
    auto reparsed_table = parse_table_ref(format_table_ref(table));
    ASSERT_TRUE(std::holds_alternative<TableRef>(reparsed_table));
    EXPECT_EQ(std::get<TableRef>(reparsed_table), table);
}

// Values holding a double quote are written back in single quotes
TEST(ReferenceTest, FormatKeepsEmbeddedQuotes) {
    auto parsed = parse_table_ref(R"(schema.dbml#tables['odd"name'].columns["id"])");
    ASSERT_TRUE(std::holds_alternative<TableRef>(parsed));
    const auto& table = std::get<TableRef>(parsed);
    EXPECT_EQ(table.table, "odd\"name");

    EXPECT_EQ(format_table_ref(table), R"(schema.dbml#tables['odd"name'].columns["id"])");
    auto reparsed = parse_table_ref(format_table_ref(table));
    ASSERT_TRUE(std::holds_alternative<TableRef>(reparsed));
    EXPECT_EQ(std::get<TableRef>(reparsed), table);

    ApiRef api{"./api.yaml", "/say\"hi\"", "post", "201"};
    auto reparsed_api = parse_api_ref(format_api_ref(api));
    ASSERT_TRUE(std::holds_alternative<ApiRef>(reparsed_api));
    EXPECT_EQ(std::get<ApiRef>(reparsed_api), api);
}

} // namespace
