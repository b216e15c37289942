#include "resolver/table_resolver.hpp"
#include "../test_fixtures.hpp"
#include <gtest/gtest.h>

namespace {

using namespace resolver;
using parser::reference::TableRef;

class TableResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(std::holds_alternative<common::Success>(
            resolver.register_document("schema.dbml", fixtures::SCHEMA_DBML)));
    }

    ResolvedTableSchema resolve_ok(const std::vector<TableRef>& refs) {
        auto result = resolver.resolve(refs);
        if (std::holds_alternative<ResolutionError>(result)) {
            ADD_FAILURE() << std::get<ResolutionError>(result).describe();
            return {};
        }
        return std::get<ResolvedTableSchema>(result);
    }

    TableSchemaResolver resolver;
};

// Whole tables keep every column, primary key and the foreign keys between them
TEST_F(TableResolverTest, ProjectsWholeTables) {
    const auto schema = resolve_ok({
        {"./schema.dbml", "posts", std::nullopt},
        {"./schema.dbml", "users", std::nullopt},
    });
    ASSERT_EQ(schema.tables.size(), 2u);
    EXPECT_EQ(schema.tables[0].name, "posts");
    EXPECT_EQ(schema.tables[1].name, "users");
    EXPECT_EQ(schema.tables[0].columns.size(), 5u);
    EXPECT_EQ(schema.tables[0].primary_key, std::vector<std::string>{"id"});

    // posts.author_id and posts.editor_id; profiles/comments are not imported
    ASSERT_EQ(schema.foreign_keys.size(), 2u);
    EXPECT_EQ(schema.foreign_keys[0].from_column, "author_id");
    EXPECT_EQ(schema.foreign_keys[1].from_column, "editor_id");
}

// Column references narrow a table to the union of the referenced columns
TEST_F(TableResolverTest, ProjectsReferencedColumns) {
    const auto schema = resolve_ok({
        {"schema.dbml", "users", std::string("email")},
        {"schema.dbml", "users", std::string("id")},
        {"schema.dbml", "profiles", std::string("user_id")},
    });
    ASSERT_EQ(schema.tables.size(), 2u);
    const auto* users = schema.find_table("users");
    ASSERT_NE(users, nullptr);
    ASSERT_EQ(users->columns.size(), 2u);
    // declaration order is kept
    EXPECT_EQ(users->columns[0].name, "id");
    EXPECT_EQ(users->columns[1].name, "email");
    EXPECT_FALSE(schema.has_column("users", "name"));
    EXPECT_EQ(users->primary_key, std::vector<std::string>{"id"});

    ASSERT_EQ(schema.foreign_keys.size(), 1u);
    EXPECT_EQ(schema.foreign_keys[0],
              (ForeignKey{"profiles", "user_id", "users", "id", RelationKind::ManyToOne}));
}

TEST_F(TableResolverTest, WholeTableWinsOverColumns) {
    const auto schema = resolve_ok({
        {"schema.dbml", "users", std::string("email")},
        {"schema.dbml", "users", std::nullopt},
    });
    ASSERT_EQ(schema.tables.size(), 1u);
    EXPECT_EQ(schema.tables[0].columns.size(), 5u);
}

// Test missing tables, columns and files
TEST_F(TableResolverTest, ReportsMissingTargets) {
    auto table = resolver.resolve({{"schema.dbml", "orders", std::nullopt}});
    ASSERT_TRUE(std::holds_alternative<ResolutionError>(table));
    EXPECT_EQ(std::get<ResolutionError>(table).message, "Table 'orders' not found in schema.dbml");
    EXPECT_EQ(std::get<ResolutionError>(table).reference, R"(schema.dbml#tables["orders"])");

    auto column = resolver.resolve({{"schema.dbml", "users", std::string("phone")}});
    ASSERT_TRUE(std::holds_alternative<ResolutionError>(column));
    EXPECT_EQ(std::get<ResolutionError>(column).message, "Column 'users.phone' not found in schema.dbml");

    auto file = resolver.resolve({{"missing.dbml", "users", std::nullopt}});
    ASSERT_TRUE(std::holds_alternative<ResolutionError>(file));
    EXPECT_NE(std::get<ResolutionError>(file).message.find("Cannot open file"), std::string::npos);
}

// DBML aliases resolve to the physical table and foreign keys use physical names
TEST_F(TableResolverTest, ResolvesThroughDbmlAlias) {
    ASSERT_TRUE(std::holds_alternative<common::Success>(resolver.register_document("shop.dbml", R"(
Table customers as C {
  id int [pk]
}
Table orders {
  id int [pk]
  customer_id int [ref: > C.id]
}
)")));
    const auto schema = resolve_ok({
        {"shop.dbml", "C", std::nullopt},
        {"shop.dbml", "orders", std::nullopt},
    });
    ASSERT_EQ(schema.tables.size(), 2u);
    EXPECT_EQ(schema.tables[0].name, "customers");
    EXPECT_EQ(schema.tables[0].alias, std::optional<std::string>("C"));
    ASSERT_EQ(schema.foreign_keys.size(), 1u);
    EXPECT_EQ(schema.foreign_keys[0].to_table, "customers");
}

TEST_F(TableResolverTest, RejectsInvalidDbml) {
    auto result = resolver.register_document("broken.dbml", "Table t {\n  id int\n");
    ASSERT_TRUE(std::holds_alternative<ResolutionError>(result));
    EXPECT_NE(std::get<ResolutionError>(result).message.find("Invalid DBML"), std::string::npos);
    EXPECT_EQ(resolver.cache_size(), 1u);
}

} // namespace
