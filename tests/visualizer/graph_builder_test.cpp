#include "visualizer/graph_builder.hpp"
#include "../test_fixtures.hpp"
#include <gtest/gtest.h>

namespace {

using namespace visualizer;

class GraphBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        doc = fixtures::parse_or_fail(fixtures::POSTS_LIST);
        tables = resolvers.resolve_tables(doc);
        model = build_graph(doc, tables);
    }

    fixtures::SeededResolvers resolvers;
    parser::usml::Document doc;
    resolver::ResolvedTableSchema tables;
    GraphModel model;
};

// Test one unit per field and the nesting of array fields
TEST_F(GraphBuilderTest, BuildsFieldTree) {
    EXPECT_EQ(model.title, "List posts");
    ASSERT_EQ(model.fields.size(), 6u);
    ASSERT_EQ(model.units.size(), 9u);

    const auto* comments = model.find_field("comments");
    ASSERT_NE(comments, nullptr);
    EXPECT_EQ(comments->kind, parser::usml::MappingKind::Array);
    EXPECT_EQ(comments->badges, std::vector<std::string>{"array"});
    ASSERT_EQ(comments->children.size(), 2u);

    const auto* body = model.find_field("comments.body");
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->id, "field:comments.body");
    EXPECT_EQ(body->depth, 1u);
    EXPECT_EQ(body->unit_id, "unit:comments.body");

    EXPECT_EQ(model.find_field("comment_count")->badges, std::vector<std::string>{"COUNT"});
    EXPECT_EQ(model.find_field("body"), nullptr);
}

// Unit kinds follow Aggregate > JoinChain > Join > Simple
TEST_F(GraphBuilderTest, ClassifiesUnits) {
    EXPECT_EQ(model.find_unit("unit:id")->kind, UnitKind::Simple);
    EXPECT_EQ(model.find_unit("unit:author_name")->kind, UnitKind::Join);
    EXPECT_EQ(model.find_unit("unit:comment_count")->kind, UnitKind::Aggregate);
    EXPECT_EQ(model.find_unit("unit:comments")->kind, UnitKind::Join);
    EXPECT_EQ(model.find_unit("unit:tags")->kind, UnitKind::JoinChain);

    const auto* tags = model.find_unit("unit:tags");
    ASSERT_EQ(tags->join_lines.size(), 2u);
    EXPECT_EQ(tags->join_lines[0], "LEFT JOIN post_tags ON posts.id = post_tags.post_id");
    EXPECT_EQ(tags->join_lines[1], "JOIN tags ON post_tags.tag_id = tags.id");

    EXPECT_EQ(model.find_unit("unit:author_name")->join_lines[0],
              "LEFT JOIN users ON posts.author_id = author.id AS author");
}

TEST_F(GraphBuilderTest, AttachesTransformsToUnits) {
    EXPECT_EQ(model.find_unit("unit:author_name")->transforms, std::vector<std::string>{"COALESCE"});
    EXPECT_EQ(model.find_unit("unit:comments.body")->transforms, std::vector<std::string>{"MASK"});
    EXPECT_TRUE(model.find_unit("unit:title")->transforms.empty());
}

// Aliased joins get their own table node; imported tables come first
TEST_F(GraphBuilderTest, SeparatesAliasedTables) {
    ASSERT_EQ(model.tables.size(), 7u);
    EXPECT_EQ(model.tables[0].id, "table:posts");
    EXPECT_TRUE(model.tables[4].imported);
    EXPECT_FALSE(model.tables[5].imported);

    const auto* author = model.find_table("users", std::string("author"));
    ASSERT_NE(author, nullptr);
    EXPECT_EQ(author->id, "table:users@author");
    EXPECT_EQ(author->display_name, "users (as author)");
    EXPECT_EQ(author->reference_count, 1u);
    EXPECT_EQ(author->column_count, 5u);

    EXPECT_EQ(model.find_table("users")->reference_count, 0u);
    EXPECT_EQ(model.find_table("posts")->reference_count, 2u);
    EXPECT_EQ(model.find_table("comments")->reference_count, 3u);

    ASSERT_EQ(model.alias_groups.count("users"), 1u);
    EXPECT_EQ(model.alias_groups.at("users"),
              (std::vector<std::string>{"table:users@author", "table:users@commenter"}));
}

TEST_F(GraphBuilderTest, ConnectsEdgesAndHighlights) {
    EXPECT_EQ(model.edges.size(), 19u);
    EXPECT_EQ(model.edges[0].from, "field:id");
    EXPECT_EQ(model.edges[0].to, "unit:id");
    EXPECT_EQ(model.edges[0].kind, EdgeKind::FieldToUnit);
    EXPECT_EQ(model.edges[1].to, "table:posts");
    EXPECT_EQ(model.edges[1].kind, EdgeKind::UnitToTable);

    EXPECT_EQ(model.highlights.at("field:tags"),
              (std::vector<std::string>{"unit:tags", "table:tags", "table:post_tags"}));
    EXPECT_EQ(model.find_field("tags")->table_ids,
              (std::vector<std::string>{"table:tags", "table:post_tags"}));
}

TEST_F(GraphBuilderTest, GroupsByDepthAndLaysOutColumns) {
    ASSERT_EQ(model.depth_groups.size(), 2u);
    EXPECT_EQ(model.depth_groups.at(0).size(), 6u);
    EXPECT_EQ(model.depth_groups.at(1),
              (std::vector<std::string>{"field:comments.body", "field:comments.commenter", "field:tags.name"}));

    ASSERT_EQ(model.layout.size(), 25u);
    EXPECT_EQ(model.layout[14].id, "field:tags");
    EXPECT_EQ(model.layout[14].column, LayoutColumn::Fields);
    EXPECT_EQ(model.layout[14].row, 7u);
    EXPECT_EQ(model.layout.back().column, LayoutColumn::Tables);
    EXPECT_EQ(model.layout.back().row, 6u);

    EXPECT_EQ(depth_class(2), 2u);
    EXPECT_EQ(depth_class(9), MAX_DEPTH_CLASS);
}

// Test the JSON form consumed by the renderer
TEST_F(GraphBuilderTest, SerializesToJson) {
    const auto json = to_json(model);
    EXPECT_EQ(json["title"], "List posts");
    EXPECT_FALSE(json.contains("summary"));
    ASSERT_EQ(json["fields"].size(), 6u);
    EXPECT_EQ(json["fields"][4]["children"].size(), 2u);
    EXPECT_EQ(json["units"][7]["kind"], "join-chain");
    EXPECT_EQ(json["tables"][5]["alias"], "author");
    EXPECT_EQ(json["edges"][0]["kind"], "field-unit");
    EXPECT_EQ(json["depth_groups"]["1"].size(), 3u);
    EXPECT_EQ(json["layout"][1]["column"], 1);
}

// Without resolved tables the imported ones are still drawn
TEST(GraphBuilderStandaloneTest, UnresolvedTablesAreStillDrawn) {
    const auto doc = fixtures::parse_or_fail(fixtures::USERS_LIST);
    const auto model = build_graph(doc, resolver::ResolvedTableSchema{});

    ASSERT_EQ(model.tables.size(), 2u);
    EXPECT_EQ(model.tables[0].column_count, 0u);
    EXPECT_EQ(model.tables[0].reference_count, 3u);
    EXPECT_EQ(model.tables[1].reference_count, 1u);
    ASSERT_TRUE(model.summary.has_value());
}

} // namespace
