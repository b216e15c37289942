#include "validator/symbol_table.hpp"
#include "../test_fixtures.hpp"
#include <gtest/gtest.h>

namespace {

using namespace validator;
using parser::usml::Document;

TEST(SymbolTableTest, MostRecentBindingWins) {
    SymbolTable symbols;
    symbols.bind("u", "users");
    symbols.bind("p", "profiles");
    symbols.bind("u", "accounts");

    EXPECT_EQ(symbols.lookup("u"), std::optional<std::string>("accounts"));
    EXPECT_EQ(symbols.lookup("p"), std::optional<std::string>("profiles"));
    EXPECT_FALSE(symbols.lookup("posts").has_value());
    EXPECT_EQ(symbols.resolve("posts"), "posts");
    EXPECT_EQ(symbols.bindings().size(), 3u);
}

class ScopeIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        doc = fixtures::parse_or_fail(fixtures::POSTS_LIST);
    }

    Document doc;
};

// Test pre-order traversal, depths and parents
TEST_F(ScopeIndexTest, IndexesEveryNode) {
    const auto index = ScopeIndex::build(doc);
    const auto& nodes = index.nodes();
    ASSERT_EQ(nodes.size(), 9u);
    EXPECT_EQ(nodes[4]->field, "comments");
    EXPECT_EQ(nodes[5]->field, "body");
    EXPECT_EQ(nodes[6]->field, "commenter");
    EXPECT_EQ(nodes[7]->field, "tags");
    EXPECT_EQ(nodes[8]->field, "name");

    const auto& body = index.scope_of(*nodes[5]);
    EXPECT_EQ(body.depth, 1u);
    EXPECT_EQ(body.parent, nodes[4]);
    EXPECT_EQ(body.root_table, "comments");

    const auto& title = index.scope_of(*nodes[1]);
    EXPECT_EQ(title.depth, 0u);
    EXPECT_EQ(title.parent, nullptr);
    EXPECT_EQ(title.root_table, "posts");
    EXPECT_TRUE(title.steps.empty());
    EXPECT_TRUE(title.table().bindings().empty());
}

// Aliases are visible to the node that declares them and to array children only
TEST_F(ScopeIndexTest, AliasesFollowTheTree) {
    const auto index = ScopeIndex::build(doc);
    const auto& nodes = index.nodes();

    const auto& author = index.scope_of(*nodes[2]);
    ASSERT_EQ(author.steps.size(), 1u);
    EXPECT_EQ(author.table().lookup("author"), std::optional<std::string>("users"));
    EXPECT_FALSE(author.inherited.lookup("author").has_value());

    // siblings do not see each other's aliases
    EXPECT_FALSE(index.scope_of(*nodes[3]).table().lookup("author").has_value());

    const auto& commenter = index.scope_of(*nodes[6]);
    EXPECT_EQ(commenter.inherited.lookup("comments"), std::optional<std::string>("comments"));
    EXPECT_EQ(commenter.table().lookup("commenter"), std::optional<std::string>("users"));
}

// Each join_chain entry sees the bindings of the entries before it
TEST_F(ScopeIndexTest, ChainStepsAccumulate) {
    auto text = std::string(fixtures::POSTS_LIST);
    const std::string plain = "        - table: tags\n          on: post_tags.tag_id = tags.id\n";
    const std::string aliased = "        - table: tags\n          alias: t\n          on: post_tags.tag_id = t.id\n";
    const auto at = text.find(plain);
    ASSERT_NE(at, std::string::npos);
    text.replace(at, plain.size(), aliased);
    const auto aliased_doc = fixtures::parse_or_fail(text);

    const auto index = ScopeIndex::build(aliased_doc);
    const auto& tags = index.scope_of(aliased_doc.response_mappings[5]);
    ASSERT_EQ(tags.steps.size(), 2u);
    EXPECT_EQ(tags.steps[0].lookup("post_tags"), std::optional<std::string>("post_tags"));
    EXPECT_FALSE(tags.steps[0].lookup("t").has_value());
    EXPECT_EQ(tags.steps[1].lookup("t"), std::optional<std::string>("tags"));
}

TEST_F(ScopeIndexTest, UnknownNodeThrows) {
    const auto index = ScopeIndex::build(doc);
    parser::usml::MappingNode stranger;
    stranger.field = "stranger";
    EXPECT_THROW(index.scope_of(stranger), std::out_of_range);
}

} // namespace
