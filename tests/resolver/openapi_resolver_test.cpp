#include "resolver/openapi_resolver.hpp"
#include "../test_fixtures.hpp"
#include <gtest/gtest.h>

namespace {

using namespace resolver;
using parser::reference::ApiRef;

class OpenApiResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(std::holds_alternative<common::Success>(
            resolver.register_document("api.yaml", fixtures::API_YAML)));
    }

    ResolvedApiSchema resolve_ok(const ApiRef& ref) {
        auto result = resolver.resolve(ref);
        if (std::holds_alternative<ResolutionError>(result)) {
            ADD_FAILURE() << std::get<ResolutionError>(result).describe();
            return {};
        }
        return std::get<ResolvedApiSchema>(result);
    }

    ResolutionError resolve_error(const ApiRef& ref) {
        auto result = resolver.resolve(ref);
        if (!std::holds_alternative<ResolutionError>(result)) {
            ADD_FAILURE() << "Expected resolution of " << parser::reference::format_api_ref(ref)
                          << " to fail";
            return ResolutionError{"<none>", ""};
        }
        return std::get<ResolutionError>(result);
    }

    static std::vector<std::string> names(const ResolvedApiSchema& schema) {
        std::vector<std::string> out;
        for (const auto& field : schema.fields) {
            out.push_back(field.name);
        }
        return out;
    }

    ApiSchemaResolver resolver;
};

// Test array response with $ref items and referenced parameters
TEST_F(OpenApiResolverTest, ResolvesUsersOperation) {
    const auto schema = resolve_ok({"./api.yaml", "/users", "get", "200"});
    EXPECT_EQ(names(schema), (std::vector<std::string>{"id", "name", "email", "avatar_url"}));
    EXPECT_EQ(schema.fields[0].type, "integer");
    EXPECT_EQ(schema.parameters, (std::vector<std::string>{"status", "page"}));
    EXPECT_TRUE(schema.has_field("avatar_url"));
    EXPECT_FALSE(schema.has_parameter("limit"));
}

// Path level parameters come before operation parameters; field order follows the file
TEST_F(OpenApiResolverTest, ResolvesPostsOperation) {
    const auto schema = resolve_ok({"api.yaml", "/posts", "get", "200"});
    EXPECT_EQ(names(schema), (std::vector<std::string>{
        "id", "title", "author_name", "editor_name", "comment_count", "comments", "tags"}));
    EXPECT_EQ(schema.fields[5].type, "array<object>");
    EXPECT_EQ(schema.parameters,
              (std::vector<std::string>{"page", "limit", "sort", "status", "preview"}));
}

TEST_F(OpenApiResolverTest, FollowsResponseReference) {
    const auto schema = resolve_ok({"api.yaml", "/posts", "get", "404"});
    EXPECT_EQ(names(schema), (std::vector<std::string>{"code", "message"}));
}

// Test the three lookup failures and a missing file
TEST_F(OpenApiResolverTest, ReportsMissingTargets) {
    auto path = resolve_error({"api.yaml", "/comments", "get", "200"});
    EXPECT_EQ(path.message, "Path '/comments' not found");
    EXPECT_EQ(path.reference, R"(api.yaml#paths["/comments"].get.responses["200"])");

    auto operation = resolve_error({"api.yaml", "/users", "post", "200"});
    EXPECT_EQ(operation.message, "Operation 'POST /users' not found");

    auto response = resolve_error({"api.yaml", "/users", "get", "500"});
    EXPECT_EQ(response.message, "Response '500' not found");

    auto file = resolve_error({"no/such/api.yaml", "/users", "get", "200"});
    EXPECT_NE(file.message.find("Cannot open file"), std::string::npos);
}

// Test allOf merging in a JSON description
TEST_F(OpenApiResolverTest, MergesAllOfFromJson) {
    ASSERT_TRUE(std::holds_alternative<common::Success>(resolver.register_document("tree.json", R"({
      "openapi": "3.0.0",
      "paths": {
        "/nodes": {
          "get": {
            "responses": {
              "200": {
                "description": "OK",
                "content": {
                  "application/json": {
                    "schema": {
                      "allOf": [
                        {"$ref": "#/components/schemas/Base"},
                        {"type": "object", "properties": {"parent": {"$ref": "#/components/schemas/Node"}, "id": {"type": "string"}}}
                      ]
                    }
                  }
                }
              }
            }
          }
        }
      },
      "components": {
        "schemas": {
          "Base": {"type": "object", "properties": {"id": {"type": "integer"}, "label": {"type": "string"}}},
          "Node": {"type": "object", "properties": {"children": {"type": "array", "items": {"$ref": "#/components/schemas/Node"}}}}
        }
      }
    })")));

    const auto schema = resolve_ok({"tree.json", "/nodes", "get", "200"});
    EXPECT_EQ(names(schema), (std::vector<std::string>{"id", "label", "parent"}));
    EXPECT_EQ(schema.fields[0].type, "integer");
    EXPECT_EQ(schema.fields[2].type, "Node");
}

TEST_F(OpenApiResolverTest, RejectsCircularAndRemoteReferences) {
    ASSERT_TRUE(std::holds_alternative<common::Success>(resolver.register_document("loop.yaml", R"(
paths:
  /a:
    $ref: '#/paths/~1b'
  /b:
    $ref: '#/paths/~1a'
  /c:
    get:
      responses:
        "200":
          $ref: 'other.yaml#/components/responses/Ok'
)")));
    auto circular = resolve_error({"loop.yaml", "/a", "get", "200"});
    EXPECT_NE(circular.message.find("Circular"), std::string::npos);

    auto remote = resolve_error({"loop.yaml", "/c", "get", "200"});
    EXPECT_NE(remote.message.find("local"), std::string::npos);
}

// Test the cache of parsed descriptions
TEST_F(OpenApiResolverTest, CachesDescriptions) {
    EXPECT_EQ(resolver.cache_size(), 1u);
    resolve_ok({"./api.yaml", "/users", "get", "200"});
    resolve_ok({"api.yaml", "/posts", "get", "200"});
    EXPECT_EQ(resolver.cache_size(), 1u);

    auto invalid = resolver.register_document("bad.yaml", "paths: [unclosed");
    ASSERT_TRUE(std::holds_alternative<ResolutionError>(invalid));
    EXPECT_EQ(resolver.cache_size(), 1u);

    resolver.clear_cache();
    EXPECT_EQ(resolver.cache_size(), 0u);
}

TEST_F(OpenApiResolverTest, NormalizesAgainstBaseDirectory) {
    ApiSchemaResolver scoped("specs");
    EXPECT_EQ(scoped.normalize("./api.yaml"), "specs/api.yaml");
    EXPECT_EQ(scoped.normalize("../api.yaml"), "api.yaml");
    EXPECT_EQ(scoped.normalize("/abs/api.yaml"), "/abs/api.yaml");
}

} // namespace
