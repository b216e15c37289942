#ifndef USML_TEST_FIXTURES_HPP
#define USML_TEST_FIXTURES_HPP

#include "parser/document_parser.hpp"
#include "resolver/openapi_resolver.hpp"
#include "resolver/table_resolver.hpp"
#include <gtest/gtest.h>
#include <string>

namespace fixtures {

inline const char* SCHEMA_DBML = R"(
Project blog {
  database_type: 'PostgreSQL'
  Note: 'Blog sample'
}

Enum post_status {
  draft
  published
}

Table users {
  id integer [pk, increment]
  name varchar [not null]
  email varchar [unique, not null]
  status varchar
  created_at timestamp [default: `now()`]
}

Table profiles {
  id integer [pk, increment]
  user_id integer [ref: > users.id]
  avatar_url varchar
  bio text [note: 'free text']
}

Table posts {
  id integer [pk]
  author_id integer [ref: > users.id]
  editor_id integer [ref: > users.id]
  title varchar [not null]
  status varchar(255) [default: 'draft']
}

Table comments {
  id integer [pk]
  post_id integer [ref: > posts.id]
  user_id integer [ref: > users.id]
  body text [not null]
}

Table likes {
  id integer [pk]
  post_id integer [ref: > posts.id]
  user_id integer [ref: > users.id]
}

// composite key, declared through indexes
Table post_tags {
  post_id integer
  tag_id integer

  indexes {
    (post_id, tag_id) [pk]
  }
}

Table tags {
  id integer [pk]
  name varchar
}

Table audit_log {
  message text
}

Ref: post_tags.post_id > posts.id
Ref: post_tags.tag_id > tags.id
)";

inline const char* API_YAML = R"(
openapi: "3.0.0"
info:
  title: Blog API
  version: "1.0"
paths:
  /users:
    get:
      parameters:
        - name: status
          in: query
          schema:
            type: string
        - $ref: '#/components/parameters/Page'
      responses:
        "200":
          description: OK
          content:
            application/json:
              schema:
                type: array
                items:
                  $ref: '#/components/schemas/UserSummary'
  /posts:
    parameters:
      - $ref: '#/components/parameters/Page'
    get:
      parameters:
        - name: limit
          in: query
          schema:
            type: integer
        - name: sort
          in: query
          schema:
            type: string
        - name: status
          in: query
          schema:
            type: string
        - name: preview
          in: query
          schema:
            type: boolean
      responses:
        "200":
          description: OK
          content:
            application/json:
              schema:
                type: object
                properties:
                  id:
                    type: integer
                  title:
                    type: string
                  author_name:
                    type: string
                  editor_name:
                    type: string
                  comment_count:
                    type: integer
                  comments:
                    type: array
                    items:
                      type: object
                  tags:
                    type: array
                    items:
                      type: object
        "404":
          $ref: '#/components/responses/NotFound'
components:
  parameters:
    Page:
      name: page
      in: query
      schema:
        type: integer
  responses:
    NotFound:
      description: Not found
      content:
        application/json:
          schema:
            $ref: '#/components/schemas/Problem'
  schemas:
    UserSummary:
      type: object
      properties:
        id:
          type: integer
        name:
          type: string
        email:
          type: string
        avatar_url:
          type: string
    Problem:
      type: object
      properties:
        code:
          type: integer
        message:
          type: string
)";

inline const char* USERS_LIST = R"(
version: "0.1"
import:
  openapi: ./api.yaml#paths["/users"].get.responses["200"]
  dbml:
    - ./schema.dbml#tables["users"]
    - ./schema.dbml#tables["profiles"]
usecase:
  name: List users
  summary: Users with their avatar
  response_mapping:
    - field: id
      source: users.id
    - field: name
      source: users.name
    - field: email
      source: users.email
    - field: avatar_url
      source: profiles.avatar_url
      join:
        table: profiles
        on: users.id = profiles.user_id
  filters:
    - param: status
      maps_to: WHERE
      condition: "users.status = :status"
)";

inline const char* POSTS_LIST = R"(
version: "0.1"
import:
  openapi: ./api.yaml#paths["/posts"].get
  dbml:
    - ./schema.dbml#tables["posts"]
    - ./schema.dbml#tables["users"]
    - ./schema.dbml#tables["comments"]
    - ./schema.dbml#tables["post_tags"]
    - ./schema.dbml#tables["tags"]
usecase:
  name: List posts
  output: posts.html
  response_mapping:
    - field: id
      source: posts.id
    - field: title
      source: posts.title
    - field: author_name
      source: author.name
      join:
        table: users
        alias: author
        on: posts.author_id = author.id
    - field: comment_count
      source: comments.id
      join:
        table: comments
        on: posts.id = comments.post_id
      aggregate:
        type: COUNT
    - field: comments
      type: array
      source_table: comments
      join:
        table: comments
        on: posts.id = comments.post_id
      fields:
        - field: body
          source: comments.body
        - field: commenter
          source: commenter.name
          join:
            table: users
            alias: commenter
            on: comments.user_id = commenter.id
    - field: tags
      type: array
      source_table: tags
      join:
        table: post_tags
        on: posts.id = post_tags.post_id
      join_chain:
        - table: tags
          on: post_tags.tag_id = tags.id
      fields:
        - field: name
          source: tags.name
  filters:
    - param: page
      maps_to: PAGINATION
      strategy: offset
      page_size: 20
      limit_param: limit
      max_page_size: 100
    - param: sort
      maps_to: ORDER_BY
      default_column: id
      default_direction: desc
      allowed_columns: [id, title]
      allowed_directions: [asc, desc]
  transforms:
    - target: author_name
      type: COALESCE
      sources: [author.name]
      fallback: anonymous
    - target: comments.body
      type: MASK
      source: comments.body
      mask_pattern: "***"
      condition:
        - param: preview
          operator: "="
          value: "true"
)";

inline parser::usml::Document parse_or_fail(const std::string& text) {
    auto result = parser::usml::parse_document(text);
    if (std::holds_alternative<parser::usml::ParseError>(result)) {
        ADD_FAILURE() << "Fixture failed to parse: "
                      << std::get<parser::usml::ParseError>(result).describe();
        return {};
    }
    return std::get<parser::usml::Document>(result);
}

// Resolvers seeded with the fixture files under the paths the mappings import
struct SeededResolvers {
    resolver::ApiSchemaResolver api;
    resolver::TableSchemaResolver tables;

    SeededResolvers() {
        EXPECT_TRUE(std::holds_alternative<common::Success>(api.register_document("api.yaml", API_YAML)));
        EXPECT_TRUE(std::holds_alternative<common::Success>(
            tables.register_document("schema.dbml", SCHEMA_DBML)));
    }

    resolver::ResolvedApiSchema resolve_api(const parser::usml::Document& doc) {
        auto result = api.resolve(doc.import_api);
        if (std::holds_alternative<resolver::ResolutionError>(result)) {
            ADD_FAILURE() << std::get<resolver::ResolutionError>(result).describe();
            return {};
        }
        return std::get<resolver::ResolvedApiSchema>(result);
    }

    resolver::ResolvedTableSchema resolve_tables(const parser::usml::Document& doc) {
        auto result = tables.resolve(doc.import_tables);
        if (std::holds_alternative<resolver::ResolutionError>(result)) {
            ADD_FAILURE() << std::get<resolver::ResolutionError>(result).describe();
            return {};
        }
        return std::get<resolver::ResolvedTableSchema>(result);
    }
};

} // namespace fixtures

#endif // USML_TEST_FIXTURES_HPP
