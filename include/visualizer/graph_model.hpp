#ifndef USML_GRAPH_MODEL_HPP
#define USML_GRAPH_MODEL_HPP

#include "parser/document.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace visualizer {

// Chosen by precedence Aggregate > JoinChain > Join > Simple
enum class UnitKind {
    Simple,
    Join,
    JoinChain,
    Aggregate
};

struct FieldNode {
    std::string id;
    std::string name;
    std::string path;  // dotted path from the top level
    size_t depth{0};
    parser::usml::MappingKind kind{parser::usml::MappingKind::Scalar};
    std::vector<std::string> badges;
    std::string unit_id;
    std::vector<std::string> table_ids;
    std::vector<FieldNode> children;  // array fields own their sub-graph
};

// Join/transform unit between a field and the tables it reads
struct UnitNode {
    std::string id;
    std::string field_id;
    UnitKind kind{UnitKind::Simple};
    size_t depth{0};
    std::vector<std::string> join_lines;
    std::vector<std::string> transforms;
};

struct TableNode {
    std::string id;
    std::string physical_name;
    std::optional<std::string> alias;
    std::string display_name;  // "users (as author)" when aliased
    size_t reference_count{0};
    size_t column_count{0};
    bool imported{false};
};

enum class EdgeKind {
    FieldToUnit,
    UnitToTable
};

struct Edge {
    std::string from;
    std::string to;
    EdgeKind kind;
    UnitKind style;
};

enum class LayoutColumn {
    Fields = 0,
    Units = 1,
    Tables = 2
};

struct LayoutSlot {
    std::string id;
    LayoutColumn column;
    size_t row;
};

struct GraphModel {
    std::string title;
    std::optional<std::string> summary;

    std::vector<FieldNode> fields;  // top level only; nested fields live in children
    std::vector<UnitNode> units;    // one per field, pre-order
    std::vector<TableNode> tables;  // imported tables first, then in discovery order
    std::vector<Edge> edges;

    std::map<size_t, std::vector<std::string>> depth_groups;        // depth class -> field ids
    std::map<std::string, std::vector<std::string>> alias_groups;   // physical table -> aliased table ids
    std::map<std::string, std::vector<std::string>> highlights;     // field id -> unit and table ids
    std::vector<LayoutSlot> layout;

    const FieldNode* find_field(const std::string& path) const;
    const UnitNode* find_unit(const std::string& id) const;
    const TableNode* find_table(const std::string& physical_name,
                                const std::optional<std::string>& alias = std::nullopt) const;
};

// Layout classes stop growing after this depth
inline constexpr size_t MAX_DEPTH_CLASS = 4;

inline size_t depth_class(size_t depth) {
    return depth < MAX_DEPTH_CLASS ? depth : MAX_DEPTH_CLASS;
}

std::string to_string(UnitKind kind);
std::string to_string(EdgeKind kind);

nlohmann::ordered_json to_json(const GraphModel& model);

} // namespace visualizer

#endif // USML_GRAPH_MODEL_HPP
