#include "visualizer/graph_builder.hpp"
#include "common/logging.hpp"
#include <algorithm>

namespace visualizer {

using namespace parser::usml;

namespace {

    std::string join_line(const JoinSpec& join) {
        auto line = to_string(join.type) + " JOIN " + join.table + " ON " + join.on.to_string();
        if (join.alias) {
            line += " AS " + *join.alias;
        }
        return line;
    }

    std::string chain_line(const std::vector<JoinLink>& chain) {
        std::string line;
        for (const auto& link : chain) {
            if (!line.empty()) {
                line += " -> ";
            }
            line += "JOIN " + link.table + " ON " + link.on.to_string();
            if (link.alias) {
                line += " AS " + *link.alias;
            }
        }
        return line;
    }

    UnitKind unit_kind(const MappingNode& node) {
        if (node.aggregate) return UnitKind::Aggregate;
        if (!node.join_chain.empty()) return UnitKind::JoinChain;
        if (node.join) return UnitKind::Join;
        return UnitKind::Simple;
    }

    std::string transform_name(const Transform& transform) {
        if (const auto* unknown = std::get_if<UnknownPayload>(&transform.payload)) {
            return unknown->type_name;
        }
        return to_string(transform.type());
    }

    class GraphBuilder {
    public:
        GraphBuilder(const Document& doc,
                     const resolver::ResolvedTableSchema& tables,
                     const validator::ScopeIndex& scopes)
            : doc_(doc), tables_(tables), scopes_(scopes) {}

        GraphModel build() {
            model_.title = doc_.usecase_name;
            model_.summary = doc_.usecase_summary;

            for (const auto& ref : doc_.import_tables) {
                if (!model_.find_table(ref.table)) {
                    auto& table = table_node(ref.table, std::nullopt);
                    table.imported = true;
                }
            }

            for (const auto& mapping : doc_.response_mappings) {
                model_.fields.push_back(visit(mapping, ""));
            }

            for (size_t row = 0; row < model_.units.size(); ++row) {
                model_.layout.push_back({model_.units[row].field_id, LayoutColumn::Fields, row});
                model_.layout.push_back({model_.units[row].id, LayoutColumn::Units, row});
            }
            for (size_t row = 0; row < model_.tables.size(); ++row) {
                model_.layout.push_back({model_.tables[row].id, LayoutColumn::Tables, row});
            }

            common::log::debug("Graph for '" + model_.title + "': " +
                               std::to_string(model_.units.size()) + " fields, " +
                               std::to_string(model_.tables.size()) + " tables, " +
                               std::to_string(model_.edges.size()) + " edges");
            return std::move(model_);
        }

    private:
        TableNode& table_node(const std::string& physical, const std::optional<std::string>& alias) {
            auto it = std::find_if(model_.tables.begin(), model_.tables.end(),
                [&](const TableNode& table) {
                    return table.physical_name == physical && table.alias == alias;
                });
            if (it != model_.tables.end()) {
                return *it;
            }

            TableNode table;
            table.physical_name = physical;
            table.alias = alias;
            table.id = "table:" + physical + (alias ? "@" + *alias : "");
            table.display_name = alias ? physical + " (as " + *alias + ")" : physical;
            if (const auto* info = tables_.find_table(physical)) {
                table.column_count = info->columns.size();
            }
            if (alias) {
                model_.alias_groups[physical].push_back(table.id);
            }
            model_.tables.push_back(std::move(table));
            return model_.tables.back();
        }

        // A qualifier is an alias when the symbol table maps it to another name
        std::pair<std::string, std::optional<std::string>> qualify(const validator::SymbolTable& symbols,
                                                                   const std::string& qualifier) {
            const auto physical = symbols.resolve(qualifier);
            if (physical == qualifier) {
                return {physical, std::nullopt};
            }
            return {physical, qualifier};
        }

        FieldNode visit(const MappingNode& node, const std::string& prefix) {
            const auto& scope = scopes_.scope_of(node);

            FieldNode field;
            field.name = node.field;
            field.path = prefix.empty() ? node.field : prefix + "." + node.field;
            field.id = "field:" + field.path;
            field.depth = scope.depth;
            field.kind = node.kind();
            if (node.aggregate) {
                field.badges.push_back(node.aggregate->type_name);
            }
            if (node.array()) {
                field.badges.push_back("array");
            }

            UnitNode unit;
            unit.id = "unit:" + field.path;
            unit.field_id = field.id;
            unit.kind = unit_kind(node);
            unit.depth = scope.depth;
            if (node.join) {
                unit.join_lines.push_back(join_line(*node.join));
            }
            if (!node.join_chain.empty()) {
                unit.join_lines.push_back(chain_line(node.join_chain));
            }
            for (const auto& transform : doc_.transforms) {
                if (transform.target == field.path || transform.target == field.name) {
                    unit.transforms.push_back(transform_name(transform));
                }
            }
            field.unit_id = unit.id;

            std::vector<std::pair<std::string, std::optional<std::string>>> touched;
            auto touch = [&touched](std::pair<std::string, std::optional<std::string>> table) {
                if (std::find(touched.begin(), touched.end(), table) == touched.end()) {
                    touched.push_back(std::move(table));
                }
            };
            if (const auto* scalar = node.scalar()) {
                touch(qualify(scope.table(), scalar->source.table));
            } else {
                touch(qualify(scope.table(), node.array()->source_table));
            }
            if (node.join) {
                touch({node.join->table, node.join->alias});
            }
            for (const auto& link : node.join_chain) {
                touch({link.table, link.alias});
            }

            model_.edges.push_back({field.id, unit.id, EdgeKind::FieldToUnit, unit.kind});
            auto& highlight = model_.highlights[field.id];
            highlight.push_back(unit.id);
            for (const auto& [physical, alias] : touched) {
                auto& table = table_node(physical, alias);
                ++table.reference_count;
                field.table_ids.push_back(table.id);
                highlight.push_back(table.id);
                model_.edges.push_back({unit.id, table.id, EdgeKind::UnitToTable, unit.kind});
            }

            model_.depth_groups[depth_class(scope.depth)].push_back(field.id);
            model_.units.push_back(std::move(unit));

            if (const auto* array = node.array()) {
                for (const auto& child : array->children) {
                    field.children.push_back(visit(child, field.path));
                }
            }
            return field;
        }

        const Document& doc_;
        const resolver::ResolvedTableSchema& tables_;
        const validator::ScopeIndex& scopes_;
        GraphModel model_;
    };
}

GraphModel build_graph(const Document& doc, const resolver::ResolvedTableSchema& tables) {
    const auto scopes = validator::ScopeIndex::build(doc);
    return build_graph(doc, tables, scopes);
}

GraphModel build_graph(const Document& doc,
                       const resolver::ResolvedTableSchema& tables,
                       const validator::ScopeIndex& scopes) {
    return GraphBuilder(doc, tables, scopes).build();
}

} // namespace visualizer
