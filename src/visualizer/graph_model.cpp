#include "visualizer/graph_model.hpp"
#include <algorithm>

namespace visualizer {

namespace {

    const FieldNode* find_in(const std::vector<FieldNode>& fields, const std::string& path) {
        for (const auto& field : fields) {
            if (field.path == path) {
                return &field;
            }
            if (const auto* found = find_in(field.children, path)) {
                return found;
            }
        }
        return nullptr;
    }

    nlohmann::ordered_json field_to_json(const FieldNode& field) {
        nlohmann::ordered_json out;
        out["id"] = field.id;
        out["name"] = field.name;
        out["path"] = field.path;
        out["depth"] = field.depth;
        out["kind"] = field.kind == parser::usml::MappingKind::Array ? "array" : "scalar";
        out["badges"] = field.badges;
        out["unit"] = field.unit_id;
        out["tables"] = field.table_ids;
        out["children"] = nlohmann::ordered_json::array();
        for (const auto& child : field.children) {
            out["children"].push_back(field_to_json(child));
        }
        return out;
    }
}

const FieldNode* GraphModel::find_field(const std::string& path) const {
    return find_in(fields, path);
}

const UnitNode* GraphModel::find_unit(const std::string& id) const {
    auto it = std::find_if(units.begin(), units.end(),
        [&id](const UnitNode& unit) { return unit.id == id; });
    return it == units.end() ? nullptr : &*it;
}

const TableNode* GraphModel::find_table(const std::string& physical_name,
                                        const std::optional<std::string>& alias) const {
    auto it = std::find_if(tables.begin(), tables.end(),
        [&](const TableNode& table) {
            return table.physical_name == physical_name && table.alias == alias;
        });
    return it == tables.end() ? nullptr : &*it;
}

std::string to_string(UnitKind kind) {
    switch (kind) {
        case UnitKind::Simple: return "simple";
        case UnitKind::Join: return "join";
        case UnitKind::JoinChain: return "join-chain";
        case UnitKind::Aggregate: return "aggregate";
    }
    return "simple";
}

std::string to_string(EdgeKind kind) {
    return kind == EdgeKind::FieldToUnit ? "field-unit" : "unit-table";
}

nlohmann::ordered_json to_json(const GraphModel& model) {
    nlohmann::ordered_json out;
    out["title"] = model.title;
    if (model.summary) {
        out["summary"] = *model.summary;
    }

    out["fields"] = nlohmann::ordered_json::array();
    for (const auto& field : model.fields) {
        out["fields"].push_back(field_to_json(field));
    }

    out["units"] = nlohmann::ordered_json::array();
    for (const auto& unit : model.units) {
        out["units"].push_back({
            {"id", unit.id},
            {"field", unit.field_id},
            {"kind", to_string(unit.kind)},
            {"depth", unit.depth},
            {"join_lines", unit.join_lines},
            {"transforms", unit.transforms}
        });
    }

    out["tables"] = nlohmann::ordered_json::array();
    for (const auto& table : model.tables) {
        nlohmann::ordered_json entry;
        entry["id"] = table.id;
        entry["name"] = table.physical_name;
        if (table.alias) {
            entry["alias"] = *table.alias;
        }
        entry["display"] = table.display_name;
        entry["references"] = table.reference_count;
        entry["columns"] = table.column_count;
        entry["imported"] = table.imported;
        out["tables"].push_back(std::move(entry));
    }

    out["edges"] = nlohmann::ordered_json::array();
    for (const auto& edge : model.edges) {
        out["edges"].push_back({
            {"from", edge.from},
            {"to", edge.to},
            {"kind", to_string(edge.kind)},
            {"style", to_string(edge.style)}
        });
    }

    out["depth_groups"] = nlohmann::ordered_json::object();
    for (const auto& [depth, ids] : model.depth_groups) {
        out["depth_groups"][std::to_string(depth)] = ids;
    }
    out["alias_groups"] = model.alias_groups;
    out["highlights"] = model.highlights;

    out["layout"] = nlohmann::ordered_json::array();
    for (const auto& slot : model.layout) {
        out["layout"].push_back({
            {"id", slot.id},
            {"column", static_cast<int>(slot.column)},
            {"row", slot.row}
        });
    }
    return out;
}

} // namespace visualizer
