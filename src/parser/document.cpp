#include "parser/document.hpp"

namespace parser::usml {

std::optional<std::string> MappingNode::join_tail_table() const {
    if (!join) {
        return std::nullopt;
    }
    if (!join_chain.empty()) {
        return join_chain.back().table;
    }
    return join->table;
}

std::optional<std::string> MappingNode::join_tail_binding() const {
    if (!join) {
        return std::nullopt;
    }
    if (!join_chain.empty()) {
        return join_chain.back().binding_name();
    }
    return join->binding_name();
}

bool MappingNode::operator==(const MappingNode& other) const {
    if (field != other.field || body.index() != other.body.index()) {
        return false;
    }
    if (join != other.join || join_chain != other.join_chain || aggregate != other.aggregate) {
        return false;
    }
    if (const auto* mine = scalar()) {
        return mine->source == other.scalar()->source;
    }
    const auto* mine = array();
    const auto* theirs = other.array();
    return mine->source_table == theirs->source_table && mine->children == theirs->children;
}

std::string to_string(JoinType type) {
    switch (type) {
        case JoinType::Inner: return "INNER";
        case JoinType::Left: return "LEFT";
        case JoinType::Right: return "RIGHT";
    }
    return "LEFT";
}

std::string to_string(AggregateType type) {
    switch (type) {
        case AggregateType::Count: return "COUNT";
        case AggregateType::Sum: return "SUM";
        case AggregateType::Avg: return "AVG";
        case AggregateType::Min: return "MIN";
        case AggregateType::Max: return "MAX";
        case AggregateType::Unknown: break;
    }
    return "UNKNOWN";
}

std::string to_string(FilterTarget target) {
    switch (target) {
        case FilterTarget::Where: return "WHERE";
        case FilterTarget::Pagination: return "PAGINATION";
        case FilterTarget::OrderBy: return "ORDER_BY";
    }
    return "WHERE";
}

std::string to_string(PaginationStrategy strategy) {
    return strategy == PaginationStrategy::Cursor ? "cursor" : "offset";
}

std::string to_string(TransformType type) {
    switch (type) {
        case TransformType::Coalesce: return "COALESCE";
        case TransformType::Concat: return "CONCAT";
        case TransformType::Case: return "CASE";
        case TransformType::Mask: return "MASK";
        case TransformType::ConditionalSource: return "CONDITIONAL_SOURCE";
        case TransformType::Unknown: break;
    }
    return "UNKNOWN";
}

std::string to_string(ConditionSubject subject) {
    switch (subject) {
        case ConditionSubject::Param: return "param";
        case ConditionSubject::Field: return "field";
        case ConditionSubject::Source: return "source";
    }
    return "param";
}

} // namespace parser::usml
