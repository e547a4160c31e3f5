/**
 * @file Entity.hpp
 * @brief Versioned safety-model elements and the links between them.
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <tuple>

namespace safetyreview::domain::model {

/**
 * @enum EntityKind
 * @brief Categories of model elements that can be versioned and reviewed.
 */
enum class EntityKind {
    Node,                ///< Fault-tree event or gate.
    FmeaRow,             ///< Row of an FMEA/FMEDA table.
    Requirement,         ///< Safety requirement.
    ArchitectureElement  ///< Block, part or port of an architecture diagram.
};

inline std::string EntityKindToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Node: return "node";
        case EntityKind::FmeaRow: return "fmea_row";
        case EntityKind::Requirement: return "requirement";
        case EntityKind::ArchitectureElement: return "architecture_element";
        default: return "unknown";
    }
}

inline EntityKind EntityKindFromString(const std::string& kind) {
    if (kind == "fmea_row") return EntityKind::FmeaRow;
    if (kind == "requirement") return EntityKind::Requirement;
    if (kind == "architecture_element") return EntityKind::ArchitectureElement;
    return EntityKind::Node;
}

/**
 * @struct Entity
 * @brief A model element identified by an id that is stable across versions.
 *
 * Relations are kept by identifier only: structure lives in Link records,
 * requirement allocations in the allocation set.
 */
struct Entity {
    std::string id;
    EntityKind kind = EntityKind::Node;
    std::map<std::string, std::string> fields; ///< description, rationale, asil, fit...
    std::set<std::string> allocations;         ///< Allocated requirement ids.

    Entity() = default;

    Entity(std::string entityId, EntityKind k, std::map<std::string, std::string> f = {})
        : id(std::move(entityId)), kind(k), fields(std::move(f)) {}

    std::string field(const std::string& name) const {
        auto it = fields.find(name);
        return it != fields.end() ? it->second : std::string();
    }

    bool operator==(const Entity& other) const {
        return id == other.id && kind == other.kind &&
               fields == other.fields && allocations == other.allocations;
    }
    bool operator!=(const Entity& other) const { return !(*this == other); }
};

/**
 * @struct Link
 * @brief Directed edge between two entities ("child", "connection", "trace"...).
 */
struct Link {
    std::string source;
    std::string target;
    std::string kind = "child";

    bool operator<(const Link& other) const {
        return std::tie(source, target, kind) < std::tie(other.source, other.target, other.kind);
    }
    bool operator==(const Link& other) const {
        return source == other.source && target == other.target && kind == other.kind;
    }
};

} // namespace safetyreview::domain::model
