/**
 * @file ChangeSet.hpp
 * @brief Ordered description of the differences between two snapshots.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/model/Entity.hpp"

namespace safetyreview::domain::model {

enum class ChangeKind {
    EntityAdded,
    EntityRemoved,
    EntityModified,
    LinkAdded,
    LinkRemoved,
    AllocationAdded,
    AllocationRemoved
};

inline std::string ChangeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::EntityAdded: return "added";
        case ChangeKind::EntityRemoved: return "removed";
        case ChangeKind::EntityModified: return "modified";
        case ChangeKind::LinkAdded: return "link_added";
        case ChangeKind::LinkRemoved: return "link_removed";
        case ChangeKind::AllocationAdded: return "allocation_added";
        case ChangeKind::AllocationRemoved: return "allocation_removed";
        default: return "unknown";
    }
}

/**
 * @struct TextDelta
 * @brief Single deleted/inserted span between a shared prefix and suffix.
 *
 * Invariant: old == prefix + deleted + suffix and new == prefix + inserted + suffix.
 */
struct TextDelta {
    std::string prefix;
    std::string deleted;
    std::string inserted;
    std::string suffix;

    bool operator==(const TextDelta& other) const {
        return prefix == other.prefix && deleted == other.deleted &&
               inserted == other.inserted && suffix == other.suffix;
    }
};

/**
 * @struct FieldChange
 * @brief One field whose value differs between the two versions.
 */
struct FieldChange {
    std::string field;
    std::string oldValue;
    std::string newValue;
    TextDelta delta;
    bool added = false;   ///< Field absent in the old version.
    bool removed = false; ///< Field absent in the new version.

    bool operator==(const FieldChange& other) const {
        return field == other.field && oldValue == other.oldValue && newValue == other.newValue &&
               delta == other.delta && added == other.added && removed == other.removed;
    }
};

/**
 * @struct ChangeRecord
 * @brief One entry of a ChangeSet. Which members are set depends on kind:
 * entity records carry entityId/entityKind (and fieldChanges when modified),
 * link records carry link, allocation records carry entityId/requirementId.
 */
struct ChangeRecord {
    ChangeKind kind;
    std::string entityId;
    EntityKind entityKind = EntityKind::Node;
    std::vector<FieldChange> fieldChanges;
    Link link;
    std::string requirementId;

    bool operator==(const ChangeRecord& other) const {
        return kind == other.kind && entityId == other.entityId && entityKind == other.entityKind &&
               fieldChanges == other.fieldChanges && link == other.link &&
               requirementId == other.requirementId;
    }
};

/**
 * @class ChangeSet
 * @brief Flat, deterministically ordered sequence of change records.
 */
class ChangeSet {
public:
    ChangeSet() = default;
    ChangeSet(std::string baseVersion, std::string targetVersion)
        : m_baseVersion(std::move(baseVersion)), m_targetVersion(std::move(targetVersion)) {}

    void append(ChangeRecord record) { m_records.push_back(std::move(record)); }

    const std::vector<ChangeRecord>& records() const { return m_records; }
    const std::string& baseVersion() const { return m_baseVersion; }
    const std::string& targetVersion() const { return m_targetVersion; }

    bool empty() const { return m_records.empty(); }
    size_t size() const { return m_records.size(); }

    size_t count(ChangeKind kind) const {
        size_t n = 0;
        for (const auto& r : m_records) {
            if (r.kind == kind) ++n;
        }
        return n;
    }

    // Entity ids of the records of one kind, in ChangeSet order.
    std::vector<std::string> entityIds(ChangeKind kind) const {
        std::vector<std::string> ids;
        for (const auto& r : m_records) {
            if (r.kind == kind) ids.push_back(r.entityId);
        }
        return ids;
    }

    std::vector<Link> links(ChangeKind kind) const {
        std::vector<Link> result;
        for (const auto& r : m_records) {
            if (r.kind == kind) result.push_back(r.link);
        }
        return result;
    }

    // Records compare equal when their content matches; version labels are metadata.
    bool operator==(const ChangeSet& other) const { return m_records == other.m_records; }

private:
    std::string m_baseVersion;
    std::string m_targetVersion;
    std::vector<ChangeRecord> m_records;
};

} // namespace safetyreview::domain::model
