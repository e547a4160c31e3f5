/**
 * @file EntityStore.hpp
 * @brief Mutable working model of the editor, source of snapshots.
 */

#pragma once

#include <map>
#include <set>
#include <string>

#include "domain/model/Snapshot.hpp"

namespace safetyreview::domain::model {

/**
 * @class EntityStore
 * @brief Owns the current entities, links and allocations of a model.
 *
 * Every mutation keeps the snapshot invariants: links and allocations
 * can only reference entities that exist, and removing an entity drops
 * everything that pointed at it.
 */
class EntityStore {
public:
    // Inserts an entity or replaces its kind and fields. Allocations are only
    // changed through allocate()/deallocate().
    void upsertEntity(const Entity& entity);

    // Removes an entity together with its links and the allocations referencing it.
    void removeEntity(const std::string& id);

    void setField(const std::string& id, const std::string& field, const std::string& value);

    void addLink(const Link& link);
    void removeLink(const Link& link);

    void allocate(const std::string& entityId, const std::string& requirementId);
    void deallocate(const std::string& entityId, const std::string& requirementId);

    bool contains(const std::string& id) const { return m_entities.count(id) > 0; }
    size_t size() const { return m_entities.size(); }

    Snapshot currentSnapshot(const std::string& versionLabel = "working") const;

    // Replaces the whole model, e.g. after loading an approved version.
    void restore(const Snapshot& snapshot);

private:
    std::map<std::string, Entity> m_entities;
    std::set<Link> m_links;

    Entity& require(const std::string& id);
};

} // namespace safetyreview::domain::model
