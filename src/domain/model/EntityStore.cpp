/**
 * @file EntityStore.cpp
 * @brief Implementation of EntityStore.
 */

#include "domain/model/EntityStore.hpp"

#include <stdexcept>
#include <vector>

namespace safetyreview::domain::model {

Entity& EntityStore::require(const std::string& id) {
    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        throw std::invalid_argument("Entity not found: " + id);
    }
    return it->second;
}

void EntityStore::upsertEntity(const Entity& entity) {
    if (entity.id.empty()) {
        throw std::invalid_argument("EntityStore: entity id cannot be empty.");
    }

    auto it = m_entities.find(entity.id);
    if (it == m_entities.end()) {
        Entity fresh(entity.id, entity.kind, entity.fields);
        m_entities.emplace(entity.id, std::move(fresh));
        return;
    }

    if (it->second.kind == EntityKind::Requirement && entity.kind != EntityKind::Requirement) {
        for (const auto& [id, other] : m_entities) {
            if (other.allocations.count(entity.id)) {
                throw std::invalid_argument("EntityStore: requirement " + entity.id +
                                            " is still allocated to " + id + ".");
            }
        }
    }
    it->second.kind = entity.kind;
    it->second.fields = entity.fields;
}

void EntityStore::removeEntity(const std::string& id) {
    if (m_entities.erase(id) == 0) {
        return;
    }

    for (auto it = m_links.begin(); it != m_links.end();) {
        if (it->source == id || it->target == id) {
            it = m_links.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& [otherId, other] : m_entities) {
        other.allocations.erase(id);
    }
}

void EntityStore::setField(const std::string& id, const std::string& field, const std::string& value) {
    require(id).fields[field] = value;
}

void EntityStore::addLink(const Link& link) {
    if (!contains(link.source) || !contains(link.target)) {
        throw std::invalid_argument("EntityStore: link " + link.source + " -> " + link.target +
                                    " references an unknown entity.");
    }
    m_links.insert(link);
}

void EntityStore::removeLink(const Link& link) {
    m_links.erase(link);
}

void EntityStore::allocate(const std::string& entityId, const std::string& requirementId) {
    Entity& entity = require(entityId);
    auto req = m_entities.find(requirementId);
    if (req == m_entities.end() || req->second.kind != EntityKind::Requirement) {
        throw std::invalid_argument("EntityStore: " + requirementId + " is not a requirement.");
    }
    entity.allocations.insert(requirementId);
}

void EntityStore::deallocate(const std::string& entityId, const std::string& requirementId) {
    require(entityId).allocations.erase(requirementId);
}

Snapshot EntityStore::currentSnapshot(const std::string& versionLabel) const {
    std::vector<Entity> entities;
    entities.reserve(m_entities.size());
    for (const auto& [id, entity] : m_entities) {
        entities.push_back(entity);
    }
    return Snapshot(versionLabel, std::move(entities), std::vector<Link>(m_links.begin(), m_links.end()));
}

void EntityStore::restore(const Snapshot& snapshot) {
    snapshot.validate();
    m_entities = snapshot.entities();
    m_links = snapshot.links();
}

} // namespace safetyreview::domain::model
