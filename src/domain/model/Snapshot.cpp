/**
 * @file Snapshot.cpp
 * @brief Implementation of Snapshot.
 */

#include "domain/model/Snapshot.hpp"

namespace safetyreview::domain::model {

Snapshot::Snapshot(std::string versionLabel, std::vector<Entity> entities, std::vector<Link> links)
    : m_version(std::move(versionLabel)) {
    for (auto& entity : entities) {
        std::string id = entity.id;
        m_entities[id] = std::move(entity);
    }
    m_links.insert(links.begin(), links.end());
}

const Entity* Snapshot::find(const std::string& id) const {
    auto it = m_entities.find(id);
    return it != m_entities.end() ? &it->second : nullptr;
}

void Snapshot::validate() const {
    for (const auto& link : m_links) {
        if (!contains(link.source) || !contains(link.target)) {
            throw MalformedSnapshotError("Snapshot " + m_version + ": link " + link.source + " -> " +
                                         link.target + " (" + link.kind + ") has a dangling endpoint.");
        }
    }
    for (const auto& [id, entity] : m_entities) {
        for (const auto& reqId : entity.allocations) {
            const Entity* req = find(reqId);
            if (!req || req->kind != EntityKind::Requirement) {
                throw MalformedSnapshotError("Snapshot " + m_version + ": " + id +
                                             " is allocated to unknown requirement " + reqId + ".");
            }
        }
    }
}

Snapshot Snapshot::relabeled(const std::string& versionLabel) const {
    Snapshot copy(*this);
    copy.m_version = versionLabel;
    return copy;
}

} // namespace safetyreview::domain::model
