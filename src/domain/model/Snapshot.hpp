/**
 * @file Snapshot.hpp
 * @brief Immutable state of a safety model at one version.
 */

#pragma once

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/model/Entity.hpp"

namespace safetyreview::domain::model {

/**
 * @brief Raised when a snapshot breaks its referential invariants.
 *
 * Only an upstream store defect can produce one, so callers abort the
 * operation instead of recovering.
 */
class MalformedSnapshotError : public std::logic_error {
public:
    explicit MalformedSnapshotError(const std::string& msg) : std::logic_error(msg) {}
};

/**
 * @class Snapshot
 * @brief Entities and links of a model frozen under a version label.
 *
 * Entities are keyed by id in ascending order, links are ordered by
 * (source, target, kind). Both orderings feed the diff determinism.
 */
class Snapshot {
public:
    Snapshot() = default;
    Snapshot(std::string versionLabel, std::vector<Entity> entities, std::vector<Link> links);

    const std::string& version() const { return m_version; }
    const std::map<std::string, Entity>& entities() const { return m_entities; }
    const std::set<Link>& links() const { return m_links; }

    const Entity* find(const std::string& id) const;
    bool contains(const std::string& id) const { return m_entities.count(id) > 0; }
    bool empty() const { return m_entities.empty() && m_links.empty(); }

    /**
     * @brief Checks that every link endpoint and every allocation resolves.
     * @throws MalformedSnapshotError on the first dangling reference.
     */
    void validate() const;

    /// Copy under another version label (a working copy becoming "v3").
    Snapshot relabeled(const std::string& versionLabel) const;

    bool operator==(const Snapshot& other) const {
        return m_version == other.m_version && m_entities == other.m_entities && m_links == other.m_links;
    }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }

private:
    std::string m_version;
    std::map<std::string, Entity> m_entities;
    std::set<Link> m_links;
};

} // namespace safetyreview::domain::model
