/**
 * @file ReviewScope.hpp
 * @brief Value Object fixing which model elements a review covers.
 */

#pragma once

#include <set>
#include <string>

namespace safetyreview::domain::review {

/**
 * @class ReviewScope
 * @brief Frozen set of entity and requirement ids chosen at review creation.
 *
 * Invariant: never changes after construction.
 */
class ReviewScope {
public:
    ReviewScope() = default;

    explicit ReviewScope(std::set<std::string> entityIds, std::set<std::string> requirementIds = {})
        : m_entityIds(std::move(entityIds)), m_requirementIds(std::move(requirementIds)) {}

    bool contains(const std::string& id) const {
        return m_entityIds.count(id) > 0 || m_requirementIds.count(id) > 0;
    }

    const std::set<std::string>& entityIds() const { return m_entityIds; }
    const std::set<std::string>& requirementIds() const { return m_requirementIds; }

    // Union of entity and requirement ids, as used to restrict a diff.
    std::set<std::string> allIds() const {
        std::set<std::string> ids = m_entityIds;
        ids.insert(m_requirementIds.begin(), m_requirementIds.end());
        return ids;
    }

    bool empty() const { return m_entityIds.empty() && m_requirementIds.empty(); }

    bool operator==(const ReviewScope& other) const {
        return m_entityIds == other.m_entityIds && m_requirementIds == other.m_requirementIds;
    }

private:
    std::set<std::string> m_entityIds;
    std::set<std::string> m_requirementIds;
};

} // namespace safetyreview::domain::review
