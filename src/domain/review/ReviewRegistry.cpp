/**
 * @file ReviewRegistry.cpp
 * @brief Implementation of ReviewRegistry.
 */

#include "domain/review/ReviewRegistry.hpp"

#include <iomanip>
#include <sstream>

#include "domain/review/ReviewErrors.hpp"

namespace safetyreview::domain::review {

ReviewRegistry::ReviewRegistry(std::string versionPrefix)
    : m_versionPrefix(std::move(versionPrefix)) {}

std::string ReviewRegistry::nextSessionId() const {
    size_t n = m_sessions.size() + 1;
    std::string id;
    do {
        std::ostringstream ss;
        ss << "review-" << std::setw(3) << std::setfill('0') << n++;
        id = ss.str();
    } while (m_sessions.count(id));
    return id;
}

ReviewSession& ReviewRegistry::createSession(ReviewKind kind,
                                             ReviewScope scope,
                                             std::vector<Participant> participants,
                                             const std::string& name,
                                             const std::string& description,
                                             TimePoint dueDate,
                                             TimePoint now) {
    if (findByName(name)) {
        throw ReviewError(ReviewErrorCode::DuplicateName, "A review named " + name + " already exists.");
    }

    const ApprovedVersion* baseline = latestApproved();
    std::string id = nextSessionId();
    ReviewSession session(id, name, description, kind, std::move(scope), std::move(participants),
                          dueDate, baseline ? baseline->label : "", now);

    m_order.push_back(id);
    return m_sessions.emplace(id, std::move(session)).first->second;
}

void ReviewRegistry::adopt(ReviewSession session) {
    if (findByName(session.getName())) {
        throw ReviewError(ReviewErrorCode::DuplicateName,
                          "A review named " + session.getName() + " already exists.");
    }
    std::string id = session.getId();
    m_order.push_back(id);
    m_sessions.emplace(id, std::move(session));
}

void ReviewRegistry::adoptVersion(ApprovedVersion version) {
    m_history.push_back(std::move(version));
}

ReviewSession* ReviewRegistry::find(const std::string& id) {
    auto it = m_sessions.find(id);
    return it != m_sessions.end() ? &it->second : nullptr;
}

const ReviewSession* ReviewRegistry::find(const std::string& id) const {
    auto it = m_sessions.find(id);
    return it != m_sessions.end() ? &it->second : nullptr;
}

ReviewSession* ReviewRegistry::findByName(const std::string& name) {
    for (auto& [id, session] : m_sessions) {
        if (session.getName() == name) return &session;
    }
    return nullptr;
}

ReviewSession& ReviewRegistry::require(const std::string& id) {
    ReviewSession* session = find(id);
    if (!session) {
        throw ReviewError(ReviewErrorCode::NotFound, "Review not found: " + id);
    }
    return *session;
}

std::vector<const ReviewSession*> ReviewRegistry::sessions() const {
    std::vector<const ReviewSession*> result;
    result.reserve(m_order.size());
    for (const auto& id : m_order) {
        result.push_back(&m_sessions.at(id));
    }
    return result;
}

size_t ReviewRegistry::mergeComments(const model::Snapshot& sourceSnapshot,
                                     const CommentLedger& sourceLedger,
                                     const std::string& targetSessionId,
                                     TimePoint now) {
    ReviewSession& target = require(targetSessionId);
    if (target.isApproved()) {
        throw ReviewError(ReviewErrorCode::ReviewLocked,
                          "Review " + target.getName() + " is approved and final.");
    }

    size_t merged = 0;
    for (const auto& comment : sourceLedger.comments()) {
        if (!sourceSnapshot.contains(comment.target.entityId)) continue;
        if (!target.getScope().contains(comment.target.entityId)) continue;
        if (target.importComment(comment, now)) {
            ++merged;
        }
    }
    return merged;
}

const ApprovedVersion& ReviewRegistry::approve(const std::string& sessionId,
                                               const std::string& approver,
                                               const model::Snapshot& current,
                                               TimePoint now) {
    ReviewSession& session = require(sessionId);
    std::string label = nextVersionLabel();
    session.approve(approver, label, now);

    m_history.push_back(ApprovedVersion{label, current.relabeled(label), sessionId, approver, now});
    return m_history.back();
}

const ApprovedVersion* ReviewRegistry::latestApproved() const {
    return m_history.empty() ? nullptr : &m_history.back();
}

const ApprovedVersion* ReviewRegistry::findVersion(const std::string& label) const {
    for (const auto& version : m_history) {
        if (version.label == label) return &version;
    }
    return nullptr;
}

std::string ReviewRegistry::nextVersionLabel() const {
    return m_versionPrefix + std::to_string(m_history.size() + 1);
}

} // namespace safetyreview::domain::review
