/**
 * @file ReviewRegistry.hpp
 * @brief Owner of all review sessions of a model and of its approved versions.
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "domain/model/Snapshot.hpp"
#include "domain/review/ReviewSession.hpp"

namespace safetyreview::domain::review {

/**
 * @struct ApprovedVersion
 * @brief Model snapshot frozen by a joint review approval.
 */
struct ApprovedVersion {
    std::string label;
    model::Snapshot snapshot;
    std::string sessionId;
    std::string approver;
    std::chrono::system_clock::time_point timestamp;

    bool operator==(const ApprovedVersion& other) const {
        return label == other.label && snapshot == other.snapshot && sessionId == other.sessionId &&
               approver == other.approver && timestamp == other.timestamp;
    }
};

/**
 * @class ReviewRegistry
 * @brief Process-wide collection of review sessions for one model.
 *
 * Not synchronized: callers serialize writes through the active document.
 */
class ReviewRegistry {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit ReviewRegistry(std::string versionPrefix = "v");

    /**
     * @brief Creates a session whose baseline is the latest approved version.
     * @throws ReviewError(DuplicateName) if the name is taken.
     * @throws ReviewError(InvalidParticipants) if role counts are violated.
     */
    ReviewSession& createSession(ReviewKind kind,
                                 ReviewScope scope,
                                 std::vector<Participant> participants,
                                 const std::string& name,
                                 const std::string& description,
                                 TimePoint dueDate,
                                 TimePoint now);

    // Registers a session rehydrated from storage.
    void adopt(ReviewSession session);
    void adoptVersion(ApprovedVersion version);

    ReviewSession* find(const std::string& id);
    const ReviewSession* find(const std::string& id) const;
    ReviewSession* findByName(const std::string& name);

    // @throws ReviewError(NotFound)
    ReviewSession& require(const std::string& id);

    // Sessions in creation order.
    std::vector<const ReviewSession*> sessions() const;
    size_t size() const { return m_sessions.size(); }

    /**
     * @brief Copies comments from another review into @p targetSessionId.
     *
     * Only comments whose target exists in @p sourceSnapshot and lies in the
     * target scope are taken; duplicates (same target, author and text) are
     * skipped, so running the merge twice changes nothing the second time.
     * @return Number of comments merged.
     */
    size_t mergeComments(const model::Snapshot& sourceSnapshot,
                         const CommentLedger& sourceLedger,
                         const std::string& targetSessionId,
                         TimePoint now);

    /**
     * @brief Approves a session and appends @p current to the approved history.
     * @return The new history entry.
     */
    const ApprovedVersion& approve(const std::string& sessionId,
                                   const std::string& approver,
                                   const model::Snapshot& current,
                                   TimePoint now);

    // Oldest first.
    const std::vector<ApprovedVersion>& approvedHistory() const { return m_history; }
    const ApprovedVersion* latestApproved() const;
    const ApprovedVersion* findVersion(const std::string& label) const;
    std::string nextVersionLabel() const;

private:
    std::string m_versionPrefix;
    std::map<std::string, ReviewSession> m_sessions;
    std::vector<std::string> m_order;
    std::vector<ApprovedVersion> m_history;

    std::string nextSessionId() const;
};

} // namespace safetyreview::domain::review
