/**
 * @file ReviewSession.hpp
 * @brief Aggregate Root for a single peer or joint review.
 */

#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "domain/review/CommentLedger.hpp"
#include "domain/review/events/ReviewEvents.hpp"
#include "domain/review/value_objects/Participant.hpp"
#include "domain/review/value_objects/ReviewScope.hpp"
#include "domain/review/value_objects/ReviewStatus.hpp"
#include "domain/review/value_objects/Role.hpp"

namespace safetyreview::domain::review {

/**
 * @class ReviewSession
 * @brief Review workflow state machine: Open -> ReadOnly -> Approved.
 *
 * ReadOnly is not stored: it is derived from the due date and the time
 * passed to each call, so a moderator extending the due date reopens the
 * session without a separate transition. Every command checks the
 * permission table first, then the lifecycle lock, then its own
 * preconditions, and records a domain event on success.
 */
class ReviewSession {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @throws ReviewError(InvalidParticipants) unless there is at least one
     *         moderator and one reviewer and names are unique.
     */
    ReviewSession(std::string id,
                  std::string name,
                  std::string description,
                  ReviewKind kind,
                  ReviewScope scope,
                  std::vector<Participant> participants,
                  TimePoint dueDate,
                  std::string baselineVersion,
                  TimePoint now);

    // --- Event Management ---
    const std::vector<ReviewDomainEvent>& getUncommittedEvents() const { return m_uncommittedEvents; }
    void clearUncommittedEvents() { m_uncommittedEvents.clear(); }

    // --- Accessors ---
    const std::string& getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    const std::string& getDescription() const { return m_description; }
    ReviewKind getKind() const { return m_kind; }
    const ReviewScope& getScope() const { return m_ledger.scope(); }
    const std::vector<Participant>& getParticipants() const { return m_participants; }
    TimePoint getDueDate() const { return m_dueDate; }
    TimePoint getCreatedAt() const { return m_createdAt; }
    const std::string& getBaselineVersion() const { return m_baselineVersion; }
    const CommentLedger& getLedger() const { return m_ledger; }
    const std::set<std::string>& getCompletedReviewers() const { return m_completedReviewers; }
    bool isApproved() const { return m_approved; }
    const std::string& getApprover() const { return m_approver; }
    TimePoint getApprovedAt() const { return m_approvedAt; }

    ReviewStatus status(TimePoint now) const;

    const Participant* findParticipant(const std::string& name) const;
    std::vector<std::string> pendingReviewers() const;

    // True when every reviewer is done and every comment is resolved.
    bool approvalPreconditionsMet() const;

    // --- Commands (State Mutators) ---

    void extendDueDate(const std::string& actor, TimePoint newDueDate, TimePoint now);

    // Idempotent: a second call by the same reviewer records nothing.
    void markReviewerComplete(const std::string& actor, TimePoint now);

    /**
     * @brief Approves a joint review and makes @p versionLabel its baseline.
     * @throws ReviewError(PermissionDenied) for peer reviews and non-approvers.
     * @throws ReviewError(ReviewLocked) after the due date.
     * @throws ReviewError(ApprovalBlocked) while reviewers are pending or comments open.
     */
    void approve(const std::string& actor, const std::string& versionLabel, TimePoint now);

    const Comment& addComment(const std::string& actor, const CommentTarget& target,
                              const std::string& text, TimePoint now);
    const Comment& resolveComment(const std::string& actor, int commentId,
                                  const std::string& explanation, TimePoint now);
    const Comment& reopenComment(const std::string& actor, int commentId,
                                 const std::string& text, TimePoint now);

    // Takes over a comment from another review. A duplicate only carries over a
    // resolution the local copy lacks. Returns false when nothing changed.
    bool importComment(const Comment& foreign, TimePoint now);

    void editDescription(const std::string& actor, const std::string& description, TimePoint now);
    void addParticipant(const std::string& actor, const Participant& participant, TimePoint now);
    void removeParticipant(const std::string& actor, const std::string& name, TimePoint now);

    // --- Rehydration (Apply Events) ---
    static ReviewSession createEmpty(std::string id);

    void applyEvent(const ReviewDomainEvent& event);

    void apply(const ReviewCreated& e);
    void apply(const DueDateExtended& e);
    void apply(const ReviewerCompleted& e);
    void apply(const CommentAdded& e);
    void apply(const CommentResolved& e);
    void apply(const CommentImported& e);
    void apply(const DescriptionEdited& e);
    void apply(const ParticipantAdded& e);
    void apply(const ParticipantRemoved& e);
    void apply(const ReviewApproved& e);

    // Compares persisted state; uncommitted events are ignored.
    bool operator==(const ReviewSession& other) const;

private:
    ReviewSession() = default;

    std::string m_id;
    std::string m_name;
    std::string m_description;
    ReviewKind m_kind = ReviewKind::Peer;
    std::vector<Participant> m_participants;
    TimePoint m_dueDate;
    TimePoint m_createdAt;
    std::string m_baselineVersion;
    CommentLedger m_ledger;
    std::set<std::string> m_completedReviewers;

    bool m_approved = false;
    std::string m_approver;
    TimePoint m_approvedAt;

    std::vector<ReviewDomainEvent> m_uncommittedEvents;

    const Participant& authorize(const std::string& actor, ReviewAction action, TimePoint now) const;
    static void validateParticipants(const std::vector<Participant>& participants);
};

} // namespace safetyreview::domain::review
