/**
 * @file ReviewSession.cpp
 * @brief Implementation of ReviewSession.
 */

#include "domain/review/ReviewSession.hpp"

#include <algorithm>
#include <iterator>

#include "domain/review/ReviewErrors.hpp"

namespace safetyreview::domain::review {

ReviewSession::ReviewSession(std::string id,
                             std::string name,
                             std::string description,
                             ReviewKind kind,
                             ReviewScope scope,
                             std::vector<Participant> participants,
                             TimePoint dueDate,
                             std::string baselineVersion,
                             TimePoint now)
    : m_id(std::move(id)),
      m_name(std::move(name)),
      m_description(std::move(description)),
      m_kind(kind),
      m_participants(std::move(participants)),
      m_dueDate(dueDate),
      m_createdAt(now),
      m_baselineVersion(std::move(baselineVersion)),
      m_ledger(scope) {
    validateParticipants(m_participants);

    ReviewCreated evt{
        m_id,
        m_name,
        m_description,
        m_kind,
        std::move(scope),
        m_participants,
        m_dueDate,
        m_baselineVersion,
        now
    };
    m_uncommittedEvents.push_back(evt);
}

void ReviewSession::validateParticipants(const std::vector<Participant>& participants) {
    std::set<std::string> names;
    for (const auto& p : participants) {
        if (p.name.empty()) {
            throw ReviewError(ReviewErrorCode::InvalidParticipants, "Participant name cannot be empty.");
        }
        if (!names.insert(p.name).second) {
            throw ReviewError(ReviewErrorCode::InvalidParticipants,
                              "Participant " + p.name + " is listed more than once.");
        }
    }
    if (CountRole(participants, Role::Moderator) == 0) {
        throw ReviewError(ReviewErrorCode::InvalidParticipants, "A review needs at least one moderator.");
    }
    if (CountRole(participants, Role::Reviewer) == 0) {
        throw ReviewError(ReviewErrorCode::InvalidParticipants, "A review needs at least one reviewer.");
    }
}

ReviewStatus ReviewSession::status(TimePoint now) const {
    if (m_approved) return ReviewStatus::Approved;
    if (now >= m_dueDate) return ReviewStatus::ReadOnly;
    return ReviewStatus::Open;
}

const Participant* ReviewSession::findParticipant(const std::string& name) const {
    for (const auto& p : m_participants) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

std::vector<std::string> ReviewSession::pendingReviewers() const {
    std::vector<std::string> pending;
    for (const auto& p : m_participants) {
        if (p.role == Role::Reviewer && !m_completedReviewers.count(p.name)) {
            pending.push_back(p.name);
        }
    }
    return pending;
}

bool ReviewSession::approvalPreconditionsMet() const {
    return pendingReviewers().empty() && m_ledger.allResolved();
}

const Participant& ReviewSession::authorize(const std::string& actor, ReviewAction action, TimePoint now) const {
    const Participant* participant = findParticipant(actor);
    if (!participant) {
        throw ReviewError(ReviewErrorCode::PermissionDenied,
                          actor + " is not a participant of review " + m_name + ".");
    }
    if (!IsPermitted(participant->role, action)) {
        throw ReviewError(ReviewErrorCode::PermissionDenied,
                          "A " + RoleToString(participant->role) + " cannot " + ActionToString(action) + ".");
    }

    ReviewStatus current = status(now);
    if (current == ReviewStatus::Approved) {
        throw ReviewError(ReviewErrorCode::ReviewLocked, "Review " + m_name + " is approved and final.");
    }
    if (current == ReviewStatus::ReadOnly && !IsAllowedWhileReadOnly(action)) {
        throw ReviewError(ReviewErrorCode::ReviewLocked,
                          "Review " + m_name + " is past its due date and read-only.");
    }
    return *participant;
}

void ReviewSession::extendDueDate(const std::string& actor, TimePoint newDueDate, TimePoint now) {
    authorize(actor, ReviewAction::ExtendDueDate, now);

    m_dueDate = newDueDate;
    m_uncommittedEvents.push_back(DueDateExtended{m_id, actor, newDueDate, now});
}

void ReviewSession::markReviewerComplete(const std::string& actor, TimePoint now) {
    authorize(actor, ReviewAction::MarkComplete, now);
    if (m_completedReviewers.count(actor)) {
        return;
    }

    m_completedReviewers.insert(actor);
    m_uncommittedEvents.push_back(ReviewerCompleted{m_id, actor, now});
}

void ReviewSession::approve(const std::string& actor, const std::string& versionLabel, TimePoint now) {
    if (m_kind == ReviewKind::Peer) {
        throw ReviewError(ReviewErrorCode::PermissionDenied,
                          "Peer review " + m_name + " has no approval step.");
    }
    authorize(actor, ReviewAction::Approve, now);

    auto pending = pendingReviewers();
    if (!pending.empty()) {
        throw ReviewError(ReviewErrorCode::ApprovalBlocked,
                          "Not all reviewers are done (" + std::to_string(pending.size()) + " pending).");
    }
    if (!m_ledger.allResolved()) {
        throw ReviewError(ReviewErrorCode::ApprovalBlocked,
                          "There are " + std::to_string(m_ledger.unresolvedTargets().size()) +
                          " elements with unresolved comments.");
    }

    m_approved = true;
    m_approver = actor;
    m_approvedAt = now;
    m_baselineVersion = versionLabel;
    m_uncommittedEvents.push_back(ReviewApproved{m_id, actor, versionLabel, now});
}

const Comment& ReviewSession::addComment(const std::string& actor, const CommentTarget& target,
                                         const std::string& text, TimePoint now) {
    authorize(actor, ReviewAction::AddComment, now);

    const Comment& comment = m_ledger.addComment(target, actor, text, now);
    m_uncommittedEvents.push_back(CommentAdded{m_id, comment.commentId, actor, target, text, std::nullopt, now});
    return comment;
}

const Comment& ReviewSession::resolveComment(const std::string& actor, int commentId,
                                             const std::string& explanation, TimePoint now) {
    authorize(actor, ReviewAction::ResolveComment, now);

    const Comment& comment = m_ledger.resolve(commentId, explanation, actor, now);
    m_uncommittedEvents.push_back(CommentResolved{m_id, commentId, actor, explanation, now});
    return comment;
}

const Comment& ReviewSession::reopenComment(const std::string& actor, int commentId,
                                            const std::string& text, TimePoint now) {
    authorize(actor, ReviewAction::AddComment, now);

    const Comment& comment = m_ledger.reopen(commentId, actor, text, now);
    m_uncommittedEvents.push_back(
        CommentAdded{m_id, comment.commentId, actor, comment.target, text, commentId, now});
    return comment;
}

bool ReviewSession::importComment(const Comment& foreign, TimePoint now) {
    if (m_approved) {
        throw ReviewError(ReviewErrorCode::ReviewLocked, "Review " + m_name + " is approved and final.");
    }
    if (const Comment* local = m_ledger.findDuplicateOf(foreign)) {
        // The other copy settled a discussion that is still open here.
        if (foreign.resolved && !local->resolved && !foreign.resolution.empty()) {
            int localId = local->commentId;
            m_ledger.resolve(localId, foreign.resolution, foreign.resolvedBy, foreign.resolvedAt);
            m_uncommittedEvents.push_back(
                CommentResolved{m_id, localId, foreign.resolvedBy, foreign.resolution, foreign.resolvedAt});
            return true;
        }
        return false;
    }

    const Comment& imported = m_ledger.import(foreign);
    m_uncommittedEvents.push_back(CommentImported{m_id, imported, now});
    return true;
}

void ReviewSession::editDescription(const std::string& actor, const std::string& description, TimePoint now) {
    authorize(actor, ReviewAction::EditDetails, now);

    m_description = description;
    m_uncommittedEvents.push_back(DescriptionEdited{m_id, actor, description, now});
}

void ReviewSession::addParticipant(const std::string& actor, const Participant& participant, TimePoint now) {
    authorize(actor, ReviewAction::EditParticipants, now);

    std::vector<Participant> updated = m_participants;
    updated.push_back(participant);
    validateParticipants(updated);

    m_participants = std::move(updated);
    m_uncommittedEvents.push_back(ParticipantAdded{m_id, actor, participant, now});
}

void ReviewSession::removeParticipant(const std::string& actor, const std::string& name, TimePoint now) {
    authorize(actor, ReviewAction::EditParticipants, now);

    std::vector<Participant> updated;
    std::copy_if(m_participants.begin(), m_participants.end(), std::back_inserter(updated),
                 [&](const Participant& p) { return p.name != name; });
    if (updated.size() == m_participants.size()) {
        throw ReviewError(ReviewErrorCode::NotFound, name + " is not a participant of review " + m_name + ".");
    }
    validateParticipants(updated);

    m_participants = std::move(updated);
    m_completedReviewers.erase(name);
    m_uncommittedEvents.push_back(ParticipantRemoved{m_id, actor, name, now});
}

// --- Rehydration ---

ReviewSession ReviewSession::createEmpty(std::string id) {
    ReviewSession session;
    session.m_id = std::move(id);
    return session;
}

void ReviewSession::applyEvent(const ReviewDomainEvent& event) {
    std::visit([this](auto&& arg) {
        this->apply(arg);
    }, event);
}

void ReviewSession::apply(const ReviewCreated& e) {
    m_id = e.reviewId;
    m_name = e.name;
    m_description = e.description;
    m_kind = e.kind;
    m_participants = e.participants;
    m_dueDate = e.dueDate;
    m_createdAt = e.timestamp;
    m_baselineVersion = e.baselineVersion;
    m_ledger = CommentLedger(e.scope);
}

void ReviewSession::apply(const DueDateExtended& e) {
    m_dueDate = e.newDueDate;
}

void ReviewSession::apply(const ReviewerCompleted& e) {
    m_completedReviewers.insert(e.reviewer);
}

void ReviewSession::apply(const CommentAdded& e) {
    if (e.reopens) {
        m_ledger.reopen(*e.reopens, e.author, e.text, e.timestamp);
    } else {
        m_ledger.addComment(e.target, e.author, e.text, e.timestamp);
    }
}

void ReviewSession::apply(const CommentResolved& e) {
    m_ledger.resolve(e.commentId, e.explanation, e.resolvedBy, e.timestamp);
}

void ReviewSession::apply(const CommentImported& e) {
    m_ledger.import(e.comment);
}

void ReviewSession::apply(const DescriptionEdited& e) {
    m_description = e.description;
}

void ReviewSession::apply(const ParticipantAdded& e) {
    m_participants.push_back(e.participant);
}

void ReviewSession::apply(const ParticipantRemoved& e) {
    m_participants.erase(std::remove_if(m_participants.begin(), m_participants.end(),
                                        [&](const Participant& p) { return p.name == e.name; }),
                         m_participants.end());
    m_completedReviewers.erase(e.name);
}

void ReviewSession::apply(const ReviewApproved& e) {
    m_approved = true;
    m_approver = e.approver;
    m_approvedAt = e.timestamp;
    m_baselineVersion = e.versionLabel;
}

bool ReviewSession::operator==(const ReviewSession& other) const {
    return m_id == other.m_id &&
           m_name == other.m_name &&
           m_description == other.m_description &&
           m_kind == other.m_kind &&
           m_participants == other.m_participants &&
           m_dueDate == other.m_dueDate &&
           m_createdAt == other.m_createdAt &&
           m_baselineVersion == other.m_baselineVersion &&
           m_ledger == other.m_ledger &&
           m_completedReviewers == other.m_completedReviewers &&
           m_approved == other.m_approved &&
           m_approver == other.m_approver &&
           m_approvedAt == other.m_approvedAt;
}

} // namespace safetyreview::domain::review
