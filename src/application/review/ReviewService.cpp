/**
 * @file ReviewService.cpp
 * @brief Implementation of ReviewService.
 */

#include "ReviewService.hpp"
#include <exception>
#include <iostream>
#include "domain/model/DiffEngine.hpp"
#include "domain/review/ReviewErrors.hpp"

namespace safetyreview::application::review {

using safetyreview::domain::model::DiffEngine;

ReviewService::ReviewService(std::shared_ptr<EntityStore> store,
                             std::shared_ptr<IReviewSessionRepository> sessionRepository,
                             std::shared_ptr<IVersionHistoryRepository> versionRepository,
                             infrastructure::ReviewSettings settings,
                             Clock clock)
    : m_store(std::move(store)),
      m_sessionRepository(std::move(sessionRepository)),
      m_versionRepository(std::move(versionRepository)),
      m_settings(std::move(settings)),
      m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      m_registry(m_settings.versionPrefix) {
    reload();
}

ReviewService::TimePoint ReviewService::now() const {
    // Storage keeps milliseconds; truncating here keeps reloaded state identical.
    return std::chrono::time_point_cast<std::chrono::milliseconds>(m_clock());
}

void ReviewService::reload() {
    ReviewRegistry registry(m_settings.versionPrefix);
    for (auto& version : m_versionRepository->loadAll()) {
        registry.adoptVersion(std::move(version));
    }
    for (auto& session : m_sessionRepository->findAll()) {
        std::string name = session.getName();
        try {
            registry.adopt(std::move(session));
        } catch (const ReviewError& e) {
            std::cerr << "[ReviewService] Skipping stored review '" << name << "': " << e.what() << std::endl;
        }
    }
    m_registry = std::move(registry);
}

// --- Lifecycle ---

std::string ReviewService::startReview(ReviewKind kind,
                                       const std::string& name,
                                       const std::string& description,
                                       const ReviewScope& scope,
                                       const std::vector<Participant>& participants,
                                       std::optional<TimePoint> dueDate) {
    TimePoint current = now();
    TimePoint due = dueDate ? *dueDate : current + std::chrono::hours(24 * m_settings.defaultReviewDays);

    ReviewSession& session = m_registry.createSession(kind, scope, participants, name, description, due, current);
    m_sessionRepository->save(session);
    session.clearUncommittedEvents();

    std::cout << "[ReviewService] Started " << KindToString(kind) << " review " << session.getId()
              << " (" << name << ")" << std::endl;
    return session.getId();
}

std::string ReviewService::startPeerReview(const std::string& name,
                                           const std::string& description,
                                           const ReviewScope& scope,
                                           const std::vector<Participant>& participants,
                                           std::optional<TimePoint> dueDate) {
    return startReview(ReviewKind::Peer, name, description, scope, participants, dueDate);
}

std::string ReviewService::startJointReview(const std::string& name,
                                            const std::string& description,
                                            const ReviewScope& scope,
                                            const std::vector<Participant>& participants,
                                            std::optional<TimePoint> dueDate) {
    return startReview(ReviewKind::Joint, name, description, scope, participants, dueDate);
}

void ReviewService::extendDueDate(const std::string& reviewId, const std::string& actor, TimePoint newDueDate) {
    ReviewSession& session = m_registry.require(reviewId);
    session.extendDueDate(actor, newDueDate, now());
    m_sessionRepository->update(session);
}

void ReviewService::editDescription(const std::string& reviewId, const std::string& actor,
                                    const std::string& description) {
    ReviewSession& session = m_registry.require(reviewId);
    session.editDescription(actor, description, now());
    m_sessionRepository->update(session);
}

void ReviewService::addParticipant(const std::string& reviewId, const std::string& actor,
                                   const Participant& participant) {
    ReviewSession& session = m_registry.require(reviewId);
    session.addParticipant(actor, participant, now());
    m_sessionRepository->update(session);
}

void ReviewService::removeParticipant(const std::string& reviewId, const std::string& actor,
                                      const std::string& name) {
    ReviewSession& session = m_registry.require(reviewId);
    session.removeParticipant(actor, name, now());
    m_sessionRepository->update(session);
}

void ReviewService::markReviewerComplete(const std::string& reviewId, const std::string& actor) {
    ReviewSession& session = m_registry.require(reviewId);
    session.markReviewerComplete(actor, now());
    m_sessionRepository->update(session);
}

std::string ReviewService::approve(const std::string& reviewId, const std::string& approver) {
    Snapshot current = m_store->currentSnapshot();
    current.validate();

    // Restored if the version cannot be stored, so memory never runs ahead of disk.
    ReviewRegistry before = m_registry;
    const ApprovedVersion& version = m_registry.approve(reviewId, approver, current, now());
    try {
        m_versionRepository->append(version);
    } catch (const std::exception& e) {
        std::cerr << "[ReviewService] Approval of " << reviewId << " not stored: " << e.what() << std::endl;
        m_registry = std::move(before);
        throw;
    }
    m_sessionRepository->update(m_registry.require(reviewId));

    std::cout << "[ReviewService] Review " << reviewId << " approved by " << approver
              << " as version " << version.label << std::endl;
    return version.label;
}

// --- Comments ---

int ReviewService::addComment(const std::string& reviewId, const std::string& actor,
                              const CommentTarget& target, const std::string& text) {
    ReviewSession& session = m_registry.require(reviewId);
    int id = session.addComment(actor, target, text, now()).commentId;
    m_sessionRepository->update(session);
    return id;
}

void ReviewService::resolveComment(const std::string& reviewId, const std::string& actor,
                                   int commentId, const std::string& explanation) {
    ReviewSession& session = m_registry.require(reviewId);
    session.resolveComment(actor, commentId, explanation, now());
    m_sessionRepository->update(session);
}

int ReviewService::reopenComment(const std::string& reviewId, const std::string& actor,
                                 int commentId, const std::string& text) {
    ReviewSession& session = m_registry.require(reviewId);
    int id = session.reopenComment(actor, commentId, text, now()).commentId;
    m_sessionRepository->update(session);
    return id;
}

size_t ReviewService::mergeCommentsFrom(const std::string& reviewId,
                                        const Snapshot& sourceSnapshot,
                                        const CommentLedger& sourceLedger) {
    size_t merged = m_registry.mergeComments(sourceSnapshot, sourceLedger, reviewId, now());
    if (merged > 0) {
        m_sessionRepository->update(m_registry.require(reviewId));
    }
    return merged;
}

std::set<std::string> ReviewService::unresolvedTargets(const std::string& reviewId) const {
    return getReview(reviewId).getLedger().unresolvedTargets();
}

// --- Comparison ---

Snapshot ReviewService::resolveVersion(const std::string& label) const {
    if (label == WorkingVersion) {
        return m_store->currentSnapshot(WorkingVersion);
    }
    const ApprovedVersion* version = m_registry.findVersion(label);
    if (!version) {
        throw ReviewError(ReviewErrorCode::NotFound, "Version not found: " + label);
    }
    return version->snapshot;
}

ChangeSet ReviewService::compareVersions(const std::string& baseLabel,
                                         const std::string& otherLabel,
                                         const std::optional<std::set<std::string>>& scope) const {
    return DiffEngine::diff(resolveVersion(baseLabel), resolveVersion(otherLabel), scope);
}

ChangeSet ReviewService::compareOnOpen(const std::string& reviewId) const {
    const ReviewSession& session = getReview(reviewId);
    const ApprovedVersion* baseline = m_registry.latestApproved();

    // Nothing approved yet: everything in scope shows up as added.
    Snapshot base = baseline ? baseline->snapshot : Snapshot("none", {}, {});
    return DiffEngine::diff(base, m_store->currentSnapshot(WorkingVersion), session.getScope().allIds());
}

// --- Queries ---

ReviewStatus ReviewService::status(const std::string& reviewId) const {
    return getReview(reviewId).status(now());
}

const ReviewSession& ReviewService::getReview(const std::string& reviewId) const {
    const ReviewSession* session = m_registry.find(reviewId);
    if (!session) {
        throw ReviewError(ReviewErrorCode::NotFound, "Review not found: " + reviewId);
    }
    return *session;
}

} // namespace safetyreview::application::review
