/**
 * @file ReviewService.hpp
 * @brief Application Service behind the review menu actions and toolbox.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/model/ChangeSet.hpp"
#include "domain/model/EntityStore.hpp"
#include "domain/review/ReviewRegistry.hpp"
#include "domain/review/repositories/IReviewSessionRepository.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace safetyreview::application::review {

using namespace safetyreview::domain::review;
using safetyreview::domain::model::ChangeSet;
using safetyreview::domain::model::EntityStore;
using safetyreview::domain::model::Snapshot;

/**
 * @class ReviewService
 * @brief Runs review use cases against the registry and persists every change.
 *
 * The registry is loaded from the repositories on construction. Each command
 * mutates the aggregate first and appends its events afterwards, so a
 * rejected command leaves both memory and storage untouched.
 */
class ReviewService {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Clock = std::function<TimePoint()>;

    /// Label accepted by compareVersions() for the editor's current model.
    static constexpr const char* WorkingVersion = "working";

    ReviewService(std::shared_ptr<EntityStore> store,
                  std::shared_ptr<IReviewSessionRepository> sessionRepository,
                  std::shared_ptr<IVersionHistoryRepository> versionRepository,
                  infrastructure::ReviewSettings settings = {},
                  Clock clock = {});

    // --- Lifecycle ("Start Peer Review" / "Start Joint Review") ---

    // Due date defaults to now + the configured number of days.
    std::string startPeerReview(const std::string& name,
                                const std::string& description,
                                const ReviewScope& scope,
                                const std::vector<Participant>& participants,
                                std::optional<TimePoint> dueDate = std::nullopt);

    std::string startJointReview(const std::string& name,
                                 const std::string& description,
                                 const ReviewScope& scope,
                                 const std::vector<Participant>& participants,
                                 std::optional<TimePoint> dueDate = std::nullopt);

    void extendDueDate(const std::string& reviewId, const std::string& actor, TimePoint newDueDate);
    void editDescription(const std::string& reviewId, const std::string& actor, const std::string& description);
    void addParticipant(const std::string& reviewId, const std::string& actor, const Participant& participant);
    void removeParticipant(const std::string& reviewId, const std::string& actor, const std::string& name);
    void markReviewerComplete(const std::string& reviewId, const std::string& actor);

    /**
     * @brief Approves a joint review and freezes the current model as a new version.
     * @return Label of the approved version.
     */
    std::string approve(const std::string& reviewId, const std::string& approver);

    // --- Comments (review toolbox) ---

    int addComment(const std::string& reviewId, const std::string& actor,
                   const CommentTarget& target, const std::string& text);
    void resolveComment(const std::string& reviewId, const std::string& actor,
                        int commentId, const std::string& explanation);
    int reopenComment(const std::string& reviewId, const std::string& actor,
                      int commentId, const std::string& text);

    // Consolidates comments collected in another copy of the model.
    size_t mergeCommentsFrom(const std::string& reviewId,
                             const Snapshot& sourceSnapshot,
                             const CommentLedger& sourceLedger);

    std::set<std::string> unresolvedTargets(const std::string& reviewId) const;

    // --- Comparison ---

    /**
     * @brief "Compare Versions": diff between two approved versions (or "working").
     * @throws ReviewError(NotFound) for unknown labels.
     */
    ChangeSet compareVersions(const std::string& baseLabel,
                              const std::string& otherLabel,
                              const std::optional<std::set<std::string>>& scope = std::nullopt) const;

    /**
     * @brief Diff shown when a review document opens: latest approved version
     * against the working model, restricted to the review scope.
     */
    ChangeSet compareOnOpen(const std::string& reviewId) const;

    // --- Queries ---
    ReviewStatus status(const std::string& reviewId) const;
    const ReviewSession& getReview(const std::string& reviewId) const;
    const ReviewRegistry& registry() const { return m_registry; }
    TimePoint now() const;

    void reload(); // Rebuild the registry from storage

private:
    std::shared_ptr<EntityStore> m_store;
    std::shared_ptr<IReviewSessionRepository> m_sessionRepository;
    std::shared_ptr<IVersionHistoryRepository> m_versionRepository;
    infrastructure::ReviewSettings m_settings;
    Clock m_clock;
    ReviewRegistry m_registry;

    std::string startReview(ReviewKind kind,
                            const std::string& name,
                            const std::string& description,
                            const ReviewScope& scope,
                            const std::vector<Participant>& participants,
                            std::optional<TimePoint> dueDate);

    Snapshot resolveVersion(const std::string& label) const;
};

} // namespace safetyreview::application::review
