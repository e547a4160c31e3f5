/**
 * @file IReviewSessionRepository.hpp
 * @brief Interfaces for persisting review sessions and approved versions.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../ReviewRegistry.hpp"
#include "../ReviewSession.hpp"

namespace safetyreview::domain::review {

class IReviewSessionRepository {
public:
    virtual ~IReviewSessionRepository() = default;

    // Save a brand new session (creates the stream/file)
    virtual void save(const ReviewSession& session) = 0;

    // Load by ID
    virtual std::optional<ReviewSession> findById(const std::string& id) = 0;

    // All stored sessions, in creation order
    virtual std::vector<ReviewSession> findAll() = 0;

    // Append uncommitted events and clear them on the aggregate
    virtual void update(ReviewSession& session) = 0;
};

class IVersionHistoryRepository {
public:
    virtual ~IVersionHistoryRepository() = default;

    virtual void append(const ApprovedVersion& version) = 0;

    // Oldest first
    virtual std::vector<ApprovedVersion> loadAll() = 0;
};

} // namespace safetyreview::domain::review
