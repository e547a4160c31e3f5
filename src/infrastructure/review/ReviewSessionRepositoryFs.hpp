/**
 * @file ReviewSessionRepositoryFs.hpp
 * @brief File system implementation of the ReviewSession repository.
 */

#pragma once

#include <memory>
#include "domain/review/repositories/IReviewSessionRepository.hpp"
#include "ReviewEventStoreFs.hpp"

namespace safetyreview::infrastructure::review {

using namespace safetyreview::domain::review;

class ReviewSessionRepositoryFs : public IReviewSessionRepository {
public:
    explicit ReviewSessionRepositoryFs(std::unique_ptr<ReviewEventStoreFs> eventStore);

    void save(const ReviewSession& session) override;
    std::optional<ReviewSession> findById(const std::string& id) override;
    std::vector<ReviewSession> findAll() override;
    void update(ReviewSession& session) override;

private:
    std::unique_ptr<ReviewEventStoreFs> m_eventStore;

    // Helper to serialize events from the aggregate
    std::vector<StoredEvent> serializeEvents(const std::vector<ReviewDomainEvent>& domainEvents);
};

} // namespace safetyreview::infrastructure::review
