/**
 * @file VersionHistoryRepositoryFs.hpp
 * @brief File system storage of approved model versions.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/review/repositories/IReviewSessionRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace safetyreview::infrastructure::review {

using namespace safetyreview::domain::review;

/**
 * @brief Keeps <root>/reviews/versions/index.json plus one snapshot document per label.
 */
class VersionHistoryRepositoryFs : public IVersionHistoryRepository {
public:
    VersionHistoryRepositoryFs(std::string projectRoot, std::shared_ptr<PersistenceService> persistence);

    void append(const ApprovedVersion& version) override;
    std::vector<ApprovedVersion> loadAll() override;

private:
    std::string m_projectRoot;
    std::shared_ptr<PersistenceService> m_persistence;

    std::string versionsDir() const;
};

} // namespace safetyreview::infrastructure::review
