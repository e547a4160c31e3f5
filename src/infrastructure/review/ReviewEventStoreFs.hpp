/**
 * @file ReviewEventStoreFs.hpp
 * @brief File-system based Event Store for review sessions.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "infrastructure/PersistenceService.hpp"

namespace safetyreview::infrastructure::review {

struct StoredEvent {
    std::string eventType;
    std::string eventDataJson; // The payload
    std::chrono::system_clock::time_point timestamp;
};

class ReviewEventStoreFs {
public:
    explicit ReviewEventStoreFs(std::string projectRoot, std::shared_ptr<PersistenceService> persistence);

    // Appends new events to the log
    void append(const std::string& reviewId, const std::vector<StoredEvent>& events);

    // Reads all events for a review
    std::vector<StoredEvent> readAll(const std::string& reviewId);

    // Review ids found in storage, oldest stream first
    std::vector<std::string> getAllReviewIds();

private:
    std::string m_projectRoot;
    std::shared_ptr<PersistenceService> m_persistence;

    std::string getEventsFilePath(const std::string& reviewId) const;
};

} // namespace safetyreview::infrastructure::review
