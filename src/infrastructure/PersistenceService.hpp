/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace safetyreview::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * Review streams, version snapshots and settings are all written through
 * this single queue, so two writers never race on the same file.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every queued write has reached the disk.
     *
     * Readers call this before opening a file they may have just written.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    // Number of writes that failed since construction.
    size_t failedWrites() const { return m_failedWrites.load(); }

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     * @return false if the file could not be written.
     */
    bool performAtomicWrite(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_failedWrites{0};
};

} // namespace safetyreview::infrastructure
