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

namespace reviewmemory::infrastructure {

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
 * @brief Atomic file writes, either immediately or through a background queue.
 *
 * Every write goes to "<file>.<timestamp>.tmp" first and is renamed over the
 * target, so readers see either the previous or the new content, never a
 * partial file. Queued writes are performed sequentially by one worker thread.
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

    /** @brief Blocks until every queued write has been performed. */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /**
     * @brief Performs one atomic write (temp -> rename) on the calling thread.
     * @return false if any step failed; the target is then left untouched.
     */
    static bool writeAtomic(const std::string& filename, const std::string& content);

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace reviewmemory::infrastructure
