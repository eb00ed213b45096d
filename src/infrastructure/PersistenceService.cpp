/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace reviewmemory::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(SaveTask{filename, content});
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return (m_queue.empty() && !m_busy) || !m_running;
    });
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        writeAtomic(task.filename, task.content);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::writeAtomic(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[PersistenceService] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace reviewmemory::infrastructure
