/**
 * @file MemoryStore.cpp
 * @brief Implementation of MemoryStore.
 */

#include "infrastructure/MemoryStore.hpp"
#include <iostream>
#include "domain/MemoryErrors.hpp"
#include "infrastructure/MemorySnapshot.hpp"

namespace reviewmemory::infrastructure {

MemoryStore::MemoryStore(std::size_t dimension)
    : m_configuredDimension(dimension), m_index(dimension) {}

std::uint64_t MemoryStore::insert(domain::MemoryEntry entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (entry.embedding.empty()) {
        throw domain::DimensionMismatch(m_index.dimension(), 0);
    }
    if (m_index.dimension() == 0) {
        m_index.reset(entry.embedding.size()); // first insert defines D
    } else if (entry.embedding.size() != m_index.dimension()) {
        throw domain::DimensionMismatch(m_index.dimension(), entry.embedding.size());
    }

    entry.id = m_entries.size();
    m_index.add(entry.embedding);
    m_entries.push_back(std::make_shared<const domain::MemoryEntry>(std::move(entry)));
    return m_entries.back()->id;
}

std::vector<SearchHit> MemoryStore::search(const std::vector<float>& query, std::size_t topK) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<SearchHit> hits;
    if (m_entries.empty()) return hits;
    if (query.size() != m_index.dimension()) {
        throw domain::DimensionMismatch(m_index.dimension(), query.size());
    }

    for (const auto& hit : m_index.search(query, topK)) {
        hits.push_back({m_entries[hit.position], hit.distance});
    }
    return hits;
}

void MemoryStore::persist(const std::string& directory) const {
    std::vector<domain::MemoryEntry> entries;
    std::size_t dimension = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entries.reserve(m_entries.size());
        for (const auto& entry : m_entries) entries.push_back(*entry);
        dimension = m_index.dimension();
    }

    MemorySnapshot snapshot(directory);
    std::uint64_t generation = snapshot.write(dimension, entries);
    std::cout << "[MemoryStore] Persisted " << entries.size() << " entries (generation "
              << generation << ") to " << directory << std::endl;
}

bool MemoryStore::load(const std::string& directory) {
    MemorySnapshot snapshot(directory);
    if (!snapshot.exists()) {
        std::cout << "[MemoryStore] No snapshot in " << directory << ", starting empty." << std::endl;
        return false;
    }

    SnapshotData data = snapshot.read();
    if (m_configuredDimension != 0 && !data.entries.empty() && data.dimension != m_configuredDimension) {
        throw domain::CorruptStore("snapshot dimension " + std::to_string(data.dimension) +
                                   " does not match configured dimension " + std::to_string(m_configuredDimension));
    }

    FlatVectorIndex index(data.entries.empty() ? m_configuredDimension : data.dimension);
    std::vector<std::shared_ptr<const domain::MemoryEntry>> entries;
    entries.reserve(data.entries.size());
    for (auto& entry : data.entries) {
        index.add(entry.embedding);
        entries.push_back(std::make_shared<const domain::MemoryEntry>(std::move(entry)));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries = std::move(entries);
        m_index = std::move(index);
    }
    std::cout << "[MemoryStore] Loaded " << size() << " entries (dimension " << dimension()
              << ", generation " << data.generation << ") from " << directory << std::endl;
    return true;
}

MemoryStats MemoryStore::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    MemoryStats stats;
    stats.entryCount = m_entries.size();
    stats.dimension = m_index.dimension();
    for (const auto& entry : m_entries) {
        for (const auto& tag : entry->metadata.tags) {
            stats.tagHistogram[tag]++;
        }
    }
    return stats;
}

std::size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::size_t MemoryStore::dimension() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.dimension();
}

std::shared_ptr<const domain::MemoryEntry> MemoryStore::entryAt(std::size_t position) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (position >= m_entries.size()) return nullptr;
    return m_entries[position];
}

} // namespace reviewmemory::infrastructure
