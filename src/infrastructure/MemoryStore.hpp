/**
 * @file MemoryStore.hpp
 * @brief Append-only vector memory of past review comments.
 */

#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/MemoryEntry.hpp"
#include "infrastructure/FlatVectorIndex.hpp"

namespace reviewmemory::infrastructure {

/**
 * @struct SearchHit
 * @brief A stored entry and its squared L2 distance to the query.
 */
struct SearchHit {
    std::shared_ptr<const domain::MemoryEntry> entry;
    float distance = 0.0f;
};

/**
 * @struct MemoryStats
 * @brief Read-only introspection of a store.
 */
struct MemoryStats {
    std::size_t entryCount = 0;
    std::size_t dimension = 0;
    std::map<std::string, std::size_t> tagHistogram;
};

/**
 * @class MemoryStore
 * @brief Ordered entries plus a flat index, kept in 1:1 positional correspondence.
 *
 * Entries are only appended; the id of an entry is its position. Every public
 * operation takes the store mutex, so appends are serialized. Callers must still
 * hold their own scope around load-mutate-persist sequences.
 */
class MemoryStore {
public:
    /**
     * @param dimension Fixed deployment dimension, or 0 to let the first insert define it.
     */
    explicit MemoryStore(std::size_t dimension = 0);

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    /**
     * @brief Appends an entry and assigns its id.
     * @throws domain::DimensionMismatch if the embedding length differs from the store dimension.
     */
    std::uint64_t insert(domain::MemoryEntry entry);

    /**
     * @brief Up to topK nearest entries, closest first, ties by insertion order.
     *
     * An empty store returns no hits.
     * @throws domain::DimensionMismatch if the query length differs from a non-empty store's dimension.
     */
    std::vector<SearchHit> search(const std::vector<float>& query, std::size_t topK) const;

    /**
     * @brief Writes an atomic snapshot into `directory`.
     * @throws std::runtime_error if the snapshot could not be written.
     */
    void persist(const std::string& directory) const;

    /**
     * @brief Replaces the contents with the snapshot in `directory`.
     * @return false when the directory holds no snapshot at all (store left unchanged).
     * @throws domain::CorruptStore if the snapshot is inconsistent or its dimension
     *         disagrees with a fixed deployment dimension.
     */
    bool load(const std::string& directory);

    MemoryStats stats() const;

    std::size_t size() const;
    std::size_t dimension() const;

    /** @brief True when the dimension came from configuration rather than the first insert. */
    bool isDimensionConfigured() const { return m_configuredDimension != 0; }

    std::shared_ptr<const domain::MemoryEntry> entryAt(std::size_t position) const;

private:
    std::size_t m_configuredDimension;
    std::vector<std::shared_ptr<const domain::MemoryEntry>> m_entries;
    FlatVectorIndex m_index;
    mutable std::mutex m_mutex;
};

} // namespace reviewmemory::infrastructure
