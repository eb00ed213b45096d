/**
 * @file MemorySnapshot.hpp
 * @brief On-disk snapshot of a memory store: metadata document + raw vector blob.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "domain/MemoryEntry.hpp"

namespace reviewmemory::infrastructure {

/**
 * @struct SnapshotData
 * @brief Everything a snapshot restores. Entry embeddings come from the blob.
 */
struct SnapshotData {
    std::uint64_t generation = 0;
    std::size_t dimension = 0;
    std::vector<domain::MemoryEntry> entries;
};

/**
 * @class MemorySnapshot
 * @brief Reads and writes the two co-located snapshot artifacts.
 *
 * Layout inside the snapshot directory:
 *   memory.json             version tag, generation, dimension, entry count,
 *                           blob file name and per-position entry metadata.
 *   vectors-<generation>.bin
 *                           "RMVI", u32 format, u64 generation, u32 dimension,
 *                           u64 count, then count * dimension float32 values,
 *                           all little-endian.
 *
 * A write stores the new blob under a fresh generation, then atomically
 * replaces memory.json, then removes older blobs. memory.json is the commit
 * point, so an interrupted write leaves the previous snapshot readable.
 */
class MemorySnapshot {
public:
    static constexpr const char* kVersionTag = "reviewmemory-snapshot/1";
    static constexpr const char* kMetadataFile = "memory.json";
    static constexpr std::uint32_t kBlobFormat = 1;

    explicit MemorySnapshot(std::string directory);

    /** @brief True when either artifact is present. */
    bool exists() const;

    /** @brief Generation of the committed snapshot, 0 when none. */
    std::uint64_t currentGeneration() const;

    /**
     * @brief Writes a new generation of the snapshot.
     * @return The generation written.
     * @throws std::runtime_error if an artifact could not be written.
     */
    std::uint64_t write(std::size_t dimension, const std::vector<domain::MemoryEntry>& entries) const;

    /**
     * @brief Reads and cross-checks both artifacts.
     * @throws domain::CorruptStore on any inconsistency.
     */
    SnapshotData read() const;

    const std::string& directory() const { return m_directory; }

private:
    std::string blobFileName(std::uint64_t generation) const;
    std::vector<std::string> listBlobs() const;

    std::string m_directory;
};

} // namespace reviewmemory::infrastructure
