/**
 * @file MemoryEntry.hpp
 * @brief Domain entity for a remembered review comment and its embedded code snippet.
 */

#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace reviewmemory::domain {

/**
 * @struct EntryMetadata
 * @brief Where and by whom a past review comment was written.
 */
struct EntryMetadata {
    std::string repository;      ///< e.g. "acme/payments".
    std::string pullRequestId;   ///< PR number as reported by the host platform.
    std::string filePath;
    int lineNumber = 0;          ///< New-file line the comment was attached to.
    std::string author;
    std::set<std::string> tags;  ///< Categories from the tag classifier.
    std::string timestamp;       ///< ISO-8601, as delivered by the event feed.

    bool operator==(const EntryMetadata& other) const {
        return repository == other.repository &&
               pullRequestId == other.pullRequestId &&
               filePath == other.filePath &&
               lineNumber == other.lineNumber &&
               author == other.author &&
               tags == other.tags &&
               timestamp == other.timestamp;
    }
};

/**
 * @struct MemoryEntry
 * @brief Immutable (snippet, comment, metadata) triple plus its embedding.
 *
 * Invariant: once stored, the id equals the entry's position in the store and
 * the embedding length equals the store dimension.
 */
struct MemoryEntry {
    std::uint64_t id = 0;
    std::vector<float> embedding;
    std::string snippetText;
    std::string commentText;
    EntryMetadata metadata;
};

} // namespace reviewmemory::domain
