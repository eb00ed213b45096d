/**
 * @file SimilarityMatch.hpp
 * @brief Pairing of a query chunk with a remembered entry.
 */

#pragma once
#include <memory>
#include "domain/DiffChunk.hpp"
#include "domain/MemoryEntry.hpp"

namespace reviewmemory::domain {

/**
 * @struct SimilarityMatch
 * @brief One search hit, scored and judged against the current threshold.
 */
struct SimilarityMatch {
    std::shared_ptr<const DiffChunk> chunk;
    std::shared_ptr<const MemoryEntry> entry;
    float score = 0.0f;    ///< In (0, 1], higher is more similar.
    bool accepted = false;
};

} // namespace reviewmemory::domain
