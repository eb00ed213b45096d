/**
 * @file Suggestion.hpp
 * @brief Domain entities for generated review suggestions.
 */

#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "domain/DiffChunk.hpp"

namespace reviewmemory::domain {

/**
 * @struct ProvenanceItem
 * @brief A past review that contributed to a suggestion.
 */
struct ProvenanceItem {
    std::string author;
    float score = 0.0f; ///< Similarity of the contributing entry, 0.0 to 1.0.
    std::uint64_t entryId = 0;
};

/**
 * @struct Suggestion
 * @brief The single ranked suggestion produced for a chunk with accepted matches.
 */
struct Suggestion {
    DiffChunk chunk;
    std::string commentText;               ///< Generated text with the provenance footer.
    std::vector<ProvenanceItem> provenance; ///< Best match first.
    std::set<std::string> tags;
    int matchCount = 0;
};

} // namespace reviewmemory::domain
