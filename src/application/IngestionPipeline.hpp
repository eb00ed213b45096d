/**
 * @file IngestionPipeline.hpp
 * @brief Turns the comments of a finished review into memory entries.
 */

#pragma once
#include <memory>
#include <vector>
#include "domain/AIService.hpp"
#include "domain/MemoryEntry.hpp"
#include "domain/ReviewEvent.hpp"
#include "domain/services/DiffChunker.hpp"
#include "domain/services/TagClassifier.hpp"
#include "infrastructure/MemoryStore.hpp"

namespace reviewmemory::application {

/**
 * @class IngestionPipeline
 * @brief Orchestrates chunk lookup, embedding and append for each inline comment.
 */
class IngestionPipeline {
public:
    IngestionPipeline(std::shared_ptr<domain::AIService> ai,
                      std::shared_ptr<infrastructure::MemoryStore> store,
                      domain::DiffChunker chunker = domain::DiffChunker(),
                      domain::TagClassifier classifier = domain::TagClassifier(),
                      int maxParallelRequests = 4);

    /**
     * @brief Result of an ingestion pass.
     */
    struct IngestionResult {
        int commentsSeen = 0;
        std::vector<domain::MemoryEntry> appended;
        std::vector<domain::SkippedUnit> skipped;
    };

    /**
     * @brief Appends one entry per usable inline comment, in comment order.
     *
     * Comments without a covering chunk, with a failed embedding, or with an
     * embedding of the wrong size are skipped and reported.
     * @throws domain::DimensionMismatch when the first insert into a store with a
     *         configured dimension does not fit; the deployment is misconfigured.
     */
    IngestionResult ingest(const domain::ReviewEvent& event);

private:
    std::shared_ptr<domain::AIService> m_ai;
    std::shared_ptr<infrastructure::MemoryStore> m_store;
    domain::DiffChunker m_chunker;
    domain::TagClassifier m_classifier;
    int m_maxParallelRequests;
};

} // namespace reviewmemory::application
