/**
 * @file ReviewPipeline.hpp
 * @brief Produces suggestions for a newly opened change from remembered reviews.
 */

#pragma once
#include <memory>
#include <vector>
#include "application/SuggestionAggregator.hpp"
#include "domain/AIService.hpp"
#include "domain/CommentSink.hpp"
#include "domain/ReviewEvent.hpp"
#include "domain/services/DiffChunker.hpp"
#include "domain/services/SimilarityPolicy.hpp"
#include "infrastructure/MemoryStore.hpp"

namespace reviewmemory::application {

/**
 * @struct ReviewSettings
 * @brief Search breadth and request parallelism of a review pass.
 */
struct ReviewSettings {
    std::size_t topK = 3;
    int maxParallelRequests = 4;
};

/**
 * @struct ReviewReport
 * @brief Everything a review pass produced, as also handed to the comment sink.
 */
struct ReviewReport {
    std::vector<domain::Suggestion> suggestions;
    domain::ReviewSummary summary;
};

/**
 * @class ReviewPipeline
 * @brief Chunk, embed, search, rank, aggregate and publish.
 *
 * Per-chunk failures (embedding, search dimension, generation) are isolated and
 * counted as skipped; the remaining chunks are still published. When review
 * guidelines are configured, a chunk without an accepted match is reviewed
 * against the guidelines alone.
 */
class ReviewPipeline {
public:
    ReviewPipeline(std::shared_ptr<domain::AIService> ai,
                   std::shared_ptr<infrastructure::MemoryStore> store,
                   std::shared_ptr<domain::CommentSink> sink,
                   domain::DiffChunker chunker,
                   domain::SimilarityPolicy policy,
                   std::shared_ptr<SuggestionAggregator> aggregator,
                   ReviewSettings settings = {});

    ReviewReport review(const domain::ChangeSet& change);

    /** @brief Search and rank for a single embedded chunk. */
    std::vector<domain::SimilarityMatch> match(const std::shared_ptr<const domain::DiffChunk>& chunk,
                                               const std::vector<float>& embedding,
                                               float threshold) const;

private:
    /** @brief Aggregates, or guideline-reviews when accepted is empty, and publishes the result. */
    void generate(const domain::DiffChunk& chunk,
                  const std::vector<domain::SimilarityMatch>& accepted,
                  ReviewReport& report);
    void finish(ReviewReport& report);

    std::shared_ptr<domain::AIService> m_ai;
    std::shared_ptr<infrastructure::MemoryStore> m_store;
    std::shared_ptr<domain::CommentSink> m_sink;
    domain::DiffChunker m_chunker;
    domain::SimilarityPolicy m_policy;
    std::shared_ptr<SuggestionAggregator> m_aggregator;
    ReviewSettings m_settings;
};

} // namespace reviewmemory::application
