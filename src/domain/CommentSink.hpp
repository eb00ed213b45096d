/**
 * @file CommentSink.hpp
 * @brief Interface for the collaborator that posts suggestions.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ReviewEvent.hpp"
#include "domain/Suggestion.hpp"

namespace reviewmemory::domain {

/**
 * @struct ReviewSummary
 * @brief Totals of a review pass, reported once after all suggestions.
 */
struct ReviewSummary {
    std::string repository;
    std::string pullRequestId;
    std::string model;           ///< Model that generated the suggestions.
    int chunksAnalyzed = 0;
    int chunksWithMatches = 0;
    int suggestionsGenerated = 0;
    std::size_t memorySize = 0;
    float threshold = 0.0f;
    std::vector<SkippedUnit> skipped;
};

/**
 * @class CommentSink
 * @brief Receives suggestions; chooses inline or general placement and handles posting failures.
 */
class CommentSink {
public:
    virtual ~CommentSink() = default;

    /** @brief Publishes one suggestion. Placement is the sink's decision. */
    virtual void publish(const Suggestion& suggestion) = 0;

    /** @brief Publishes the pass summary after every suggestion was published. */
    virtual void publishSummary(const ReviewSummary& summary) = 0;
};

} // namespace reviewmemory::domain
