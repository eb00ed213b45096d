/**
 * @file SuggestionAggregator.hpp
 * @brief Turns the accepted matches of a chunk into one generated suggestion.
 */

#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/AIService.hpp"
#include "domain/SimilarityMatch.hpp"
#include "domain/Suggestion.hpp"

namespace reviewmemory::application {

/**
 * @struct AggregatorConfig
 * @brief Exemplar budget and generation bounds.
 */
struct AggregatorConfig {
    int maxExemplars = 3;              ///< Primary exemplar plus up to N-1 supporting ones.
    domain::GenerationOptions generation;
    std::string reviewGuidelines;      ///< Optional team rules added to every prompt.
};

/**
 * @class SuggestionAggregator
 * @brief Groups matches, deduplicates provenance, merges tags and wraps the
 *        generated comment with the provenance footer.
 */
class SuggestionAggregator {
public:
    static constexpr const char* kNoReviewNeeded = "NO_REVIEW_NEEDED";

    SuggestionAggregator(std::shared_ptr<domain::AIService> ai, AggregatorConfig config = {});

    /**
     * @brief Builds the suggestion for a chunk.
     * @return nullopt when there are no matches or the generator declines to comment.
     * @throws domain::ExternalCallFailure / domain::ExternalCallTimeout from the generation call.
     */
    std::optional<domain::Suggestion> aggregate(const domain::DiffChunk& chunk,
                                                const std::vector<domain::SimilarityMatch>& acceptedMatches) const;

    /**
     * @brief Reviews a chunk against the review guidelines alone.
     *
     * The suggestion carries no provenance and a match count of 0; the guidelines
     * are appended under a "📜 Review context" block.
     * @return nullopt when no guidelines are configured or the generator declines to comment.
     * @throws domain::ExternalCallFailure / domain::ExternalCallTimeout from the generation call.
     */
    std::optional<domain::Suggestion> reviewWithGuidelines(const domain::DiffChunk& chunk) const;

    /** @brief True when the reply is empty or is exactly NO_REVIEW_NEEDED, ignoring surrounding whitespace. */
    static bool declines(const std::string& reply);

    /**
     * @brief The two footer lines appended to every generated comment.
     *
     * "🤖 This suggestion is based on N similar past review(s) by @author (similarity: P%)"
     * "📋 Related areas: tag1, tag2"
     */
    static std::string formatFooter(int matchCount, const std::string& primaryAuthor,
                                    float primaryScore, const std::set<std::string>& tags);

    const AggregatorConfig& config() const { return m_config; }

private:
    std::shared_ptr<domain::AIService> m_ai;
    AggregatorConfig m_config;
};

} // namespace reviewmemory::application
