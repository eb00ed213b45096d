/**
 * @file SimilarityPolicy.hpp
 * @brief Size-adaptive acceptance threshold and ranking of search hits.
 */

#pragma once
#include <cstddef>
#include <vector>
#include "domain/SimilarityMatch.hpp"

namespace reviewmemory::domain {

/**
 * @struct ThresholdStep
 * @brief Threshold used while the memory holds at most `maxMemorySize` entries.
 */
struct ThresholdStep {
    std::size_t maxMemorySize = 0;
    float threshold = 0.0f;
};

/**
 * @struct SimilarityPolicyConfig
 * @brief Threshold curve. Defaults: <=5 entries 0.2, <=10 entries 0.3, otherwise 0.4.
 *
 * Sparse memories accept weaker matches so that some signal surfaces; larger
 * memories raise the bar to suppress noise.
 */
struct SimilarityPolicyConfig {
    float minThreshold = 0.2f;
    float maxThreshold = 0.4f;
    std::vector<ThresholdStep> steps = {{5, 0.2f}, {10, 0.3f}};
};

/**
 * @class SimilarityPolicy
 * @brief Applies the threshold curve and orders matches.
 *
 * Invariant: threshold(s) lies in [minThreshold, maxThreshold] and never
 * decreases as s grows.
 */
class SimilarityPolicy {
public:
    /** @throws std::invalid_argument if the bounds are inverted or steps decrease. */
    explicit SimilarityPolicy(SimilarityPolicyConfig config = {});

    float threshold(std::size_t memorySize) const;

    /**
     * @brief Marks each match accepted when score >= threshold.
     * @return All matches, score descending, ties by entry id ascending.
     */
    std::vector<SimilarityMatch> rank(std::vector<SimilarityMatch> matches, float threshold) const;

    const SimilarityPolicyConfig& config() const { return m_config; }

    /** @brief Converts a squared L2 distance into a score in (0, 1]. */
    static float scoreFromDistance(float squaredDistance);

private:
    SimilarityPolicyConfig m_config;
};

} // namespace reviewmemory::domain
