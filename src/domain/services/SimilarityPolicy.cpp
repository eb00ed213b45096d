#include "domain/services/SimilarityPolicy.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace reviewmemory::domain {

SimilarityPolicy::SimilarityPolicy(SimilarityPolicyConfig config) : m_config(std::move(config)) {
    if (!(m_config.minThreshold >= 0.0f) || !(m_config.maxThreshold <= 1.0f) ||
        m_config.minThreshold > m_config.maxThreshold) {
        throw std::invalid_argument("SimilarityPolicy: thresholds must satisfy 0 <= min <= max <= 1.");
    }

    std::sort(m_config.steps.begin(), m_config.steps.end(), [](const auto& a, const auto& b) {
        return a.maxMemorySize < b.maxMemorySize;
    });
    for (size_t i = 1; i < m_config.steps.size(); ++i) {
        if (m_config.steps[i].threshold < m_config.steps[i - 1].threshold) {
            throw std::invalid_argument("SimilarityPolicy: step thresholds must not decrease (step up to " +
                                        std::to_string(m_config.steps[i].maxMemorySize) + " entries).");
        }
    }
}

float SimilarityPolicy::threshold(std::size_t memorySize) const {
    float value = m_config.maxThreshold;
    for (const auto& step : m_config.steps) {
        if (memorySize <= step.maxMemorySize) {
            value = step.threshold;
            break;
        }
    }
    // Steps outside the bounds are clamped; the curve stays monotone.
    return std::clamp(value, m_config.minThreshold, m_config.maxThreshold);
}

std::vector<SimilarityMatch> SimilarityPolicy::rank(std::vector<SimilarityMatch> matches, float threshold) const {
    for (auto& match : matches) {
        match.accepted = match.score >= threshold;
    }

    std::stable_sort(matches.begin(), matches.end(), [](const SimilarityMatch& a, const SimilarityMatch& b) {
        if (a.score != b.score) return a.score > b.score;
        std::uint64_t idA = a.entry ? a.entry->id : 0;
        std::uint64_t idB = b.entry ? b.entry->id : 0;
        return idA < idB;
    });
    return matches;
}

float SimilarityPolicy::scoreFromDistance(float squaredDistance) {
    if (squaredDistance < 0.0f) squaredDistance = 0.0f;
    return 1.0f / (1.0f + squaredDistance);
}

} // namespace reviewmemory::domain
