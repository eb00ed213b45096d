/**
 * @file EmbeddingBatcher.hpp
 * @brief Bounded-parallel embedding requests with per-request failure capture.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/AIService.hpp"

namespace reviewmemory::application {

/**
 * @struct EmbeddingOutcome
 * @brief Result of one request. `vector` is empty exactly when `error` is set.
 */
struct EmbeddingOutcome {
    std::vector<float> vector;
    std::string error;
    bool timedOut = false;

    bool ok() const { return error.empty(); }
};

/**
 * @class EmbeddingBatcher
 * @brief Runs up to maxParallel embedding calls at a time.
 *
 * Outcomes are returned in input order regardless of completion order. A
 * failing or timed-out request never affects the others.
 */
class EmbeddingBatcher {
public:
    EmbeddingBatcher(std::shared_ptr<domain::AIService> ai, int maxParallel);

    std::vector<EmbeddingOutcome> embedAll(const std::vector<std::string>& texts) const;

private:
    EmbeddingOutcome embedOne(const std::string& text) const;

    std::shared_ptr<domain::AIService> m_ai;
    int m_maxParallel;
};

} // namespace reviewmemory::application
