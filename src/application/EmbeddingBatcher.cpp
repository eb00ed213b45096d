#include "application/EmbeddingBatcher.hpp"
#include <algorithm>
#include <future>
#include "domain/MemoryErrors.hpp"

namespace reviewmemory::application {

EmbeddingBatcher::EmbeddingBatcher(std::shared_ptr<domain::AIService> ai, int maxParallel)
    : m_ai(std::move(ai)), m_maxParallel(std::max(1, maxParallel)) {}

EmbeddingOutcome EmbeddingBatcher::embedOne(const std::string& text) const {
    EmbeddingOutcome outcome;
    try {
        outcome.vector = m_ai->getEmbedding(text);
        if (outcome.vector.empty()) {
            outcome.error = "embedding service returned an empty vector";
        }
    } catch (const domain::ExternalCallTimeout& e) {
        outcome.error = e.what();
        outcome.timedOut = true;
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    if (!outcome.ok()) outcome.vector.clear();
    return outcome;
}

std::vector<EmbeddingOutcome> EmbeddingBatcher::embedAll(const std::vector<std::string>& texts) const {
    std::vector<EmbeddingOutcome> outcomes(texts.size());
    if (m_maxParallel == 1) {
        for (size_t i = 0; i < texts.size(); ++i) outcomes[i] = embedOne(texts[i]);
        return outcomes;
    }

    const size_t window = static_cast<size_t>(m_maxParallel);
    for (size_t first = 0; first < texts.size(); first += window) {
        size_t last = std::min(first + window, texts.size());
        std::vector<std::future<EmbeddingOutcome>> pending;
        pending.reserve(last - first);
        for (size_t i = first; i < last; ++i) {
            pending.push_back(std::async(std::launch::async, [this, &texts, i]() {
                return embedOne(texts[i]);
            }));
        }
        for (size_t i = first; i < last; ++i) {
            outcomes[i] = pending[i - first].get();
        }
    }
    return outcomes;
}

} // namespace reviewmemory::application
