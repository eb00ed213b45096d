/**
 * @file ReviewPipeline.cpp
 * @brief Implementation of ReviewPipeline.
 */

#include "application/ReviewPipeline.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <utility>
#include "application/ContextAssembler.hpp"
#include "application/EmbeddingBatcher.hpp"
#include "domain/MemoryErrors.hpp"

namespace reviewmemory::application {

namespace {

domain::SkippedUnit SkipChunk(const domain::DiffChunk& chunk, const std::string& reason) {
    std::cerr << "[ReviewPipeline] Skipping " << chunk.filePath << ":" << chunk.startLine << "-"
              << chunk.endLine << ": " << reason << std::endl;
    return {chunk.filePath, chunk.startLine, chunk.endLine, reason};
}

} // namespace

ReviewPipeline::ReviewPipeline(std::shared_ptr<domain::AIService> ai,
                               std::shared_ptr<infrastructure::MemoryStore> store,
                               std::shared_ptr<domain::CommentSink> sink,
                               domain::DiffChunker chunker,
                               domain::SimilarityPolicy policy,
                               std::shared_ptr<SuggestionAggregator> aggregator,
                               ReviewSettings settings)
    : m_ai(std::move(ai)), m_store(std::move(store)), m_sink(std::move(sink)),
      m_chunker(std::move(chunker)), m_policy(std::move(policy)),
      m_aggregator(std::move(aggregator)), m_settings(settings) {}

std::vector<domain::SimilarityMatch> ReviewPipeline::match(const std::shared_ptr<const domain::DiffChunk>& chunk,
                                                           const std::vector<float>& embedding,
                                                           float threshold) const {
    std::vector<domain::SimilarityMatch> matches;
    for (const auto& hit : m_store->search(embedding, m_settings.topK)) {
        domain::SimilarityMatch match;
        match.chunk = chunk;
        match.entry = hit.entry;
        match.score = domain::SimilarityPolicy::scoreFromDistance(hit.distance);
        matches.push_back(std::move(match));
    }
    return m_policy.rank(std::move(matches), threshold);
}

void ReviewPipeline::generate(const domain::DiffChunk& chunk,
                              const std::vector<domain::SimilarityMatch>& accepted,
                              ReviewReport& report) {
    try {
        auto suggestion = accepted.empty() ? m_aggregator->reviewWithGuidelines(chunk)
                                           : m_aggregator->aggregate(chunk, accepted);
        if (!suggestion) return;
        m_sink->publish(*suggestion);
        report.suggestions.push_back(std::move(*suggestion));
    } catch (const domain::ExternalCallFailure& e) {
        report.summary.skipped.push_back(SkipChunk(chunk, e.what()));
    } catch (const std::exception& e) {
        report.summary.skipped.push_back(SkipChunk(chunk, std::string("suggestion failed: ") + e.what()));
    }
}

ReviewReport ReviewPipeline::review(const domain::ChangeSet& change) {
    ReviewReport report;
    auto& summary = report.summary;
    summary.repository = change.repository;
    summary.pullRequestId = change.pullRequestId;
    summary.model = m_ai->getCurrentModel();
    summary.memorySize = m_store->size();
    summary.threshold = m_policy.threshold(summary.memorySize);

    const bool guidelines = !m_aggregator->config().reviewGuidelines.empty();
    auto chunks = m_chunker.split(change.diffs, change.prTitle);
    summary.chunksAnalyzed = static_cast<int>(chunks.size());
    std::cout << "[ReviewPipeline] " << chunks.size() << " chunk(s) to review with " << summary.model
              << "; threshold " << summary.threshold << " (memory size " << summary.memorySize << ")" << std::endl;

    if (summary.memorySize == 0) {
        std::cout << "[ReviewPipeline] Empty memory, no past reviews to compare against." << std::endl;
        if (guidelines) {
            for (const auto& chunk : chunks) generate(chunk, {}, report);
        }
        finish(report);
        return report;
    }
    if (chunks.empty()) {
        finish(report);
        return report;
    }

    std::vector<std::string> inputs;
    inputs.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        inputs.push_back(ContextAssembler::embeddingInput(chunk.text, change.repository, change.pullRequestId));
    }
    auto outcomes = EmbeddingBatcher(m_ai, m_settings.maxParallelRequests).embedAll(inputs);

    for (size_t i = 0; i < chunks.size(); ++i) {
        auto chunk = std::make_shared<const domain::DiffChunk>(chunks[i]);
        if (!outcomes[i].ok()) {
            summary.skipped.push_back(SkipChunk(*chunk, outcomes[i].error));
            continue;
        }

        std::vector<domain::SimilarityMatch> accepted;
        try {
            auto ranked = match(chunk, outcomes[i].vector, summary.threshold);
            std::copy_if(ranked.begin(), ranked.end(), std::back_inserter(accepted),
                         [](const domain::SimilarityMatch& m) { return m.accepted; });
            if (!ranked.empty() && accepted.empty()) {
                std::cout << "[ReviewPipeline] " << chunk->filePath << ":" << chunk->startLine
                          << " best match " << ranked.front().score << " below threshold" << std::endl;
            }
        } catch (const domain::DimensionMismatch& e) {
            summary.skipped.push_back(SkipChunk(*chunk, e.what()));
            continue;
        }

        if (accepted.empty()) {
            if (guidelines) generate(*chunk, accepted, report);
            continue;
        }
        summary.chunksWithMatches++;
        generate(*chunk, accepted, report);
    }

    finish(report);
    return report;
}

void ReviewPipeline::finish(ReviewReport& report) {
    auto& summary = report.summary;
    summary.suggestionsGenerated = static_cast<int>(report.suggestions.size());
    std::cout << "[ReviewPipeline] " << summary.chunksWithMatches << " chunk(s) with similar past reviews, "
              << summary.suggestionsGenerated << " suggestion(s), " << summary.skipped.size()
              << " skipped." << std::endl;
    m_sink->publishSummary(summary);
}

} // namespace reviewmemory::application
