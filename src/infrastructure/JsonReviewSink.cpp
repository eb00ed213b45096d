/**
 * @file JsonReviewSink.cpp
 * @brief Implementation of JsonReviewSink.
 */

#include "infrastructure/JsonReviewSink.hpp"
#include <iostream>
#include "domain/services/UnifiedDiffParser.hpp"

namespace reviewmemory::infrastructure {

using json = nlohmann::json;

JsonReviewSink::JsonReviewSink(std::string outputPath,
                               std::shared_ptr<PersistenceService> persistence,
                               const std::vector<domain::FileDiff>& diffs)
    : m_outputPath(std::move(outputPath)), m_persistence(std::move(persistence)) {
    for (const auto& diff : diffs) {
        if (!diff.patch.empty()) m_patches[diff.filePath] = diff.patch;
    }
}

void JsonReviewSink::publish(const domain::Suggestion& suggestion) {
    const auto& chunk = suggestion.chunk;
    json comment = {
        {"file", chunk.filePath},
        {"line", chunk.startLine},
        {"end_line", chunk.endLine},
        {"comment", suggestion.commentText},
        {"match_count", suggestion.matchCount},
        {"tags", suggestion.tags}
    };

    // Suggestions without provenance come from the guidelines alone and are posted as general comments.
    const bool general = suggestion.provenance.empty();
    comment["general"] = general;
    auto patch = m_patches.find(chunk.filePath);
    if (!general && patch != m_patches.end()) {
        if (auto position = domain::UnifiedDiffParser::positionInPatch(patch->second, chunk.startLine)) {
            comment["position"] = *position;
        }
    }

    json info = json::array();
    for (const auto& item : suggestion.provenance) {
        info.push_back({{"similarity", item.score}, {"reviewer", item.author}, {"entry_id", item.entryId}});
    }
    comment["similarity_info"] = info;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_comments.push_back(std::move(comment));
}

void JsonReviewSink::publishSummary(const domain::ReviewSummary& summary) {
    json skipped = json::array();
    for (const auto& unit : summary.skipped) {
        skipped.push_back({
            {"file", unit.filePath},
            {"start_line", unit.startLine},
            {"end_line", unit.endLine},
            {"reason", unit.reason}
        });
    }

    std::string content;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_report = {
            {"repository", summary.repository},
            {"pr_number", summary.pullRequestId},
            {"comments", m_comments},
            {"metadata", {
                {"total_chunks_analyzed", summary.chunksAnalyzed},
                {"chunks_with_similar_reviews", summary.chunksWithMatches},
                {"comments_generated", summary.suggestionsGenerated},
                {"memory_size", summary.memorySize},
                {"model", summary.model},
                {"similarity_threshold", summary.threshold},
                {"skipped", skipped}
            }}
        };
        content = m_report.dump(2, ' ', false, json::error_handler_t::replace);
    }

    std::cout << "[JsonReviewSink] Writing " << summary.suggestionsGenerated
              << " comment(s) to " << m_outputPath << std::endl;
    m_persistence->saveTextAsync(m_outputPath, content);
}

json JsonReviewSink::report() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_report;
}

} // namespace reviewmemory::infrastructure
