/**
 * @file IngestionPipeline.cpp
 * @brief Implementation of IngestionPipeline.
 */

#include "application/IngestionPipeline.hpp"
#include <iostream>
#include "application/ContextAssembler.hpp"
#include "application/EmbeddingBatcher.hpp"
#include "domain/MemoryErrors.hpp"

namespace reviewmemory::application {

namespace {

struct PendingComment {
    const domain::ReviewComment* comment;
    domain::DiffChunk chunk;
};

domain::SkippedUnit SkipComment(const domain::ReviewComment& comment, const std::string& reason) {
    std::cerr << "[IngestionPipeline] Skipping comment by " << comment.author << " at "
              << comment.filePath << ":" << comment.line << ": " << reason << std::endl;
    return {comment.filePath, comment.line, comment.line, reason};
}

domain::SkippedUnit SkipChunk(const domain::DiffChunk& chunk, const std::string& reason) {
    std::cerr << "[IngestionPipeline] Skipping comment on " << chunk.filePath << ":"
              << chunk.startLine << "-" << chunk.endLine << ": " << reason << std::endl;
    return {chunk.filePath, chunk.startLine, chunk.endLine, reason};
}

} // namespace

IngestionPipeline::IngestionPipeline(std::shared_ptr<domain::AIService> ai,
                                     std::shared_ptr<infrastructure::MemoryStore> store,
                                     domain::DiffChunker chunker,
                                     domain::TagClassifier classifier,
                                     int maxParallelRequests)
    : m_ai(std::move(ai)), m_store(std::move(store)), m_chunker(std::move(chunker)),
      m_classifier(std::move(classifier)), m_maxParallelRequests(maxParallelRequests) {}

IngestionPipeline::IngestionResult IngestionPipeline::ingest(const domain::ReviewEvent& event) {
    IngestionResult result;
    result.commentsSeen = static_cast<int>(event.comments.size());

    auto chunks = m_chunker.split(event.diffs, event.prTitle);

    std::vector<PendingComment> pending;
    for (const auto& comment : event.comments) {
        if (comment.body.empty()) {
            result.skipped.push_back(SkipComment(comment, "empty comment"));
            continue;
        }
        auto chunk = domain::DiffChunker::locate(chunks, comment.filePath, comment.line);
        if (!chunk) {
            result.skipped.push_back(SkipComment(comment, "no diff chunk covers this line"));
            continue;
        }
        pending.push_back({&comment, std::move(*chunk)});
    }

    std::vector<std::string> inputs;
    inputs.reserve(pending.size());
    for (const auto& item : pending) {
        inputs.push_back(ContextAssembler::embeddingInput(item.chunk.text, event.repository, event.pullRequestId));
    }
    auto outcomes = EmbeddingBatcher(m_ai, m_maxParallelRequests).embedAll(inputs);

    // Appends stay sequential and in comment order so ids are deterministic.
    for (size_t i = 0; i < pending.size(); ++i) {
        const auto& comment = *pending[i].comment;
        const auto& chunk = pending[i].chunk;
        if (!outcomes[i].ok()) {
            result.skipped.push_back(SkipChunk(chunk, outcomes[i].error));
            continue;
        }

        domain::MemoryEntry entry;
        entry.embedding = std::move(outcomes[i].vector);
        entry.snippetText = chunk.text;
        entry.commentText = comment.body;
        entry.metadata.repository = event.repository;
        entry.metadata.pullRequestId = event.pullRequestId;
        entry.metadata.filePath = comment.filePath;
        entry.metadata.lineNumber = comment.line;
        entry.metadata.author = comment.author;
        entry.metadata.tags = m_classifier.classify(comment.body);
        entry.metadata.timestamp = comment.timestamp.empty() ? event.timestamp : comment.timestamp;

        const bool firstInsert = m_store->size() == 0;
        try {
            entry.id = m_store->insert(entry);
        } catch (const domain::DimensionMismatch& e) {
            if (firstInsert && m_store->isDimensionConfigured()) {
                std::cerr << "[IngestionPipeline] First insert does not fit the configured dimension: "
                          << e.what() << std::endl;
                throw;
            }
            result.skipped.push_back(SkipChunk(chunk, e.what()));
            continue;
        }
        result.appended.push_back(std::move(entry));
    }

    std::cout << "[IngestionPipeline] " << event.repository << " PR #" << event.pullRequestId << ": "
              << result.appended.size() << " of " << result.commentsSeen << " comment(s) remembered, "
              << result.skipped.size() << " skipped. Memory size: " << m_store->size() << std::endl;
    return result;
}

} // namespace reviewmemory::application
