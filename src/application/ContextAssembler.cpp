/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler service.
 */

#include "application/ContextAssembler.hpp"
#include <iomanip>
#include <sstream>

namespace reviewmemory::application {

namespace {

constexpr std::size_t kOriginalCodePreview = 200;

std::string JoinTags(const std::set<std::string>& tags) {
    std::string joined;
    for (const auto& tag : tags) {
        if (!joined.empty()) joined += ", ";
        joined += tag;
    }
    return joined;
}

void RenderExemplar(std::stringstream& ss, const Exemplar& exemplar) {
    ss << "Past Review (similarity: " << std::fixed << std::setprecision(2) << exemplar.score << "):\n"
       << "Reviewer: " << exemplar.author << "\n"
       << "Tags: " << JoinTags(exemplar.tags) << "\n"
       << "Comment: " << exemplar.comment << "\n"
       << "Original code context: " << ContextAssembler::truncate(exemplar.originalCode, kOriginalCodePreview) << "\n"
       << "---\n";
}

} // namespace

Exemplar Exemplar::fromEntry(const domain::MemoryEntry& entry, float score) {
    Exemplar exemplar;
    exemplar.author = entry.metadata.author;
    exemplar.comment = entry.commentText;
    exemplar.originalCode = entry.snippetText;
    exemplar.tags = entry.metadata.tags;
    exemplar.score = score;
    return exemplar;
}

std::string SuggestionContext::render() const {
    std::stringstream ss;

    ss << "You are a code reviewer analyzing a pull request. Based on similar past reviews, "
       << "provide a helpful review comment for the following code change.\n\n";

    ss << "=== PULL_REQUEST ===\n"
       << "Title: " << (chunk.context.prTitle.empty() ? "N/A" : chunk.context.prTitle) << "\n"
       << "File: " << chunk.filePath << " (lines " << chunk.startLine << "-" << chunk.endLine << ")\n"
       << "Diff: " << chunk.context.surroundingDiffSummary << "\n"
       << "========================================\n\n";

    ss << "=== CURRENT_CODE_CHANGE ===\n"
       << chunk.text << "\n"
       << "========================================\n\n";

    ss << "=== PRIMARY_PAST_REVIEW ===\n";
    RenderExemplar(ss, primary);
    ss << "========================================\n\n";

    if (!supporting.empty()) {
        ss << "=== SUPPORTING_PAST_REVIEWS ===\n";
        for (const auto& exemplar : supporting) {
            RenderExemplar(ss, exemplar);
        }
        ss << "========================================\n\n";
    }

    if (!guidelines.empty()) {
        ss << "=== REVIEW_GUIDELINES ===\n"
           << guidelines << "\n"
           << "========================================\n\n";
    }

    ss << "Generate a concise, helpful review comment for the current code change. Focus on:\n"
       << "1. Specific issues that might apply to this code\n"
       << "2. Best practices from past reviews\n"
       << "3. Consistency with previous feedback patterns\n\n"
       << "If the past reviews do not apply to the current code, answer exactly NO_REVIEW_NEEDED.\n"
       << "Response format: only the review comment text.\n";

    return ss.str();
}

std::string GuidelineContext::render() const {
    std::stringstream ss;

    ss << "You are a code reviewer. Review the following code change according to these guidelines.\n\n";

    ss << "=== REVIEW_GUIDELINES ===\n"
       << guidelines << "\n"
       << "========================================\n\n";

    ss << "=== CURRENT_CODE_CHANGE ===\n"
       << "File: " << chunk.filePath << " (lines " << chunk.startLine << "-" << chunk.endLine << ")\n"
       << chunk.text << "\n"
       << "========================================\n\n";

    ss << "List any issues found, referencing the guidelines.\n"
       << "If the change follows the guidelines, answer exactly NO_REVIEW_NEEDED.\n";

    return ss.str();
}

std::string ContextAssembler::embeddingInput(const std::string& code,
                                             const std::string& repository,
                                             const std::string& pullRequestId) {
    return "Code:\n" + code + "\n\nContext:\nPR #" +
           (pullRequestId.empty() ? std::string("unknown") : pullRequestId) + " in " +
           (repository.empty() ? std::string("unknown") : repository);
}

std::string ContextAssembler::truncate(const std::string& text, std::size_t maxChars) {
    if (text.size() <= maxChars) return text;
    // Never cut inside a UTF-8 sequence: back off past continuation bytes.
    std::size_t cut = maxChars;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "...";
}

} // namespace reviewmemory::application
