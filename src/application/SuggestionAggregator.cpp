/**
 * @file SuggestionAggregator.cpp
 * @brief Implementation of SuggestionAggregator.
 */

#include "application/SuggestionAggregator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <utility>
#include "application/ContextAssembler.hpp"

namespace reviewmemory::application {

namespace {

std::string Trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

} // namespace

SuggestionAggregator::SuggestionAggregator(std::shared_ptr<domain::AIService> ai, AggregatorConfig config)
    : m_ai(std::move(ai)), m_config(std::move(config)) {
    m_config.maxExemplars = std::max(1, m_config.maxExemplars);
}

std::optional<domain::Suggestion> SuggestionAggregator::aggregate(
    const domain::DiffChunk& chunk,
    const std::vector<domain::SimilarityMatch>& acceptedMatches) const {

    std::vector<domain::SimilarityMatch> matches;
    std::copy_if(acceptedMatches.begin(), acceptedMatches.end(), std::back_inserter(matches),
                 [](const domain::SimilarityMatch& m) { return m.entry != nullptr; });
    if (matches.empty()) return std::nullopt;

    std::stable_sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.entry->id < b.entry->id;
    });

    domain::Suggestion suggestion;
    suggestion.chunk = chunk;
    suggestion.matchCount = static_cast<int>(acceptedMatches.size());

    // One provenance item per distinct (author, comment) pair, best score first.
    std::set<std::pair<std::string, std::string>> cited;
    std::vector<Exemplar> exemplars;
    for (const auto& match : matches) {
        const auto& entry = *match.entry;
        suggestion.tags.insert(entry.metadata.tags.begin(), entry.metadata.tags.end());
        if (!cited.emplace(entry.metadata.author, entry.commentText).second) continue;

        suggestion.provenance.push_back({entry.metadata.author, match.score, entry.id});
        if (exemplars.size() < static_cast<size_t>(m_config.maxExemplars)) {
            exemplars.push_back(Exemplar::fromEntry(entry, match.score));
        }
    }

    SuggestionContext context;
    context.chunk = chunk;
    context.primary = exemplars.front();
    context.supporting.assign(exemplars.begin() + 1, exemplars.end());
    context.guidelines = m_config.reviewGuidelines;

    std::string generated = Trim(m_ai->generate(context.render(), m_config.generation));
    if (declines(generated)) {
        std::cout << "[SuggestionAggregator] No review needed for " << chunk.filePath << ":"
                  << chunk.startLine << "-" << chunk.endLine << std::endl;
        return std::nullopt;
    }

    const auto& primary = suggestion.provenance.front();
    suggestion.commentText = generated + "\n\n" +
        formatFooter(suggestion.matchCount, primary.author, primary.score, suggestion.tags);
    return suggestion;
}

std::optional<domain::Suggestion> SuggestionAggregator::reviewWithGuidelines(const domain::DiffChunk& chunk) const {
    if (m_config.reviewGuidelines.empty()) return std::nullopt;

    GuidelineContext context;
    context.chunk = chunk;
    context.guidelines = m_config.reviewGuidelines;

    std::string generated = Trim(m_ai->generate(context.render(), m_config.generation));
    if (declines(generated)) {
        std::cout << "[SuggestionAggregator] Guidelines raise nothing for " << chunk.filePath << ":"
                  << chunk.startLine << "-" << chunk.endLine << std::endl;
        return std::nullopt;
    }

    domain::Suggestion suggestion;
    suggestion.chunk = chunk;
    suggestion.matchCount = 0;
    suggestion.commentText = generated + "\n\n---\n📜 Review context:\n" + m_config.reviewGuidelines;
    return suggestion;
}

bool SuggestionAggregator::declines(const std::string& reply) {
    auto trimmed = Trim(reply);
    return trimmed.empty() || trimmed == kNoReviewNeeded;
}

std::string SuggestionAggregator::formatFooter(int matchCount, const std::string& primaryAuthor,
                                               float primaryScore, const std::set<std::string>& tags) {
    long percent = std::lround(static_cast<double>(primaryScore) * 100.0);

    std::string joined;
    for (const auto& tag : tags) {
        if (!joined.empty()) joined += ", ";
        joined += tag;
    }

    return "🤖 This suggestion is based on " + std::to_string(matchCount) +
           " similar past review(s) by @" + primaryAuthor +
           " (similarity: " + std::to_string(percent) + "%)\n" +
           "📋 Related areas: " + joined;
}

} // namespace reviewmemory::application
