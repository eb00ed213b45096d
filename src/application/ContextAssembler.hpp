/**
 * @file ContextAssembler.hpp
 * @brief Assembles the texts the embedding and generation models see.
 */

#pragma once
#include <set>
#include <string>
#include <vector>
#include "domain/DiffChunk.hpp"
#include "domain/MemoryEntry.hpp"

namespace reviewmemory::application {

/**
 * @struct Exemplar
 * @brief A past review shown to the generator.
 */
struct Exemplar {
    std::string author;
    std::string comment;
    std::string originalCode;
    std::set<std::string> tags;
    float score = 0.0f;

    static Exemplar fromEntry(const domain::MemoryEntry& entry, float score);
};

/**
 * @struct SuggestionContext
 * @brief A Value Object containing labeled context segments for the generator.
 */
struct SuggestionContext {
    domain::DiffChunk chunk;
    Exemplar primary;
    std::vector<Exemplar> supporting;
    std::string guidelines; ///< Team review rules, may be empty.

    /** @brief Renders the context into a single prompt. */
    std::string render() const;
};

/**
 * @struct GuidelineContext
 * @brief Prompt for a chunk with no similar past review, judged against the team rules alone.
 */
struct GuidelineContext {
    domain::DiffChunk chunk;
    std::string guidelines;

    std::string render() const;
};

/**
 * @class ContextAssembler
 * @brief Stateless helpers shared by ingestion and review so that stored and
 *        queried embeddings are built from identically shaped text.
 */
class ContextAssembler {
public:
    /** @brief "Code:\n<code>\n\nContext:\nPR #<id> in <repository>". */
    static std::string embeddingInput(const std::string& code,
                                      const std::string& repository,
                                      const std::string& pullRequestId);

    /**
     * @brief Cuts text to at most maxChars bytes, appending "..." when something was removed.
     *        The cut moves back to a UTF-8 character boundary.
     */
    static std::string truncate(const std::string& text, std::size_t maxChars);
};

} // namespace reviewmemory::application
