/**
 * @file DiffChunker.hpp
 * @brief Splits file diffs into bounded, line-addressable chunks.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/DiffChunk.hpp"

namespace reviewmemory::domain {

/**
 * @class DiffChunker
 * @brief Groups added lines into contiguous runs and cuts runs into chunks of at most maxLines.
 *
 * Output is deterministic: files in input order, chunks in ascending line order.
 * Chunks of one file never overlap and together cover exactly its added lines.
 */
class DiffChunker {
public:
    static constexpr int kDefaultMaxLines = 20;

    /** @throws std::invalid_argument if maxLines < 1. */
    explicit DiffChunker(int maxLines = kDefaultMaxLines);

    std::vector<DiffChunk> split(const std::vector<FileDiff>& diffs, const std::string& prTitle = "") const;

    /** @brief Chunk of `filePath` covering `line`, if any. */
    static std::optional<DiffChunk> locate(const std::vector<DiffChunk>& chunks,
                                           const std::string& filePath, int line);

    int maxLines() const { return m_maxLines; }

private:
    std::vector<DiffChunk> splitFile(const FileDiff& diff, const std::string& prTitle) const;

    int m_maxLines;
};

} // namespace reviewmemory::domain
