/**
 * @file DiffChunk.hpp
 * @brief Value objects describing a change under review.
 */

#pragma once
#include <string>
#include <vector>

namespace reviewmemory::domain {

/**
 * @enum FileStatus
 * @brief Change status of a file as reported by the host platform.
 */
enum class FileStatus {
    Added,
    Modified,
    Removed,
    Renamed
};

/**
 * @struct AddedLine
 * @brief A line present in the new version of a file.
 */
struct AddedLine {
    int lineNumber = 0; ///< 1-based line in the new file.
    std::string text;   ///< Content without the leading '+'.
};

/**
 * @struct FileDiff
 * @brief The added lines of one changed file.
 */
struct FileDiff {
    std::string filePath;
    FileStatus status = FileStatus::Modified;
    std::string patch;                 ///< Raw unified diff, empty when unknown.
    std::vector<AddedLine> addedLines;
};

/**
 * @struct ChunkContext
 * @brief Surrounding information passed along with a chunk.
 */
struct ChunkContext {
    std::string prTitle;
    std::string surroundingDiffSummary;

    bool operator==(const ChunkContext& other) const {
        return prTitle == other.prTitle && surroundingDiffSummary == other.surroundingDiffSummary;
    }
};

/**
 * @struct DiffChunk
 * @brief A bounded, line-addressable unit of a change.
 *
 * Invariant: 1 <= startLine <= endLine and endLine - startLine < maxLines.
 */
struct DiffChunk {
    std::string filePath;
    int startLine = 0; ///< Inclusive.
    int endLine = 0;   ///< Inclusive.
    std::string text;  ///< Lines joined with '\n'.
    ChunkContext context;

    int lineCount() const { return endLine - startLine + 1; }
    bool covers(int line) const { return line >= startLine && line <= endLine; }

    bool operator==(const DiffChunk& other) const {
        return filePath == other.filePath &&
               startLine == other.startLine &&
               endLine == other.endLine &&
               text == other.text &&
               context == other.context;
    }
};

} // namespace reviewmemory::domain
