/**
 * @file UnifiedDiffParser.hpp
 * @brief Reads unified-diff patches as delivered by the host platform.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/DiffChunk.hpp"

namespace reviewmemory::domain {

/**
 * @class UnifiedDiffParser
 * @brief Extracts added lines with their new-file numbers from a patch.
 *
 * Hunk headers have the form "@@ -a,b +c,d @@ optional section". Lines starting
 * with '+' are added and numbered from c; context lines advance the counter;
 * '-' lines and "\ No newline at end of file" markers do not.
 */
class UnifiedDiffParser {
public:
    static FileDiff parse(const std::string& filePath, const std::string& patch,
                          FileStatus status = FileStatus::Modified);

    /**
     * @brief 1-based position of an added line inside the patch.
     *
     * Every patch line after the first hunk header counts, including later hunk
     * headers. Returns nullopt when the line is not an added line of the patch.
     */
    static std::optional<int> positionInPatch(const std::string& patch, int newLine);

    /** @brief New-file start line of a hunk header; 1 when the header is malformed. */
    static int hunkStartLine(const std::string& header);
};

} // namespace reviewmemory::domain
