/**
 * @file ReviewEvent.hpp
 * @brief Events delivered by the source-of-truth feed.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/DiffChunk.hpp"

namespace reviewmemory::domain {

/**
 * @struct ReviewComment
 * @brief A human inline comment from a finished review.
 */
struct ReviewComment {
    std::string author;
    std::string body;
    std::string filePath;
    int line = 0;
    std::string timestamp; ///< Falls back to the event timestamp when empty.
};

/**
 * @struct ReviewEvent
 * @brief A finished review: the diff that was reviewed and the comments left on it.
 */
struct ReviewEvent {
    std::string repository;
    std::string pullRequestId;
    std::string prTitle;
    std::string timestamp;
    std::vector<FileDiff> diffs;
    std::vector<ReviewComment> comments;
};

/**
 * @struct ChangeSet
 * @brief A newly opened change awaiting suggestions.
 */
struct ChangeSet {
    std::string repository;
    std::string pullRequestId;
    std::string prTitle;
    std::vector<FileDiff> diffs;
};

/**
 * @struct SkippedUnit
 * @brief A chunk or comment that could not be processed during a pass.
 */
struct SkippedUnit {
    std::string filePath;
    int startLine = 0;
    int endLine = 0;
    std::string reason;
};

} // namespace reviewmemory::domain
