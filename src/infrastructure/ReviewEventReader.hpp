/**
 * @file ReviewEventReader.hpp
 * @brief Reads review events and change sets from JSON documents.
 */

#pragma once
#include <string>
#include "domain/ReviewEvent.hpp"

namespace reviewmemory::infrastructure {

/**
 * @class ReviewEventReader
 * @brief JSON event feed.
 *
 * Both documents share the header keys "repository", "pr_number" (number or
 * string), "title" and "files". A file carries either a unified-diff "patch" or
 * an explicit "added_lines" array of {"line", "text"} objects. Review events
 * additionally carry "timestamp" and "comments" ({"user", "body", "path",
 * "line", "created_at"}).
 *
 * Malformed documents raise std::runtime_error naming the source.
 */
class ReviewEventReader {
public:
    static domain::ReviewEvent parseEvent(const std::string& text);
    static domain::ChangeSet parseChangeSet(const std::string& text);

    static domain::ReviewEvent readEventFile(const std::string& path);
    static domain::ChangeSet readChangeSetFile(const std::string& path);

    static domain::FileStatus statusFromString(const std::string& status);
};

} // namespace reviewmemory::infrastructure
