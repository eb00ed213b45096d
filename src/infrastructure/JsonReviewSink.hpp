/**
 * @file JsonReviewSink.hpp
 * @brief Comment sink that writes a review report for a later posting step.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/CommentSink.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace reviewmemory::infrastructure {

/**
 * @class JsonReviewSink
 * @brief Collects suggestions and writes them as one JSON report on publishSummary().
 *
 * Each comment is placed inline at its chunk's start line. When the patch of the
 * file is known, the GitHub-style position inside the patch is added as well;
 * a posting step without it falls back to a general comment.
 */
class JsonReviewSink : public domain::CommentSink {
public:
    JsonReviewSink(std::string outputPath,
                   std::shared_ptr<PersistenceService> persistence,
                   const std::vector<domain::FileDiff>& diffs = {});

    void publish(const domain::Suggestion& suggestion) override;
    void publishSummary(const domain::ReviewSummary& summary) override;

    /** @brief The report as it was last written (or would be written). */
    nlohmann::json report() const;

private:
    std::string m_outputPath;
    std::shared_ptr<PersistenceService> m_persistence;
    std::map<std::string, std::string> m_patches;

    mutable std::mutex m_mutex;
    nlohmann::json m_comments = nlohmann::json::array();
    nlohmann::json m_report;
};

} // namespace reviewmemory::infrastructure
