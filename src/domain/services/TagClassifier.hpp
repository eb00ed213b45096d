/**
 * @file TagClassifier.hpp
 * @brief Deterministic keyword-to-tag mapping over review comment text.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace reviewmemory::domain {

/**
 * @struct TagClassifierConfig
 * @brief Keyword table. A tag applies when any of its keywords occurs in the comment.
 */
struct TagClassifierConfig {
    std::map<std::string, std::vector<std::string>> keywords = {
        {"validation", {"null", "validate", "validation", "check"}},
        {"security", {"security", "vulnerable", "injection", "xss", "csrf"}},
        {"performance", {"performance", "perf", "slow", "optimize", "memory", "cpu"}},
        {"style", {"style", "format", "naming", "convention"}},
        {"architecture", {"architecture", "design", "pattern", "structure"}},
        {"testing", {"test", "coverage", "mock", "assertion"}},
        {"documentation", {"document", "comment", "javadoc", "readme"}}
    };
    std::string fallbackTag = "general"; ///< Used when no keyword matches.
};

class TagClassifier {
public:
    explicit TagClassifier(TagClassifierConfig config = {}) : m_config(std::move(config)) {
        for (auto& [tag, words] : m_config.keywords) {
            for (auto& word : words) word = toLower(word);
        }
    }

    /** @brief Case-insensitive substring match; returns the fallback tag if nothing matched. */
    std::set<std::string> classify(const std::string& comment) const {
        std::set<std::string> tags;
        const std::string lowered = toLower(comment);
        for (const auto& [tag, words] : m_config.keywords) {
            bool hit = std::any_of(words.begin(), words.end(), [&lowered](const std::string& word) {
                return !word.empty() && lowered.find(word) != std::string::npos;
            });
            if (hit) tags.insert(tag);
        }
        if (tags.empty() && !m_config.fallbackTag.empty()) {
            tags.insert(m_config.fallbackTag);
        }
        return tags;
    }

    const TagClassifierConfig& config() const { return m_config; }

private:
    static std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    TagClassifierConfig m_config;
};

} // namespace reviewmemory::domain
