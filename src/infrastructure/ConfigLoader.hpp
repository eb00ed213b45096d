/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the application configuration (settings.json).
 *
 * Provides a unified way to access the tunables of the memory, the chunker, the
 * similarity policy, the aggregator and the model server without scattering JSON
 * parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <string>
#include "application/SuggestionAggregator.hpp"
#include "domain/services/SimilarityPolicy.hpp"
#include "domain/services/TagClassifier.hpp"
#include "infrastructure/OllamaAdapter.hpp"

namespace reviewmemory::infrastructure {

struct StoreSettings {
    std::string path;            ///< Snapshot directory. Defaults to PathUtils::GetMemoryDir().
    std::size_t dimension = 0;   ///< 0 lets the first insert define it.
    std::size_t topK = 3;
};

/**
 * @struct AppConfig
 * @brief Every tunable with its default. Each key of settings.json is optional.
 *
 * @code
 * {
 *   "store":      { "path": "...", "dimension": 768, "top_k": 3 },
 *   "chunker":    { "max_lines": 20 },
 *   "similarity": { "min_threshold": 0.2, "max_threshold": 0.4,
 *                   "steps": [ { "max_memory_size": 5, "threshold": 0.2 } ] },
 *   "aggregator": { "max_exemplars": 3, "max_tokens": 300, "temperature": 0.3,
 *                   "guidelines": "...", "guidelines_path": "..." },
 *   "tags":       { "keywords": { "security": ["injection"] }, "fallback": "general" },
 *   "model":      { "host": "localhost", "port": 11434, "embedding_model": "...",
 *                   "generation_model": "...", "timeout_seconds": 30 },
 *   "pipeline":   { "max_parallel_requests": 4 }
 * }
 * @endcode
 */
struct AppConfig {
    StoreSettings store;
    int chunkMaxLines = 20;
    domain::SimilarityPolicyConfig similarity;
    application::AggregatorConfig aggregator;
    domain::TagClassifierConfig tags;
    OllamaSettings model;
    int maxParallelRequests = 4;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json at `path`.
     *
     * A missing file yields the defaults. An unparsable file is reported and the
     * defaults are used.
     * @throws std::invalid_argument if a present value is of the wrong type or out of range.
     */
    static AppConfig Load(const std::string& path);

    /** @brief Same as Load() on an in-memory document. */
    static AppConfig Parse(const std::string& text);

    /** @throws std::invalid_argument naming the first offending key. */
    static void Validate(const AppConfig& config);
};

} // namespace reviewmemory::infrastructure
