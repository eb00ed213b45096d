/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "infrastructure/PathUtils.hpp"

namespace reviewmemory::infrastructure {

using json = nlohmann::json;

namespace {

AppConfig Defaults() {
    AppConfig config;
    config.store.path = PathUtils::GetMemoryDir().string();
    return config;
}

std::string ReadGuidelines(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Review guidelines not found at " << path << ", continuing without." << std::endl;
        return {};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

// Reads a count as a signed value so that -1 is rejected instead of wrapping to a huge size_t.
std::size_t ReadCount(const json& section, const char* key, std::size_t fallback, const std::string& name) {
    if (!section.contains(key)) return fallback;
    auto value = section.at(key).get<long long>();
    if (value < 0) throw std::invalid_argument(name + " must not be negative");
    return static_cast<std::size_t>(value);
}

void ApplySections(const json& j, AppConfig& config) {
    if (j.contains("store")) {
        const auto& s = j.at("store");
        config.store.path = s.value("path", config.store.path);
        config.store.dimension = ReadCount(s, "dimension", config.store.dimension, "store.dimension");
        config.store.topK = ReadCount(s, "top_k", config.store.topK, "store.top_k");
    }

    if (j.contains("chunker")) {
        config.chunkMaxLines = j.at("chunker").value("max_lines", config.chunkMaxLines);
    }

    if (j.contains("similarity")) {
        const auto& s = j.at("similarity");
        config.similarity.minThreshold = s.value("min_threshold", config.similarity.minThreshold);
        config.similarity.maxThreshold = s.value("max_threshold", config.similarity.maxThreshold);
        if (s.contains("steps")) {
            config.similarity.steps.clear();
            for (const auto& step : s.at("steps")) {
                if (!step.contains("max_memory_size")) {
                    throw std::invalid_argument("similarity.steps entries need max_memory_size");
                }
                config.similarity.steps.push_back({ReadCount(step, "max_memory_size", 0, "similarity.steps.max_memory_size"),
                                                   step.at("threshold").get<float>()});
            }
        }
    }

    if (j.contains("aggregator")) {
        const auto& a = j.at("aggregator");
        config.aggregator.maxExemplars = a.value("max_exemplars", config.aggregator.maxExemplars);
        config.aggregator.generation.maxTokens = a.value("max_tokens", config.aggregator.generation.maxTokens);
        config.aggregator.generation.temperature = a.value("temperature", config.aggregator.generation.temperature);
        config.aggregator.reviewGuidelines = a.value("guidelines", config.aggregator.reviewGuidelines);
        if (a.contains("guidelines_path")) {
            config.aggregator.reviewGuidelines = ReadGuidelines(a.at("guidelines_path").get<std::string>());
        }
    }

    if (j.contains("tags")) {
        const auto& t = j.at("tags");
        if (t.contains("keywords")) {
            config.tags.keywords = t.at("keywords").get<std::map<std::string, std::vector<std::string>>>();
        }
        config.tags.fallbackTag = t.value("fallback", config.tags.fallbackTag);
    }

    if (j.contains("model")) {
        const auto& m = j.at("model");
        config.model.host = m.value("host", config.model.host);
        config.model.port = m.value("port", config.model.port);
        config.model.embeddingModel = m.value("embedding_model", config.model.embeddingModel);
        config.model.generationModel = m.value("generation_model", config.model.generationModel);
        config.model.timeoutSeconds = m.value("timeout_seconds", config.model.timeoutSeconds);
    }

    if (j.contains("pipeline")) {
        config.maxParallelRequests = j.at("pipeline").value("max_parallel_requests", config.maxParallelRequests);
    }
}

AppConfig FromDocument(const json& j) {
    AppConfig config = Defaults();
    if (!j.is_object()) {
        throw std::invalid_argument("settings.json: top level must be an object");
    }
    try {
        ApplySections(j, config);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("settings.json: ") + e.what());
    }
    ConfigLoader::Validate(config);
    return config;
}

} // namespace

void ConfigLoader::Validate(const AppConfig& config) {
    if (config.store.path.empty()) throw std::invalid_argument("store.path must not be empty");
    if (config.store.topK < 1) throw std::invalid_argument("store.top_k must be at least 1");
    if (config.chunkMaxLines < 1) throw std::invalid_argument("chunker.max_lines must be at least 1");
    if (config.aggregator.maxExemplars < 1) throw std::invalid_argument("aggregator.max_exemplars must be at least 1");
    if (config.aggregator.generation.maxTokens < 1) throw std::invalid_argument("aggregator.max_tokens must be at least 1");
    if (config.aggregator.generation.temperature < 0.0) throw std::invalid_argument("aggregator.temperature must not be negative");
    if (config.model.port < 1 || config.model.port > 65535) throw std::invalid_argument("model.port out of range");
    if (config.model.timeoutSeconds < 1) throw std::invalid_argument("model.timeout_seconds must be at least 1");
    if (config.maxParallelRequests < 1) throw std::invalid_argument("pipeline.max_parallel_requests must be at least 1");

    // Threshold curve checks live with the policy itself.
    domain::SimilarityPolicy policy(config.similarity);
    (void)policy;
}

AppConfig ConfigLoader::Parse(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return Defaults();
    }
    return FromDocument(j);
}

AppConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] No settings at " << path << ", using defaults." << std::endl;
        return Defaults();
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << path << ", using defaults." << std::endl;
        return Defaults();
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

} // namespace reviewmemory::infrastructure
