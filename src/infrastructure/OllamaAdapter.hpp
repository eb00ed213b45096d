/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include <string>
#include "domain/AIService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace reviewmemory::infrastructure {

/**
 * @struct OllamaSettings
 * @brief Connection and model selection for the Ollama server.
 */
struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string embeddingModel = "nomic-embed-text";
    std::string generationModel = "qwen2.5:7b";
    int timeoutSeconds = 30; ///< Per call, for embeddings and generation alike.
};

/**
 * @class OllamaAdapter
 * @brief Implements AIService using the Ollama REST API.
 */
class OllamaAdapter : public domain::AIService {
public:
    explicit OllamaAdapter(OllamaSettings settings = {});

    /** @brief Logs whether the configured models are installed. @see domain::AIService::initialize */
    void initialize() override;

    /** @brief Generates a semantic embedding vector. @see domain::AIService::getEmbedding */
    std::vector<float> getEmbedding(const std::string& text) override;

    /** @brief Generates a review comment. @see domain::AIService::generate */
    std::string generate(const std::string& prompt, const domain::GenerationOptions& options) override;

    std::string getCurrentModel() const override { return m_settings.generationModel; }

private:
    OllamaSettings m_settings;
    OllamaClient m_client;
};

} // namespace reviewmemory::infrastructure
