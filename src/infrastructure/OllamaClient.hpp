/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>

namespace reviewmemory::infrastructure {

/**
 * @class OllamaClient
 * @brief Blocking calls with a bounded time box.
 *
 * Read/write timeouts raise domain::ExternalCallTimeout; connection errors,
 * non-200 statuses and malformed bodies raise domain::ExternalCallFailure.
 */
class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 30);

    /** @brief Sends a POST request to /api/generate. */
    std::string generate(const std::string& model,
                         const std::string& prompt,
                         double temperature,
                         int maxTokens);

    /** @brief Sends a POST request to /api/embeddings. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text);

    /** @brief Fetches available models from /api/tags. Empty when the server is unreachable. */
    std::vector<std::string> getAvailableModels();

private:
    std::string post(const std::string& path, const std::string& body, const std::string& what);

    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace reviewmemory::infrastructure
