/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace reviewmemory::infrastructure {

namespace {

std::string Trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool HasModel(const std::vector<std::string>& available, const std::string& wanted) {
    return std::any_of(available.begin(), available.end(), [&wanted](const std::string& name) {
        return name == wanted || name.rfind(wanted + ":", 0) == 0;
    });
}

} // namespace

OllamaAdapter::OllamaAdapter(OllamaSettings settings)
    : m_settings(std::move(settings)),
      m_client(m_settings.host, m_settings.port, m_settings.timeoutSeconds) {}

void OllamaAdapter::initialize() {
    auto available = m_client.getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running at "
                  << m_settings.host << ":" << m_settings.port << "?" << std::endl;
        return;
    }
    for (const auto& model : {m_settings.embeddingModel, m_settings.generationModel}) {
        if (HasModel(available, model)) {
            std::cout << "[OllamaAdapter] Model available: " << model << std::endl;
        } else {
            std::cerr << "[OllamaAdapter] Model not installed: " << model << std::endl;
        }
    }
}

std::vector<float> OllamaAdapter::getEmbedding(const std::string& text) {
    return m_client.getEmbedding(m_settings.embeddingModel, text);
}

std::string OllamaAdapter::generate(const std::string& prompt, const domain::GenerationOptions& options) {
    std::cout << "[OllamaAdapter] Sending request to " << m_settings.generationModel
              << " (max tokens " << options.maxTokens << ")" << std::endl;
    return Trim(m_client.generate(m_settings.generationModel, prompt, options.temperature, options.maxTokens));
}

} // namespace reviewmemory::infrastructure
