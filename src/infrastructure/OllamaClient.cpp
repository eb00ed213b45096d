#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include "domain/MemoryErrors.hpp"

namespace reviewmemory::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds) {}

std::string OllamaClient::post(const std::string& path, const std::string& body, const std::string& what) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_timeoutSeconds, 0);
    cli.set_read_timeout(m_timeoutSeconds, 0);
    cli.set_write_timeout(m_timeoutSeconds, 0);

    auto res = cli.Post(path.c_str(), body, "application/json");
    if (!res) {
        auto err = res.error();
        if (err == httplib::Error::Read || err == httplib::Error::Write) {
            throw domain::ExternalCallTimeout(what + " exceeded " + std::to_string(m_timeoutSeconds) + "s");
        }
        throw domain::ExternalCallFailure(what + " connection failed (httplib error " +
                                          std::to_string(static_cast<int>(err)) + ")");
    }
    if (res->status != 200) {
        throw domain::ExternalCallFailure(what + " returned HTTP " + std::to_string(res->status) + ": " + res->body);
    }
    return res->body;
}

std::string OllamaClient::generate(const std::string& model,
                                   const std::string& prompt,
                                   double temperature,
                                   int maxTokens) {
    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", temperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed},
            {"num_predict", maxTokens}
        }}
    };

    // Invalid UTF-8 in the text is replaced rather than failing the whole request.
    std::string payload = requestData.dump(-1, ' ', false, json::error_handler_t::replace);
    std::string body = post("/api/generate", payload, "generate(" + model + ")");
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("response") && parsed["response"].is_string()) {
            return parsed["response"].get<std::string>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
    }
    throw domain::ExternalCallFailure("generate(" + model + ") response has no 'response' field");
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    std::string payload = requestData.dump(-1, ' ', false, json::error_handler_t::replace);
    std::string body = post("/api/embeddings", payload, "embeddings(" + model + ")");
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("embedding") && parsed["embedding"].is_array() && !parsed["embedding"].empty()) {
            return parsed["embedding"].get<std::vector<float>>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Embedding JSON Parse Error: " << e.what() << std::endl;
    }
    throw domain::ExternalCallFailure("embeddings(" + model + ") response has no embedding");
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Error parsing model list: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace reviewmemory::infrastructure
