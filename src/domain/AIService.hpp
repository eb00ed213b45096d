/**
 * @file AIService.hpp
 * @brief Interface for the embedding and text-generation models.
 */

#pragma once
#include <string>
#include <vector>

namespace reviewmemory::domain {

/**
 * @struct GenerationOptions
 * @brief Output bounds for a single generation call.
 */
struct GenerationOptions {
    int maxTokens = 300;
    double temperature = 0.3; ///< Low, to favour consistent reviews.
};

/**
 * @class AIService
 * @brief Abstract interface for the opaque model calls the pipeline depends on.
 *
 * Implementations throw ExternalCallTimeout when the time box is exceeded and
 * ExternalCallFailure for any other failure. They never return partial results.
 */
class AIService {
public:
    virtual ~AIService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Generates a semantic embedding vector for the given text.
     * @param text The text to embed.
     * @return A vector of floats representing the embedding.
     */
    virtual std::vector<float> getEmbedding(const std::string& text) = 0;

    /**
     * @brief Generates text for a fully assembled prompt.
     * @param prompt Prompt including exemplars and the code under review.
     * @param options Output length and temperature.
     * @return The generated text, trimmed.
     */
    virtual std::string generate(const std::string& prompt, const GenerationOptions& options) = 0;

    /**
     * @brief Gets the name of the model used for generation.
     * @return The model name.
     */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace reviewmemory::domain
