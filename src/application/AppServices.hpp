/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/IngestionPipeline.hpp"
#include "application/SuggestionAggregator.hpp"
#include "domain/AIService.hpp"
#include "infrastructure/MemoryStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace reviewmemory::application {

struct AppServices {
    std::shared_ptr<domain::AIService> aiService;
    std::shared_ptr<infrastructure::MemoryStore> memoryStore;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<SuggestionAggregator> suggestionAggregator;
    std::unique_ptr<IngestionPipeline> ingestionPipeline;
};

} // namespace reviewmemory::application
