#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "application/ReviewPipeline.hpp"
#include "domain/MemoryErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonReviewSink.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ReviewEventReader.hpp"

namespace fs = std::filesystem;
using namespace reviewmemory;

namespace {

void PrintUsage() {
    std::cout << "Usage: reviewmemory [--config <settings.json>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  ingest <event.json>              Remember the comments of a finished review\n"
              << "  review <change.json> [out.json]  Suggest comments for a new change\n"
              << "                                   (report defaults to generated_review.json)\n"
              << "  stats                            Show memory size, dimension and tags\n";
}

application::AppServices BuildServices(const infrastructure::AppConfig& config) {
    application::AppServices services;
    services.aiService = std::make_shared<infrastructure::OllamaAdapter>(config.model);
    services.memoryStore = std::make_shared<infrastructure::MemoryStore>(config.store.dimension);
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    services.suggestionAggregator = std::make_shared<application::SuggestionAggregator>(
        services.aiService, config.aggregator);
    services.ingestionPipeline = std::make_unique<application::IngestionPipeline>(
        services.aiService, services.memoryStore,
        domain::DiffChunker(config.chunkMaxLines),
        domain::TagClassifier(config.tags),
        config.maxParallelRequests);
    return services;
}

void LoadMemory(application::AppServices& services, const infrastructure::AppConfig& config) {
    if (services.memoryStore->load(config.store.path)) {
        std::cout << "[Main] Loaded " << services.memoryStore->size() << " memories from "
                  << config.store.path << std::endl;
    } else {
        std::cout << "[Main] No memory at " << config.store.path << ", starting empty." << std::endl;
    }
}

int RunIngest(application::AppServices& services, const infrastructure::AppConfig& config,
              const std::string& eventPath) {
    auto event = infrastructure::ReviewEventReader::readEventFile(eventPath);
    services.aiService->initialize();
    LoadMemory(services, config);

    auto result = services.ingestionPipeline->ingest(event);
    if (!result.appended.empty()) {
        services.memoryStore->persist(config.store.path);
    }
    std::cout << "[Main] Remembered " << result.appended.size() << " of " << result.commentsSeen
              << " comment(s); memory now holds " << services.memoryStore->size() << " entries." << std::endl;
    return 0;
}

int RunReview(application::AppServices& services, const infrastructure::AppConfig& config,
              const std::string& changePath, const std::string& outputPath) {
    auto change = infrastructure::ReviewEventReader::readChangeSetFile(changePath);
    services.aiService->initialize();
    LoadMemory(services, config);

    auto sink = std::make_shared<infrastructure::JsonReviewSink>(
        outputPath, services.persistenceService, change.diffs);
    application::ReviewSettings settings;
    settings.topK = config.store.topK;
    settings.maxParallelRequests = config.maxParallelRequests;

    application::ReviewPipeline pipeline(services.aiService, services.memoryStore, sink,
                                         domain::DiffChunker(config.chunkMaxLines),
                                         domain::SimilarityPolicy(config.similarity),
                                         services.suggestionAggregator, settings);
    auto report = pipeline.review(change);
    services.persistenceService->flush();

    std::cout << "[Main] " << report.suggestions.size() << " suggestion(s) for "
              << change.repository << "#" << change.pullRequestId << std::endl;
    return 0;
}

int RunStats(application::AppServices& services, const infrastructure::AppConfig& config) {
    LoadMemory(services, config);
    auto stats = services.memoryStore->stats();
    std::cout << "Memory:    " << config.store.path << "\n"
              << "Entries:   " << stats.entryCount << "\n"
              << "Dimension: " << stats.dimension << "\n"
              << "Threshold: " << domain::SimilarityPolicy(config.similarity).threshold(stats.entryCount) << "\n";
    if (!stats.tagHistogram.empty()) {
        std::cout << "Tags:\n";
        for (const auto& [tag, count] : stats.tagHistogram) {
            std::cout << "  " << tag << ": " << count << "\n";
        }
    }
    std::cout << std::flush;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = infrastructure::PathUtils::GetDefaultConfigPath().string();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        PrintUsage();
        return 2;
    }

    try {
        auto config = infrastructure::ConfigLoader::Load(configPath);
        auto services = BuildServices(config);
        const std::string& command = args[0];

        if (command == "ingest" && args.size() == 2) {
            return RunIngest(services, config, args[1]);
        }
        if (command == "review" && (args.size() == 2 || args.size() == 3)) {
            std::string output = args.size() == 3 ? args[2] : "generated_review.json";
            return RunReview(services, config, args[1], output);
        }
        if (command == "stats" && args.size() == 1) {
            return RunStats(services, config);
        }

        PrintUsage();
        return 2;
    } catch (const domain::CorruptStore& e) {
        std::cerr << "[Main] Memory store is corrupt: " << e.what() << std::endl;
        return 3;
    } catch (const domain::MemoryError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Main] Invalid configuration: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Error: " << e.what() << std::endl;
        return 1;
    }
}
