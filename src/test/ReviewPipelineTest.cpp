#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/IngestionPipeline.hpp"
#include "application/ReviewPipeline.hpp"
#include "domain/MemoryErrors.hpp"
#include "infrastructure/JsonReviewSink.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/ReviewEventReader.hpp"

namespace fs = std::filesystem;
using namespace reviewmemory;

// Mock AI Service: keyword-driven embeddings so similarity is predictable.
class MockAIService : public domain::AIService {
public:
    std::vector<float> getEmbedding(const std::string& text) override {
        embeddingCalls++;
        if (text.find("SLOWCALL") != std::string::npos) throw domain::ExternalCallTimeout("embedding took too long");
        if (text.find("TINYVEC") != std::string::npos) return {1.0f};
        if (text.find("refund") != std::string::npos) return {1.0f, 0.0f, 0.0f};
        if (text.find("charge") != std::string::npos) return {0.0f, 1.0f, 0.0f};
        return {5.0f, 5.0f, 5.0f};
    }

    std::string generate(const std::string& prompt, const domain::GenerationOptions&) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        prompts.push_back(prompt);
        if (prompt.find("GENFAIL") != std::string::npos) throw domain::ExternalCallFailure("HTTP 503");
        return "Validate the refund amount here as well.";
    }

    std::string getCurrentModel() const override { return "mock"; }

    std::atomic<int> embeddingCalls{0};
    std::vector<std::string> prompts;

private:
    std::mutex m_mutex;
};

// Serializes every prompt the way the HTTP client does, with strict UTF-8 checking.
class StrictJsonAIService : public domain::AIService {
public:
    std::vector<float> getEmbedding(const std::string&) override { return {1.0f, 0.0f, 0.0f}; }

    std::string generate(const std::string& prompt, const domain::GenerationOptions&) override {
        std::string body = nlohmann::json{{"prompt", prompt}}.dump();
        std::lock_guard<std::mutex> lock(m_mutex);
        bodies.push_back(body);
        return "Use the shared formatter for labels.";
    }

    std::string getCurrentModel() const override { return "strict"; }

    std::vector<std::string> bodies;

private:
    std::mutex m_mutex;
};

// Records what the pipeline publishes, in order.
class RecordingSink : public domain::CommentSink {
public:
    void publish(const domain::Suggestion& suggestion) override {
        assert(!summary && "Suggestions must precede the summary.");
        suggestions.push_back(suggestion);
    }

    void publishSummary(const domain::ReviewSummary& s) override {
        summary = std::make_unique<domain::ReviewSummary>(s);
    }

    std::vector<domain::Suggestion> suggestions;
    std::unique_ptr<domain::ReviewSummary> summary;
};

namespace {

const char* kReviewEvent = R"({
  "repository": "acme/payments",
  "pr_number": 12,
  "title": "Refunds",
  "timestamp": "2026-05-01T09:00:00Z",
  "files": [
    { "filename": "src/Refund.java", "status": "added",
      "patch": "@@ -0,0 +1,2 @@\n+void refund(Order o) {\n+}\n" },
    { "filename": "src/Charge.java",
      "added_lines": [ { "line": 5, "text": "charge(card);" } ] }
  ],
  "comments": [
    { "user": "alice", "body": "Check the refund amount is not null.",
      "path": "src/Refund.java", "line": 1, "created_at": "2026-05-01T10:00:00Z" },
    { "user": "bob", "body": "Charges must be idempotent.", "path": "src/Charge.java", "line": 5 }
  ]
})";

const char* kChangeSet = R"({
  "repository": "acme/payments",
  "pr_number": "31",
  "title": "Partial refunds",
  "files": [
    { "filename": "src/PartialRefund.java", "status": "added",
      "patch": "@@ -0,0 +1,3 @@\n+class PartialRefund {\n+  void refund(Order o, BigDecimal part) {}\n+}\n" },
    { "filename": "src/Other.java", "added_lines": [ { "line": 7, "text": "int unrelated = 0;" } ] },
    { "filename": "src/Slow.java", "added_lines": [ { "line": 1, "text": "// SLOWCALL" } ] },
    { "filename": "src/Tiny.java", "added_lines": [ { "line": 1, "text": "// TINYVEC" } ] },
    { "filename": "src/Gateway.java", "added_lines": [ { "line": 3, "text": "charge(card); // GENFAIL" } ] }
  ]
})";

} // namespace

int main() {
    std::cout << "[Test] Starting ReviewPipeline Test..." << std::endl;

    const fs::path testRoot = "test_project_root_review";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);
    const std::string memoryDir = (testRoot / "memory").string();

    auto ai = std::make_shared<MockAIService>();

    // Event feed parsing.
    auto event = infrastructure::ReviewEventReader::parseEvent(kReviewEvent);
    assert(event.pullRequestId == "12");
    assert(event.diffs.size() == 2);
    assert(event.diffs[0].status == domain::FileStatus::Added);
    assert(event.diffs[0].addedLines.size() == 2);
    assert(event.diffs[0].addedLines[0].text == "void refund(Order o) {");
    assert(event.diffs[1].addedLines[0].lineNumber == 5);
    assert(event.comments[1].author == "bob" && event.comments[1].timestamp.empty());
    std::cout << "[PASS] Review event parsed." << std::endl;

    bool threw = false;
    try {
        infrastructure::ReviewEventReader::parseChangeSet("{\"title\": \"no repository\"}");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Malformed change set rejected." << std::endl;

    // Empty memory: a report with no suggestions and no model calls.
    {
        auto store = std::make_shared<infrastructure::MemoryStore>();
        auto sink = std::make_shared<RecordingSink>();
        application::ReviewPipeline pipeline(ai, store, sink, domain::DiffChunker(), domain::SimilarityPolicy(),
                                             std::make_shared<application::SuggestionAggregator>(ai));
        auto report = pipeline.review(infrastructure::ReviewEventReader::parseChangeSet(kChangeSet));
        assert(report.suggestions.empty());
        assert(sink->suggestions.empty());
        assert(sink->summary && sink->summary->memorySize == 0);
        assert(sink->summary->chunksAnalyzed == 5);
        assert(ai->embeddingCalls == 0);
        assert(ai->prompts.empty());
        std::cout << "[PASS] Empty memory yields an empty report." << std::endl;
    }

    // Ingest, persist, reload.
    {
        auto store = std::make_shared<infrastructure::MemoryStore>();
        application::IngestionPipeline ingestion(ai, store);
        auto result = ingestion.ingest(event);
        assert(result.appended.size() == 2);
        store->persist(memoryDir);
    }
    auto store = std::make_shared<infrastructure::MemoryStore>(3);
    assert(store->load(memoryDir));
    assert(store->size() == 2);

    // Full pass with per-chunk failures.
    {
        auto change = infrastructure::ReviewEventReader::parseChangeSet(kChangeSet);
        auto sink = std::make_shared<RecordingSink>();
        application::ReviewPipeline pipeline(ai, store, sink, domain::DiffChunker(), domain::SimilarityPolicy(),
                                             std::make_shared<application::SuggestionAggregator>(ai));
        auto report = pipeline.review(change);

        assert(report.suggestions.size() == 1);
        const auto& suggestion = report.suggestions[0];
        assert(suggestion.chunk.filePath == "src/PartialRefund.java");
        assert(suggestion.chunk.startLine == 1 && suggestion.chunk.endLine == 3);
        assert(suggestion.matchCount == 2 && "Both memories clear the 0.2 threshold of a tiny store.");
        assert(suggestion.provenance[0].author == "alice");
        assert(suggestion.provenance[0].score == 1.0f);
        assert(suggestion.commentText ==
               "Validate the refund amount here as well.\n\n"
               "🤖 This suggestion is based on 2 similar past review(s) by @alice (similarity: 100%)\n"
               "📋 Related areas: general, validation");

        assert(sink->suggestions.size() == 1);
        const auto& summary = *sink->summary;
        assert(summary.repository == "acme/payments" && summary.pullRequestId == "31");
        assert(summary.model == "mock");
        assert(summary.chunksAnalyzed == 5);
        assert(summary.chunksWithMatches == 2);
        assert(summary.suggestionsGenerated == 1);
        assert(summary.memorySize == 2);
        assert(summary.threshold == 0.2f);
        assert(summary.skipped.size() == 3);
        assert(summary.skipped[0].filePath == "src/Slow.java");
        assert(summary.skipped[0].reason.find("ExternalCallTimeout") != std::string::npos);
        assert(summary.skipped[1].filePath == "src/Tiny.java");
        assert(summary.skipped[1].reason.find("DimensionMismatch") != std::string::npos);
        assert(summary.skipped[2].filePath == "src/Gateway.java");
        std::cout << "[PASS] Review pass isolates per-chunk failures." << std::endl;
    }

    // JSON report sink.
    {
        auto change = infrastructure::ReviewEventReader::parseChangeSet(kChangeSet);
        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        const std::string output = (testRoot / "generated_review.json").string();
        auto sink = std::make_shared<infrastructure::JsonReviewSink>(output, persistence, change.diffs);
        application::ReviewSettings settings;
        settings.topK = 1;
        settings.maxParallelRequests = 2;
        application::ReviewPipeline pipeline(ai, store, sink, domain::DiffChunker(), domain::SimilarityPolicy(),
                                             std::make_shared<application::SuggestionAggregator>(ai), settings);
        pipeline.review(change);
        persistence->flush();

        assert(fs::exists(output));
        std::ifstream f(output);
        auto report = nlohmann::json::parse(f);
        assert(report == sink->report());
        assert(report["pr_number"] == "31");
        assert(report["comments"].size() == 1);
        const auto& comment = report["comments"][0];
        assert(comment["file"] == "src/PartialRefund.java");
        assert(comment["line"] == 1);
        assert(comment["position"] == 1);
        assert(comment["general"] == false);
        assert(comment["match_count"] == 1);
        assert(comment["similarity_info"].size() == 1);
        assert(comment["similarity_info"][0]["reviewer"] == "alice");
        assert(report["metadata"]["total_chunks_analyzed"] == 5);
        assert(report["metadata"]["comments_generated"] == 1);
        assert(report["metadata"]["memory_size"] == 2);
        assert(report["metadata"]["skipped"].size() == 3);
        assert(report["metadata"]["model"] == "mock");
        std::cout << "[PASS] Review report written." << std::endl;
    }

    // Chunks without a similar past review are checked against the guidelines alone.
    {
        auto change = infrastructure::ReviewEventReader::parseChangeSet(kChangeSet);
        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        const std::string output = (testRoot / "guideline_review.json").string();
        auto sink = std::make_shared<infrastructure::JsonReviewSink>(output, persistence, change.diffs);
        application::AggregatorConfig config;
        config.reviewGuidelines = "Money is always BigDecimal.";
        application::ReviewPipeline pipeline(ai, store, sink, domain::DiffChunker(), domain::SimilarityPolicy(),
                                             std::make_shared<application::SuggestionAggregator>(ai, config));
        auto result = pipeline.review(change);
        persistence->flush();

        assert(result.suggestions.size() == 2);
        assert(result.suggestions[0].chunk.filePath == "src/PartialRefund.java");
        assert(result.suggestions[0].matchCount == 2);
        const auto& general = result.suggestions[1];
        assert(general.chunk.filePath == "src/Other.java");
        assert(general.provenance.empty());
        assert(general.matchCount == 0);
        assert(general.commentText ==
               "Validate the refund amount here as well.\n\n---\n📜 Review context:\nMoney is always BigDecimal.");
        assert(result.summary.chunksWithMatches == 2 && "Guideline-only chunks are not matches.");
        assert(result.summary.suggestionsGenerated == 2);
        assert(result.summary.skipped.size() == 3);

        bool guidelinePrompt = false;
        for (const auto& prompt : ai->prompts) {
            if (prompt.find("int unrelated = 0;") == std::string::npos) continue;
            guidelinePrompt = prompt.find("=== REVIEW_GUIDELINES ===") != std::string::npos &&
                              prompt.find("PRIMARY_PAST_REVIEW") == std::string::npos;
        }
        assert(guidelinePrompt);

        auto report = sink->report();
        assert(report["comments"].size() == 2);
        assert(report["comments"][0]["general"] == false);
        assert(report["comments"][0].contains("position"));
        assert(report["comments"][1]["general"] == true);
        assert(!report["comments"][1].contains("position"));
        assert(report["comments"][1]["similarity_info"].empty());
        assert(report["comments"][1]["match_count"] == 0);
        std::cout << "[PASS] Guideline-only suggestions posted as general comments." << std::endl;
    }

    // Empty memory with guidelines: every chunk is reviewed against them without embeddings.
    {
        auto change = infrastructure::ReviewEventReader::parseChangeSet(kChangeSet);
        auto emptyStore = std::make_shared<infrastructure::MemoryStore>();
        auto sink = std::make_shared<RecordingSink>();
        application::AggregatorConfig config;
        config.reviewGuidelines = "Money is always BigDecimal.";
        application::ReviewPipeline pipeline(ai, emptyStore, sink, domain::DiffChunker(), domain::SimilarityPolicy(),
                                             std::make_shared<application::SuggestionAggregator>(ai, config));
        const int embeddingsBefore = ai->embeddingCalls;
        auto report = pipeline.review(change);

        assert(report.suggestions.size() == 4);
        for (const auto& suggestion : report.suggestions) {
            assert(suggestion.provenance.empty());
            assert(suggestion.commentText.find("📜 Review context:") != std::string::npos);
        }
        assert(sink->suggestions.size() == 4);
        assert(sink->summary->chunksWithMatches == 0);
        assert(sink->summary->skipped.size() == 1);
        assert(sink->summary->skipped[0].filePath == "src/Gateway.java");
        assert(ai->embeddingCalls == embeddingsBefore);
        std::cout << "[PASS] Empty memory falls back to the guidelines." << std::endl;
    }

    // A multi-byte character at the exemplar preview cut, and undecodable bytes in one chunk.
    {
        auto strictAi = std::make_shared<StrictJsonAIService>();
        auto unicodeStore = std::make_shared<infrastructure::MemoryStore>();
        domain::MemoryEntry stored;
        stored.embedding = {1.0f, 0.0f, 0.0f};
        stored.snippetText = std::string(199, 'a') + "é" + "tail";
        stored.commentText = "Labels go through the shared formatter.";
        stored.metadata.author = "dana";
        stored.metadata.tags = {"style"};
        unicodeStore->insert(stored);

        domain::ChangeSet change;
        change.repository = "acme/payments";
        change.pullRequestId = "40";
        change.diffs.push_back({"src/Label.java", domain::FileStatus::Added, "", {{1, "String label = \"café\";"}}});
        change.diffs.push_back({"src/Receipt.java", domain::FileStatus::Added, "", {{1, "String total = \"\xC3(\";"}}});
        change.diffs.push_back({"src/Invoice.java", domain::FileStatus::Added, "", {{2, "print(invoice);"}}});

        auto sink = std::make_shared<RecordingSink>();
        application::ReviewPipeline pipeline(strictAi, unicodeStore, sink, domain::DiffChunker(),
                                             domain::SimilarityPolicy(),
                                             std::make_shared<application::SuggestionAggregator>(strictAi));
        auto report = pipeline.review(change);

        assert(report.suggestions.size() == 2);
        assert(report.suggestions[0].chunk.filePath == "src/Label.java");
        assert(report.suggestions[1].chunk.filePath == "src/Invoice.java");
        assert(strictAi->bodies.size() == 2);
        assert(strictAi->bodies[0].find(std::string(199, 'a') + "...") != std::string::npos);

        assert(sink->summary && sink->summary->model == "strict");
        assert(sink->summary->suggestionsGenerated == 2);
        assert(sink->summary->skipped.size() == 1);
        assert(sink->summary->skipped[0].filePath == "src/Receipt.java");
        assert(sink->summary->skipped[0].reason.find("suggestion failed") != std::string::npos);
        std::cout << "[PASS] Encoding failures stay inside their chunk." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
