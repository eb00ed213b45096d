#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "domain/MemoryErrors.hpp"
#include "infrastructure/MemoryStore.hpp"

using namespace reviewmemory;
using reviewmemory::infrastructure::MemoryStore;

namespace {

domain::MemoryEntry MakeEntry(std::vector<float> embedding, const std::string& comment,
                              std::set<std::string> tags = {"general"}) {
    domain::MemoryEntry entry;
    entry.embedding = std::move(embedding);
    entry.snippetText = "int x = 0;";
    entry.commentText = comment;
    entry.metadata.repository = "acme/payments";
    entry.metadata.pullRequestId = "7";
    entry.metadata.filePath = "src/A.java";
    entry.metadata.lineNumber = 3;
    entry.metadata.author = "alice";
    entry.metadata.tags = std::move(tags);
    return entry;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MemoryStore Test..." << std::endl;

    // Empty store: no hits, no error, whatever the query length.
    {
        MemoryStore store;
        assert(store.size() == 0);
        assert(store.search({1.0f, 2.0f, 3.0f}, 3).empty());
        assert(store.stats().entryCount == 0);
        std::cout << "[PASS] Empty store search returns nothing." << std::endl;
    }

    // First insert defines D, ids follow insertion order.
    {
        MemoryStore store;
        assert(store.insert(MakeEntry({0.0f, 0.0f}, "first")) == 0);
        assert(store.insert(MakeEntry({1.0f, 0.0f}, "second")) == 1);
        assert(store.insert(MakeEntry({0.0f, 3.0f}, "third")) == 2);
        assert(store.dimension() == 2);
        assert(store.size() == 3);
        assert(store.entryAt(1)->commentText == "second");
        assert(store.entryAt(1)->id == 1);
        assert(store.entryAt(3) == nullptr);

        bool threw = false;
        try {
            store.insert(MakeEntry({1.0f, 2.0f, 3.0f}, "wrong"));
        } catch (const domain::DimensionMismatch& e) {
            threw = true;
            assert(e.expected() == 2);
            assert(e.actual() == 3);
        }
        assert(threw && "Wrong-sized embedding must be rejected.");
        assert(store.size() == 3 && "A rejected insert must not change the store.");

        threw = false;
        try {
            store.insert(MakeEntry({}, "empty"));
        } catch (const domain::DimensionMismatch&) {
            threw = true;
        }
        assert(threw && "Empty embedding must be rejected.");
        std::cout << "[PASS] Insert assigns positional ids and enforces the dimension." << std::endl;

        // Nearest first; squared distances.
        auto hits = store.search({0.0f, 0.0f}, 2);
        assert(hits.size() == 2);
        assert(hits[0].entry->id == 0 && hits[0].distance == 0.0f);
        assert(hits[1].entry->id == 1 && hits[1].distance == 1.0f);

        // topK larger than the store returns everything.
        assert(store.search({0.0f, 0.0f}, 10).size() == 3);
        assert(store.search({0.0f, 0.0f}, 10)[2].distance == 9.0f);

        threw = false;
        try {
            store.search({0.0f}, 3);
        } catch (const domain::DimensionMismatch&) {
            threw = true;
        }
        assert(threw && "Wrong-sized query on a non-empty store must be rejected.");
        std::cout << "[PASS] Search orders by squared L2 distance." << std::endl;
    }

    // Equal distances: lower id first.
    {
        MemoryStore store;
        store.insert(MakeEntry({1.0f, 0.0f}, "right"));
        store.insert(MakeEntry({-1.0f, 0.0f}, "left"));
        store.insert(MakeEntry({0.0f, 1.0f}, "up"));
        auto hits = store.search({0.0f, 0.0f}, 3);
        assert(hits.size() == 3);
        assert(hits[0].entry->id == 0 && hits[1].entry->id == 1 && hits[2].entry->id == 2);
        std::cout << "[PASS] Ties are broken by insertion order." << std::endl;
    }

    // Configured dimension is enforced from the first insert.
    {
        MemoryStore store(4);
        assert(store.isDimensionConfigured());
        assert(store.dimension() == 4);
        bool threw = false;
        try {
            store.insert(MakeEntry({1.0f, 2.0f}, "short"));
        } catch (const domain::DimensionMismatch&) {
            threw = true;
        }
        assert(threw);
        assert(store.insert(MakeEntry({1.0f, 2.0f, 3.0f, 4.0f}, "fits")) == 0);

        MemoryStore fixed(384);
        fixed.insert(MakeEntry(std::vector<float>(384, 0.5f), "fits"));
        threw = false;
        try {
            fixed.insert(MakeEntry(std::vector<float>(300, 0.5f), "too short"));
        } catch (const domain::DimensionMismatch& e) {
            threw = e.expected() == 384 && e.actual() == 300;
        }
        assert(threw);
        assert(fixed.size() == 1 && "Entry count unchanged after a rejected insert.");
        std::cout << "[PASS] Configured dimension enforced." << std::endl;
    }

    // Stats histogram.
    {
        MemoryStore store;
        store.insert(MakeEntry({0.0f}, "a", {"security", "validation"}));
        store.insert(MakeEntry({1.0f}, "b", {"security"}));
        auto stats = store.stats();
        assert(stats.entryCount == 2);
        assert(stats.dimension == 1);
        assert(stats.tagHistogram.at("security") == 2);
        assert(stats.tagHistogram.at("validation") == 1);
        std::cout << "[PASS] Stats report tag histogram." << std::endl;
    }

    // Concurrent appends are serialized: ids stay unique and dense.
    {
        MemoryStore store;
        const int kThreads = 8;
        const int kPerThread = 50;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&store, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    store.insert(MakeEntry({static_cast<float>(t), static_cast<float>(i)}, "c"));
                }
            });
        }
        for (auto& thread : threads) thread.join();

        assert(store.size() == static_cast<size_t>(kThreads * kPerThread));
        for (size_t i = 0; i < store.size(); ++i) {
            assert(store.entryAt(i)->id == i);
        }
        std::cout << "[PASS] Concurrent inserts keep ids dense." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
