#include <cassert>
#include <iostream>
#include <stdexcept>

#include "domain/services/DiffChunker.hpp"
#include "domain/services/UnifiedDiffParser.hpp"

using namespace reviewmemory::domain;

namespace {

FileDiff ContiguousFile(const std::string& path, int first, int count) {
    FileDiff diff;
    diff.filePath = path;
    for (int i = 0; i < count; ++i) {
        diff.addedLines.push_back({first + i, "line " + std::to_string(first + i)});
    }
    return diff;
}

const char* kPatch =
    "diff --git a/src/Pay.java b/src/Pay.java\n"
    "--- a/src/Pay.java\n"
    "+++ b/src/Pay.java\n"
    "@@ -1,3 +1,4 @@ class Pay {\n"
    " line1\n"
    "+added2\n"
    " line3\n"
    "-removed\n"
    "+added4\n"
    "@@ -10,2 +11,3 @@\n"
    " ctx11\n"
    "+added12\n"
    "\\ No newline at end of file\n";

} // namespace

int main() {
    std::cout << "[Test] Starting DiffChunker Test..." << std::endl;

    // 45 contiguous lines with the default bound of 20.
    {
        DiffChunker chunker;
        auto chunks = chunker.split({ContiguousFile("A.java", 1, 45)}, "Add payments");
        assert(chunks.size() == 3);
        assert(chunks[0].startLine == 1 && chunks[0].endLine == 20);
        assert(chunks[1].startLine == 21 && chunks[1].endLine == 40);
        assert(chunks[2].startLine == 41 && chunks[2].endLine == 45);
        assert(chunks[2].text == "line 41\nline 42\nline 43\nline 44\nline 45");
        assert(chunks[0].context.prTitle == "Add payments");
        assert(chunks[0].context.surroundingDiffSummary == "A.java: 45 added line(s) in 1 run(s)");
        for (const auto& chunk : chunks) {
            assert(chunk.lineCount() <= DiffChunker::kDefaultMaxLines);
        }
        assert(chunker.split({ContiguousFile("A.java", 1, 45)}, "Add payments") == chunks);
        std::cout << "[PASS] Long runs are cut at the line bound." << std::endl;
    }

    // Gaps start new chunks; input order does not matter; duplicates keep the first text.
    {
        FileDiff diff;
        diff.filePath = "B.java";
        diff.addedLines = {{12, "twelve"}, {3, "three"}, {4, "four"}, {11, "eleven"},
                           {3, "three again"}, {0, "bogus"}, {-2, "bogus"}};
        auto chunks = DiffChunker(5).split({diff});
        assert(chunks.size() == 2);
        assert(chunks[0].startLine == 3 && chunks[0].endLine == 4);
        assert(chunks[0].text == "three\nfour");
        assert(chunks[1].startLine == 11 && chunks[1].endLine == 12);
        assert(chunks[1].text == "eleven\ntwelve");
        std::cout << "[PASS] Gaps, ordering and duplicates handled." << std::endl;
    }

    // Files keep input order; a file without added lines yields nothing.
    {
        FileDiff removed;
        removed.filePath = "Gone.java";
        removed.status = FileStatus::Removed;
        auto chunks = DiffChunker(20).split({ContiguousFile("Z.java", 5, 2), removed, ContiguousFile("A.java", 1, 1)});
        assert(chunks.size() == 2);
        assert(chunks[0].filePath == "Z.java");
        assert(chunks[1].filePath == "A.java");
        assert(DiffChunker().split({}).empty());
        std::cout << "[PASS] File order preserved." << std::endl;
    }

    // Chunk lookup by file and line.
    {
        auto chunks = DiffChunker(10).split({ContiguousFile("A.java", 1, 25), ContiguousFile("B.java", 1, 3)});
        auto hit = DiffChunker::locate(chunks, "A.java", 15);
        assert(hit && hit->startLine == 11 && hit->endLine == 20);
        assert(DiffChunker::locate(chunks, "B.java", 3));
        assert(!DiffChunker::locate(chunks, "B.java", 4));
        assert(!DiffChunker::locate(chunks, "C.java", 1));
        std::cout << "[PASS] Chunk lookup." << std::endl;
    }

    // Invalid bound.
    {
        bool threw = false;
        try {
            DiffChunker chunker(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Non-positive line bound rejected." << std::endl;
    }

    // Unified diff parsing.
    {
        auto diff = UnifiedDiffParser::parse("src/Pay.java", kPatch);
        assert(diff.filePath == "src/Pay.java");
        assert(diff.patch == kPatch);
        assert(diff.addedLines.size() == 3);
        assert(diff.addedLines[0].lineNumber == 2 && diff.addedLines[0].text == "added2");
        assert(diff.addedLines[1].lineNumber == 4 && diff.addedLines[1].text == "added4");
        assert(diff.addedLines[2].lineNumber == 12 && diff.addedLines[2].text == "added12");

        auto chunks = DiffChunker().split({diff});
        assert(chunks.size() == 3 && "Lines 2, 4 and 12 are not contiguous.");

        assert(UnifiedDiffParser::hunkStartLine("@@ -1 +7 @@") == 7);
        assert(UnifiedDiffParser::hunkStartLine("@@ -3,4 +120,6 @@ void f()") == 120);
        assert(UnifiedDiffParser::hunkStartLine("garbage") == 1);
        assert(UnifiedDiffParser::hunkStartLine("@@ -1,2 +x @@") == 1);
        std::cout << "[PASS] Patch parsing numbers added lines." << std::endl;
    }

    // Positions count from the line after the first hunk header.
    {
        assert(UnifiedDiffParser::positionInPatch(kPatch, 2) == 2);
        assert(UnifiedDiffParser::positionInPatch(kPatch, 4) == 5);
        assert(UnifiedDiffParser::positionInPatch(kPatch, 12) == 8);
        assert(!UnifiedDiffParser::positionInPatch(kPatch, 3) && "Context lines have no inline position.");
        assert(!UnifiedDiffParser::positionInPatch(kPatch, 99));
        assert(!UnifiedDiffParser::positionInPatch("", 1));
        std::cout << "[PASS] Patch positions." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
