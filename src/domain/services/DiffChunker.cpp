#include "domain/services/DiffChunker.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace reviewmemory::domain {

namespace {

std::string summarize(const FileDiff& diff, size_t addedCount, size_t runCount) {
    std::stringstream ss;
    ss << diff.filePath << ": " << addedCount << " added line(s) in " << runCount << " run(s)";
    return ss.str();
}

} // namespace

DiffChunker::DiffChunker(int maxLines) : m_maxLines(maxLines) {
    if (m_maxLines < 1) {
        throw std::invalid_argument("DiffChunker: maxLines must be at least 1.");
    }
}

std::vector<DiffChunk> DiffChunker::split(const std::vector<FileDiff>& diffs, const std::string& prTitle) const {
    std::vector<DiffChunk> chunks;
    for (const auto& diff : diffs) {
        auto fileChunks = splitFile(diff, prTitle);
        chunks.insert(chunks.end(),
                      std::make_move_iterator(fileChunks.begin()),
                      std::make_move_iterator(fileChunks.end()));
    }
    return chunks;
}

std::vector<DiffChunk> DiffChunker::splitFile(const FileDiff& diff, const std::string& prTitle) const {
    std::vector<DiffChunk> chunks;
    if (diff.addedLines.empty()) return chunks;

    // Sorted, one entry per line number; the first occurrence of a duplicate wins.
    std::vector<AddedLine> lines;
    std::copy_if(diff.addedLines.begin(), diff.addedLines.end(), std::back_inserter(lines),
                 [](const AddedLine& line) { return line.lineNumber >= 1; });
    if (lines.empty()) return chunks;
    std::stable_sort(lines.begin(), lines.end(), [](const AddedLine& a, const AddedLine& b) {
        return a.lineNumber < b.lineNumber;
    });
    lines.erase(std::unique(lines.begin(), lines.end(), [](const AddedLine& a, const AddedLine& b) {
        return a.lineNumber == b.lineNumber;
    }), lines.end());

    std::vector<std::pair<size_t, size_t>> runs; // [begin, end) into lines
    size_t runBegin = 0;
    for (size_t i = 1; i <= lines.size(); ++i) {
        if (i == lines.size() || lines[i].lineNumber != lines[i - 1].lineNumber + 1) {
            runs.emplace_back(runBegin, i);
            runBegin = i;
        }
    }

    ChunkContext context{prTitle, summarize(diff, lines.size(), runs.size())};
    const size_t maxLines = static_cast<size_t>(m_maxLines);

    for (const auto& [begin, end] : runs) {
        for (size_t first = begin; first < end; first += maxLines) {
            size_t last = std::min(first + maxLines, end); // exclusive
            DiffChunk chunk;
            chunk.filePath = diff.filePath;
            chunk.startLine = lines[first].lineNumber;
            chunk.endLine = lines[last - 1].lineNumber;
            chunk.context = context;
            for (size_t i = first; i < last; ++i) {
                if (i != first) chunk.text += '\n';
                chunk.text += lines[i].text;
            }
            chunks.push_back(std::move(chunk));
        }
    }
    return chunks;
}

std::optional<DiffChunk> DiffChunker::locate(const std::vector<DiffChunk>& chunks,
                                             const std::string& filePath, int line) {
    auto it = std::find_if(chunks.begin(), chunks.end(), [&](const DiffChunk& chunk) {
        return chunk.filePath == filePath && chunk.covers(line);
    });
    if (it == chunks.end()) return std::nullopt;
    return *it;
}

} // namespace reviewmemory::domain
