#include "domain/services/UnifiedDiffParser.hpp"
#include <cctype>
#include <sstream>

namespace reviewmemory::domain {

namespace {

bool startsWith(const std::string& line, const char* prefix) {
    return line.rfind(prefix, 0) == 0;
}

void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

} // namespace

int UnifiedDiffParser::hunkStartLine(const std::string& header) {
    size_t plus = header.find('+', 2);
    if (!startsWith(header, "@@") || plus == std::string::npos) return 1;

    size_t pos = plus + 1;
    size_t end = pos;
    while (end < header.size() && std::isdigit(static_cast<unsigned char>(header[end]))) ++end;
    if (end == pos) return 1;

    try {
        return std::stoi(header.substr(pos, end - pos));
    } catch (const std::exception&) {
        return 1;
    }
}

FileDiff UnifiedDiffParser::parse(const std::string& filePath, const std::string& patch, FileStatus status) {
    FileDiff diff;
    diff.filePath = filePath;
    diff.status = status;
    diff.patch = patch;

    std::stringstream ss(patch);
    std::string line;
    int newLine = 0;
    bool inHunk = false;
    while (std::getline(ss, line)) {
        stripCarriageReturn(line);
        if (startsWith(line, "@@")) {
            newLine = hunkStartLine(line);
            inHunk = true;
            continue;
        }
        if (!inHunk) continue; // file headers ("diff --git", "---", "+++")

        if (startsWith(line, "+")) {
            diff.addedLines.push_back({newLine, line.substr(1)});
            ++newLine;
        } else if (startsWith(line, "-") || startsWith(line, "\\")) {
            continue;
        } else {
            ++newLine;
        }
    }
    return diff;
}

std::optional<int> UnifiedDiffParser::positionInPatch(const std::string& patch, int newLine) {
    std::stringstream ss(patch);
    std::string line;
    int position = 0;
    int current = 0;
    bool inHunk = false;
    while (std::getline(ss, line)) {
        stripCarriageReturn(line);
        if (startsWith(line, "@@")) {
            if (inHunk) ++position;
            current = hunkStartLine(line);
            inHunk = true;
            continue;
        }
        if (!inHunk) continue;

        ++position;
        if (startsWith(line, "+")) {
            if (current == newLine) return position;
            ++current;
        } else if (!startsWith(line, "-") && !startsWith(line, "\\")) {
            ++current;
        }
    }
    return std::nullopt;
}

} // namespace reviewmemory::domain
