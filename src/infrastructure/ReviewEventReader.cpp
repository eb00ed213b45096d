/**
 * @file ReviewEventReader.cpp
 * @brief Implementation of ReviewEventReader.
 */

#include "infrastructure/ReviewEventReader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "domain/services/UnifiedDiffParser.hpp"

namespace reviewmemory::infrastructure {

using json = nlohmann::json;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json parseDocument(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("malformed JSON: ") + e.what());
    }
}

// Pull request numbers arrive as numbers from the host API and as strings from hand-written feeds.
std::string idToString(const json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_number_integer()) return std::to_string(j.get<long long>());
    throw std::runtime_error("pr_number must be a number or a string");
}

domain::FileDiff parseFile(const json& j) {
    const std::string path = j.at("filename").get<std::string>();
    const auto status = ReviewEventReader::statusFromString(j.value("status", "modified"));

    if (j.contains("patch") && j.at("patch").is_string()) {
        return domain::UnifiedDiffParser::parse(path, j.at("patch").get<std::string>(), status);
    }

    domain::FileDiff diff;
    diff.filePath = path;
    diff.status = status;
    for (const auto& line : j.value("added_lines", json::array())) {
        diff.addedLines.push_back({line.at("line").get<int>(), line.value("text", "")});
    }
    return diff;
}

template <typename Header>
void parseHeader(const json& j, Header& header) {
    header.repository = j.at("repository").get<std::string>();
    header.pullRequestId = idToString(j.at("pr_number"));
    header.prTitle = j.value("title", "");
    for (const auto& file : j.value("files", json::array())) {
        header.diffs.push_back(parseFile(file));
    }
}

} // namespace

domain::FileStatus ReviewEventReader::statusFromString(const std::string& status) {
    if (status == "added") return domain::FileStatus::Added;
    if (status == "removed") return domain::FileStatus::Removed;
    if (status == "renamed") return domain::FileStatus::Renamed;
    return domain::FileStatus::Modified;
}

domain::ReviewEvent ReviewEventReader::parseEvent(const std::string& text) {
    json j = parseDocument(text);
    domain::ReviewEvent event;
    try {
        parseHeader(j, event);
        event.timestamp = j.value("timestamp", "");
        for (const auto& c : j.value("comments", json::array())) {
            domain::ReviewComment comment;
            comment.author = c.value("user", "");
            comment.body = c.value("body", "");
            comment.filePath = c.value("path", "");
            comment.line = c.contains("line") && c.at("line").is_number_integer() ? c.at("line").get<int>() : 0;
            comment.timestamp = c.value("created_at", "");
            event.comments.push_back(std::move(comment));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid review event: ") + e.what());
    }
    return event;
}

domain::ChangeSet ReviewEventReader::parseChangeSet(const std::string& text) {
    json j = parseDocument(text);
    domain::ChangeSet change;
    try {
        parseHeader(j, change);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid change set: ") + e.what());
    }
    return change;
}

domain::ReviewEvent ReviewEventReader::readEventFile(const std::string& path) {
    return parseEvent(readFile(path));
}

domain::ChangeSet ReviewEventReader::readChangeSetFile(const std::string& path) {
    return parseChangeSet(readFile(path));
}

} // namespace reviewmemory::infrastructure
