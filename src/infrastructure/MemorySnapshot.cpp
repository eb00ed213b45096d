/**
 * @file MemorySnapshot.cpp
 * @brief Implementation of MemorySnapshot.
 */

#include "infrastructure/MemorySnapshot.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "domain/MemoryErrors.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace reviewmemory::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr char kBlobMagic[4] = {'R', 'M', 'V', 'I'};
constexpr std::size_t kBlobHeaderSize = 4 + 4 + 8 + 4 + 8;
const std::string kBlobPrefix = "vectors-";
const std::string kBlobSuffix = ".bin";

void putU32(std::string& out, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((value >> (8 * i)) & 0xFFu));
}

void putU64(std::string& out, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((value >> (8 * i)) & 0xFFu));
}

std::uint32_t getU32(const std::string& in, std::size_t offset) {
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>(static_cast<unsigned char>(in[offset + i])) << (8 * i);
    }
    return value;
}

std::uint64_t getU64(const std::string& in, std::size_t offset) {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(static_cast<unsigned char>(in[offset + i])) << (8 * i);
    }
    return value;
}

void putFloat(std::string& out, float value) {
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    putU32(out, bits);
}

float getFloat(const std::string& in, std::size_t offset) {
    std::uint32_t bits = getU32(in, offset);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::optional<std::uint64_t> generationFromBlobName(const std::string& name) {
    if (name.size() <= kBlobPrefix.size() + kBlobSuffix.size()) return std::nullopt;
    if (name.compare(0, kBlobPrefix.size(), kBlobPrefix) != 0) return std::nullopt;
    if (name.compare(name.size() - kBlobSuffix.size(), kBlobSuffix.size(), kBlobSuffix) != 0) return std::nullopt;
    std::string digits = name.substr(kBlobPrefix.size(), name.size() - kBlobPrefix.size() - kBlobSuffix.size());
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return std::nullopt;
    try {
        return std::stoull(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

json entryToJson(const domain::MemoryEntry& entry) {
    const auto& meta = entry.metadata;
    return {
        {"id", entry.id},
        {"snippet", entry.snippetText},
        {"comment", entry.commentText},
        {"repository", meta.repository},
        {"pull_request_id", meta.pullRequestId},
        {"file_path", meta.filePath},
        {"line_number", meta.lineNumber},
        {"author", meta.author},
        {"tags", meta.tags},
        {"timestamp", meta.timestamp}
    };
}

domain::MemoryEntry entryFromJson(const json& j) {
    domain::MemoryEntry entry;
    entry.id = j.at("id").get<std::uint64_t>();
    entry.snippetText = j.at("snippet").get<std::string>();
    entry.commentText = j.at("comment").get<std::string>();
    entry.metadata.repository = j.at("repository").get<std::string>();
    entry.metadata.pullRequestId = j.at("pull_request_id").get<std::string>();
    entry.metadata.filePath = j.at("file_path").get<std::string>();
    entry.metadata.lineNumber = j.at("line_number").get<int>();
    entry.metadata.author = j.at("author").get<std::string>();
    entry.metadata.tags = j.at("tags").get<std::set<std::string>>();
    entry.metadata.timestamp = j.value("timestamp", "");
    return entry;
}

} // namespace

MemorySnapshot::MemorySnapshot(std::string directory) : m_directory(std::move(directory)) {}

std::string MemorySnapshot::blobFileName(std::uint64_t generation) const {
    std::stringstream ss;
    ss << kBlobPrefix << std::setw(6) << std::setfill('0') << generation << kBlobSuffix;
    return ss.str();
}

std::vector<std::string> MemorySnapshot::listBlobs() const {
    std::vector<std::string> blobs;
    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) return blobs;
    for (const auto& item : fs::directory_iterator(m_directory, ec)) {
        std::string name = item.path().filename().string();
        if (item.is_regular_file() && generationFromBlobName(name)) {
            blobs.push_back(name);
        }
    }
    std::sort(blobs.begin(), blobs.end());
    return blobs;
}

bool MemorySnapshot::exists() const {
    return fs::exists(fs::path(m_directory) / kMetadataFile) || !listBlobs().empty();
}

std::uint64_t MemorySnapshot::currentGeneration() const {
    fs::path metaPath = fs::path(m_directory) / kMetadataFile;
    if (!fs::exists(metaPath)) return 0;
    try {
        std::ifstream f(metaPath);
        json j = json::parse(f);
        return j.value("generation", std::uint64_t{0});
    } catch (const std::exception& e) {
        std::cerr << "[MemorySnapshot] Unreadable metadata, generation unknown: " << e.what() << std::endl;
        return 0;
    }
}

std::uint64_t MemorySnapshot::write(std::size_t dimension, const std::vector<domain::MemoryEntry>& entries) const {
    std::uint64_t generation = currentGeneration();
    for (const auto& name : listBlobs()) {
        generation = std::max(generation, generationFromBlobName(name).value_or(0));
    }
    ++generation;

    std::string blob;
    blob.reserve(kBlobHeaderSize + entries.size() * dimension * sizeof(float));
    blob.append(kBlobMagic, sizeof(kBlobMagic));
    putU32(blob, kBlobFormat);
    putU64(blob, generation);
    putU32(blob, static_cast<std::uint32_t>(dimension));
    putU64(blob, entries.size());
    for (const auto& entry : entries) {
        if (entry.embedding.size() != dimension) {
            throw domain::DimensionMismatch(dimension, entry.embedding.size());
        }
        for (float value : entry.embedding) putFloat(blob, value);
    }

    const std::string blobName = blobFileName(generation);
    const fs::path blobPath = fs::path(m_directory) / blobName;
    if (!PersistenceService::writeAtomic(blobPath.string(), blob)) {
        throw std::runtime_error("MemorySnapshot: failed to write " + blobPath.string());
    }

    json meta = {
        {"version", kVersionTag},
        {"generation", generation},
        {"dimension", dimension},
        {"entry_count", entries.size()},
        {"index_file", blobName},
        {"entries", json::array()}
    };
    for (const auto& entry : entries) {
        meta["entries"].push_back(entryToJson(entry));
    }

    const fs::path metaPath = fs::path(m_directory) / kMetadataFile;
    if (!PersistenceService::writeAtomic(metaPath.string(), meta.dump(2, ' ', false, json::error_handler_t::replace))) {
        std::error_code ec;
        fs::remove(blobPath, ec);
        throw std::runtime_error("MemorySnapshot: failed to write " + metaPath.string());
    }

    for (const auto& name : listBlobs()) {
        if (name == blobName) continue;
        std::error_code ec;
        fs::remove(fs::path(m_directory) / name, ec);
        if (ec) {
            std::cerr << "[MemorySnapshot] Could not remove stale blob " << name << ": " << ec.message() << std::endl;
        }
    }
    return generation;
}

SnapshotData MemorySnapshot::read() const {
    const fs::path metaPath = fs::path(m_directory) / kMetadataFile;
    if (!fs::exists(metaPath)) {
        if (!listBlobs().empty()) {
            throw domain::CorruptStore("vector blob present in " + m_directory + " without " + kMetadataFile);
        }
        throw domain::CorruptStore("no snapshot in " + m_directory);
    }

    SnapshotData data;
    std::string blobName;
    std::size_t declaredCount = 0;
    try {
        std::ifstream f(metaPath);
        json meta = json::parse(f);
        if (meta.value("version", "") != kVersionTag) {
            throw domain::CorruptStore("unsupported snapshot version '" + meta.value("version", "") + "'");
        }
        data.generation = meta.at("generation").get<std::uint64_t>();
        data.dimension = meta.at("dimension").get<std::size_t>();
        declaredCount = meta.at("entry_count").get<std::size_t>();
        blobName = meta.at("index_file").get<std::string>();
        for (const auto& item : meta.at("entries")) {
            data.entries.push_back(entryFromJson(item));
        }
    } catch (const json::exception& e) {
        throw domain::CorruptStore(std::string("malformed ") + kMetadataFile + ": " + e.what());
    }

    if (declaredCount != data.entries.size()) {
        throw domain::CorruptStore("metadata declares " + std::to_string(declaredCount) +
                                   " entries but lists " + std::to_string(data.entries.size()));
    }
    for (std::size_t i = 0; i < data.entries.size(); ++i) {
        if (data.entries[i].id != i) {
            throw domain::CorruptStore("entry at position " + std::to_string(i) +
                                       " has id " + std::to_string(data.entries[i].id));
        }
    }

    const fs::path blobPath = fs::path(m_directory) / blobName;
    if (blobName.find('/') != std::string::npos || !fs::exists(blobPath)) {
        throw domain::CorruptStore("metadata references missing vector blob '" + blobName + "'");
    }

    std::string blob;
    {
        std::ifstream f(blobPath, std::ios::binary);
        std::stringstream buffer;
        buffer << f.rdbuf();
        blob = buffer.str();
    }
    if (blob.size() < kBlobHeaderSize || std::memcmp(blob.data(), kBlobMagic, sizeof(kBlobMagic)) != 0) {
        throw domain::CorruptStore("vector blob '" + blobName + "' has no valid header");
    }
    if (getU32(blob, 4) != kBlobFormat) {
        throw domain::CorruptStore("vector blob format " + std::to_string(getU32(blob, 4)) + " not supported");
    }
    const std::uint64_t blobGeneration = getU64(blob, 8);
    const std::size_t blobDimension = getU32(blob, 16);
    const std::uint64_t blobCount = getU64(blob, 20);

    if (blobGeneration != data.generation) {
        throw domain::CorruptStore("vector blob generation " + std::to_string(blobGeneration) +
                                   " does not match metadata generation " + std::to_string(data.generation));
    }
    if (blobDimension != data.dimension) {
        throw domain::CorruptStore("vector blob dimension " + std::to_string(blobDimension) +
                                   " does not match metadata dimension " + std::to_string(data.dimension));
    }
    if (blobCount != data.entries.size()) {
        throw domain::CorruptStore("vector blob holds " + std::to_string(blobCount) +
                                   " vectors for " + std::to_string(data.entries.size()) + " entries");
    }
    if (blob.size() != kBlobHeaderSize + blobCount * blobDimension * sizeof(float)) {
        throw domain::CorruptStore("vector blob size does not match " + std::to_string(blobCount) +
                                   " x " + std::to_string(blobDimension) + " floats");
    }
    if (blobCount > 0 && blobDimension == 0) {
        throw domain::CorruptStore("vector blob stores entries with dimension 0");
    }

    std::size_t offset = kBlobHeaderSize;
    for (auto& entry : data.entries) {
        entry.embedding.resize(blobDimension);
        for (std::size_t i = 0; i < blobDimension; ++i) {
            entry.embedding[i] = getFloat(blob, offset);
            offset += sizeof(float);
        }
    }
    return data;
}

} // namespace reviewmemory::infrastructure
