/**
 * @file ReviewEventStoreFs.cpp
 * @brief Implementation of ReviewEventStoreFs.
 */

#include "infrastructure/review/ReviewEventStoreFs.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace safetyreview::infrastructure::review {

using json = nlohmann::json;
namespace fs = std::filesystem;

ReviewEventStoreFs::ReviewEventStoreFs(std::string projectRoot, std::shared_ptr<PersistenceService> persistence)
    : m_projectRoot(std::move(projectRoot)), m_persistence(std::move(persistence)) {}

std::string ReviewEventStoreFs::getEventsFilePath(const std::string& reviewId) const {
    // Structure: <root>/reviews/sessions/<id>/events.ndjson
    fs::path path = fs::path(m_projectRoot) / "reviews" / "sessions" / reviewId / "events.ndjson";
    return path.string();
}

void ReviewEventStoreFs::append(const std::string& reviewId, const std::vector<StoredEvent>& events) {
    if (events.empty()) return;

    std::string filepath = getEventsFilePath(reviewId);

    // Pending writes of this stream must land before we read it back.
    m_persistence->flush();

    std::string fileContent;
    if (fs::exists(filepath)) {
        std::ifstream inFile(filepath);
        if (inFile) {
            std::stringstream buffer;
            buffer << inFile.rdbuf();
            fileContent = buffer.str();
            // Ensure ending newline
            if (!fileContent.empty() && fileContent.back() != '\n') {
                fileContent += "\n";
            }
        }
    }

    std::stringstream newContent;
    for (const auto& evt : events) {
        json j;
        j["type"] = evt.eventType;
        j["data"] = json::parse(evt.eventDataJson);
        j["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            evt.timestamp.time_since_epoch()).count();
        newContent << j.dump() << "\n";
    }

    m_persistence->saveTextAsync(filepath, fileContent + newContent.str());
}

std::vector<StoredEvent> ReviewEventStoreFs::readAll(const std::string& reviewId) {
    std::vector<StoredEvent> results;
    std::string filepath = getEventsFilePath(reviewId);

    m_persistence->flush();
    if (!fs::exists(filepath)) return results;

    std::ifstream inFile(filepath);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(inFile, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            StoredEvent evt;
            evt.eventType = j.at("type").get<std::string>();
            evt.eventDataJson = j.at("data").dump(); // Keep as string for later parsing

            long long ts = j.value("ts", 0LL);
            evt.timestamp = std::chrono::time_point<std::chrono::system_clock>(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ts)));

            results.push_back(evt);
        } catch (const json::exception& e) {
            // Replay assigns comment ids in order; a skipped line would shift every later id.
            throw std::runtime_error("Malformed line " + std::to_string(lineNo) + " of " + filepath + ": " + e.what());
        }
    }
    return results;
}

std::vector<std::string> ReviewEventStoreFs::getAllReviewIds() {
    std::vector<std::string> ids;
    fs::path sessionsDir = fs::path(m_projectRoot) / "reviews" / "sessions";

    m_persistence->flush();
    std::error_code ec;
    if (!fs::is_directory(sessionsDir, ec)) return ids;

    for (const auto& entry : fs::directory_iterator(sessionsDir, ec)) {
        if (entry.is_directory() && fs::exists(entry.path() / "events.ndjson")) {
            ids.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        std::cerr << "[ReviewEventStoreFs] Error listing " << sessionsDir << ": " << ec.message() << std::endl;
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace safetyreview::infrastructure::review
