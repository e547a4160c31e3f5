/**
 * @file VersionHistoryRepositoryFs.cpp
 * @brief Implementation of VersionHistoryRepositoryFs.
 */

#include "infrastructure/review/VersionHistoryRepositoryFs.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "infrastructure/review/ReviewJsonCodec.hpp"

namespace safetyreview::infrastructure::review {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool readJsonFile(const fs::path& path, json& out) {
    std::ifstream in(path);
    if (!in) return false;
    try {
        in >> out;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[VersionHistoryRepositoryFs] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace

VersionHistoryRepositoryFs::VersionHistoryRepositoryFs(std::string projectRoot,
                                                       std::shared_ptr<PersistenceService> persistence)
    : m_projectRoot(std::move(projectRoot)), m_persistence(std::move(persistence)) {}

std::string VersionHistoryRepositoryFs::versionsDir() const {
    return (fs::path(m_projectRoot) / "reviews" / "versions").string();
}

void VersionHistoryRepositoryFs::append(const ApprovedVersion& version) {
    fs::path dir = versionsDir();
    fs::path indexPath = dir / "index.json";

    m_persistence->flush();
    json index = json::array();
    if (fs::exists(indexPath) && !readJsonFile(indexPath, index)) {
        throw std::runtime_error("Version index is unreadable: " + indexPath.string());
    }

    index.push_back({
        {"label", version.label},
        {"sessionId", version.sessionId},
        {"approver", version.approver},
        {"ts", codec::ToMillis(version.timestamp)}
    });

    // Snapshot first so the index never names a missing document.
    m_persistence->saveTextAsync((dir / (version.label + ".json")).string(),
                                 codec::ToJson(version.snapshot).dump(2));
    m_persistence->saveTextAsync(indexPath.string(), index.dump(2));
}

std::vector<ApprovedVersion> VersionHistoryRepositoryFs::loadAll() {
    std::vector<ApprovedVersion> versions;
    fs::path dir = versionsDir();
    fs::path indexPath = dir / "index.json";

    m_persistence->flush();
    json index;
    if (!fs::exists(indexPath) || !readJsonFile(indexPath, index)) {
        return versions;
    }

    for (const auto& entry : index) {
        std::string label = entry.value("label", "");
        json snapshotJson;
        // A gap would make the next approval reuse an existing label.
        if (label.empty() || !readJsonFile(dir / (label + ".json"), snapshotJson)) {
            throw std::runtime_error("Missing snapshot for version '" + label + "' in " + indexPath.string());
        }

        try {
            versions.push_back(ApprovedVersion{
                label,
                codec::SnapshotFromJson(snapshotJson),
                entry.value("sessionId", ""),
                entry.value("approver", ""),
                codec::FromMillis(entry.value("ts", 0LL))
            });
        } catch (const json::exception& e) {
            throw std::runtime_error("Malformed snapshot for version '" + label + "': " + e.what());
        }
    }
    return versions;
}

} // namespace safetyreview::infrastructure::review
