/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace safetyreview::infrastructure {

ReviewSettings ConfigLoader::LoadReviewSettings(const std::string& projectRoot) {
    ReviewSettings settings;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("review_default_days") && j["review_default_days"].is_number_integer()) {
            int days = j["review_default_days"].get<int>();
            if (days > 0) {
                settings.defaultReviewDays = days;
            } else {
                std::cerr << "[ConfigLoader] Ignoring non-positive review_default_days: " << days << std::endl;
            }
        }
        if (j.contains("version_prefix") && j["version_prefix"].is_string()) {
            settings.versionPrefix = j["version_prefix"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return settings;
}

bool ConfigLoader::SaveReviewSettings(const std::string& projectRoot, const ReviewSettings& settings) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json is corrupt, rewriting it: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    if (!j.is_object()) {
        j = nlohmann::json::object();
    }
    j["review_default_days"] = settings.defaultReviewDays;
    j["version_prefix"] = settings.versionPrefix;

    std::ofstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing settings.json at " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace safetyreview::infrastructure
