/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving review configuration (settings.json).
 *
 * Provides a unified way to access settings like the default review length
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>

namespace safetyreview::infrastructure {

/**
 * @struct ReviewSettings
 * @brief Values read from the "review_default_days" and "version_prefix" keys.
 */
struct ReviewSettings {
    int defaultReviewDays = 14;    ///< Due date offset for new reviews.
    std::string versionPrefix = "v"; ///< Approved versions are named <prefix><n>.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the project root.
     * @param projectRoot Absolute path to the project root.
     * @return Defaults for every missing, mistyped or unreadable key.
     */
    static ReviewSettings LoadReviewSettings(const std::string& projectRoot);

    /**
     * @brief Writes the review keys to settings.json, preserving other keys if possible.
     * @return false if the file could not be written.
     */
    static bool SaveReviewSettings(const std::string& projectRoot, const ReviewSettings& settings);
};

} // namespace safetyreview::infrastructure
