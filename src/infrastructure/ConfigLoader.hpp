/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving analysis configuration (settings.json).
 *
 * Keeps JSON parsing of the settings file in one place.
 */

#pragma once

#include <filesystem>
#include "infrastructure/AnalysisSettings.hpp"

namespace archlens::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param configPath File to read.
     * @return Defaults when the file is missing or unreadable; keys with the wrong type keep
     *         their default individually.
     */
    static AnalysisSettings Load(const std::filesystem::path& configPath);

    /** @brief Reads from PathUtils::GetDefaultSettingsPath(). */
    static AnalysisSettings LoadDefault();

    /**
     * @brief Writes @p settings, preserving keys this version does not know about.
     * @return false if the file could not be written.
     */
    static bool Save(const std::filesystem::path& configPath, const AnalysisSettings& settings);
};

} // namespace archlens::infrastructure
