/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace archlens::infrastructure {

namespace {

// Values outside [low, high] are ignored, so later conversions to int or milliseconds stay in range.
template <typename T>
void ReadNumber(const nlohmann::json& j, const char* key, T& target, double low, double high) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a number" << std::endl;
        return;
    }
    const double value = it->get<double>();
    if (!std::isfinite(value) || value < low || value > high) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << value << " is outside [" << low << ", "
                  << high << "]" << std::endl;
        return;
    }
    target = static_cast<T>(value);
}

void ReadPort(const nlohmann::json& j, const char* key, int& target) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected an integer" << std::endl;
        return;
    }
    ReadNumber(j, key, target, 1, 65535);
}

void ReadString(const nlohmann::json& j, const char* key, std::string& target) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a string" << std::endl;
        return;
    }
    target = it->get<std::string>();
}

void ReadCount(const nlohmann::json& j, const char* key, std::size_t& target) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a positive integer" << std::endl;
        return;
    }
    ReadNumber(j, key, target, 1, static_cast<double>(AnalysisSettings::kMaxCount));
}

} // namespace

AnalysisSettings ConfigLoader::Load(const std::filesystem::path& configPath) {
    AnalysisSettings settings;
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object, using defaults" << std::endl;
            return settings;
        }

        ReadString(j, "host", settings.host);
        ReadPort(j, "port", settings.port);
        ReadString(j, "model", settings.model);
        ReadCount(j, "chunk_size", settings.chunkSize);
        ReadNumber(j, "chunk_timeout_seconds", settings.chunkTimeoutSeconds, 0.001,
                   AnalysisSettings::kMaxChunkTimeoutSeconds);
        ReadCount(j, "selection_min", settings.selectionMin);
        ReadCount(j, "selection_max", settings.selectionMax);
        ReadNumber(j, "selection_ratio", settings.selectionRatio, 0.0, 1.0);

        auto verbose = j.find("verbose");
        if (verbose != j.end() && verbose->is_boolean()) {
            settings.verbose = verbose->get<bool>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return AnalysisSettings{};
    }

    if (settings.selectionMax < settings.selectionMin) {
        std::cerr << "[ConfigLoader] selection_max below selection_min, raising it" << std::endl;
        settings.selectionMax = settings.selectionMin;
    }
    return settings;
}

AnalysisSettings ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetDefaultSettingsPath());
}

bool ConfigLoader::Save(const std::filesystem::path& configPath, const AnalysisSettings& settings) {
    nlohmann::json j = nlohmann::json::object();

    // Keep keys written by newer versions or by hand.
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json unreadable, rewriting: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["host"] = settings.host;
    j["port"] = settings.port;
    j["model"] = settings.model;
    j["chunk_size"] = settings.chunkSize;
    j["chunk_timeout_seconds"] = settings.chunkTimeoutSeconds;
    j["selection_min"] = settings.selectionMin;
    j["selection_max"] = settings.selectionMax;
    j["selection_ratio"] = settings.selectionRatio;
    j["verbose"] = settings.verbose;

    try {
        if (configPath.has_parent_path()) {
            std::filesystem::create_directories(configPath.parent_path());
        }
        std::ofstream f(configPath);
        if (!f) {
            std::cerr << "[ConfigLoader] Cannot open " << configPath << " for writing" << std::endl;
            return false;
        }
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
        return false;
    }
}

} // namespace archlens::infrastructure
