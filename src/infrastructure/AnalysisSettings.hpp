/**
 * @file AnalysisSettings.hpp
 * @brief Tunables for one analysis run and for the inference connection.
 */

#pragma once
#include <cstddef>
#include <string>

namespace archlens::infrastructure {

/**
 * @struct AnalysisSettings
 * @brief Values read from settings.json. Defaults match a local Ollama install.
 */
struct AnalysisSettings {
    static constexpr double kMaxChunkTimeoutSeconds = 3600.0;
    static constexpr std::size_t kMaxCount = 100000;

    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5-coder:7b";

    std::size_t chunkSize = 5;              ///< Files per inference request.
    double chunkTimeoutSeconds = 60.0;      ///< Per-attempt limit; a slower attempt counts as failed.
    std::size_t selectionMin = 5;           ///< Lower bound of the down-selection budget.
    std::size_t selectionMax = 10;          ///< Upper bound of the down-selection budget.
    double selectionRatio = 0.10;           ///< Share of the corpus kept before clamping.

    bool verbose = true;                    ///< Print progress lines, not only errors.
};

} // namespace archlens::infrastructure
