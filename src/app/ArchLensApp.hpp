/**
 * @file ArchLensApp.hpp
 * @brief Composition root wiring settings, the Ollama backend and the analysis pipeline.
 */

#pragma once

#include <memory>
#include <vector>

#include "application/ArchitectureAnalysisService.hpp"
#include "domain/ArchitectureGraph.hpp"
#include "domain/SourceFile.hpp"
#include "infrastructure/AnalysisSettings.hpp"
#include "infrastructure/ConsoleDiagnosticSink.hpp"
#include "infrastructure/OllamaInferenceAdapter.hpp"

namespace archlens::app {

/**
 * @class ArchLensApp
 * @brief Owns one configured pipeline. Embedders load settings, call Init() once, then
 *        hand corpora to Analyze().
 */
class ArchLensApp {
public:
    explicit ArchLensApp(infrastructure::AnalysisSettings settings);

    /**
     * @brief Checks the server and picks a model.
     * @return False when the server is unreachable; Analyze() still works and degrades to
     *         heuristic modules.
     */
    bool Init();

    domain::ArchitectureGraph Analyze(const std::vector<domain::SourceFile>& files) const;

    const infrastructure::AnalysisSettings& Settings() const { return m_settings; }

    /** @brief Maps settings.json values onto pipeline options. */
    static application::ArchitectureAnalysisService::Options MakeOptions(const infrastructure::AnalysisSettings& settings);

private:
    infrastructure::AnalysisSettings m_settings;
    std::shared_ptr<infrastructure::ConsoleDiagnosticSink> m_sink; ///< Shared with every chunk thread.
    std::shared_ptr<infrastructure::OllamaInferenceAdapter> m_inference;
    std::unique_ptr<application::ArchitectureAnalysisService> m_analysis;
};

} // namespace archlens::app
