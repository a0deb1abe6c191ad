/**
 * @file ArchLensApp.cpp
 * @brief Implementation of ArchLensApp.
 */

#include "app/ArchLensApp.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace archlens::app {

ArchLensApp::ArchLensApp(infrastructure::AnalysisSettings settings)
    : m_settings(std::move(settings)) {
    m_sink = std::make_shared<infrastructure::ConsoleDiagnosticSink>("ArchLens", m_settings.verbose);
    m_inference = std::make_shared<infrastructure::OllamaInferenceAdapter>(m_settings);
    m_analysis = std::make_unique<application::ArchitectureAnalysisService>(m_inference, m_sink, MakeOptions(m_settings));
}

bool ArchLensApp::Init() {
    if (!m_inference->checkHealth()) {
        m_sink->error("Ollama is not reachable at " + m_settings.host + ":" + std::to_string(m_settings.port));
        return false;
    }
    m_inference->initialize();
    m_sink->info("Using model " + m_inference->getCurrentModel());
    return true;
}

domain::ArchitectureGraph ArchLensApp::Analyze(const std::vector<domain::SourceFile>& files) const {
    return m_analysis->analyze(files);
}

application::ArchitectureAnalysisService::Options ArchLensApp::MakeOptions(const infrastructure::AnalysisSettings& settings) {
    application::ArchitectureAnalysisService::Options options;
    options.dispatch.chunkSize = settings.chunkSize;
    double seconds = settings.chunkTimeoutSeconds;
    if (!std::isfinite(seconds)) seconds = infrastructure::AnalysisSettings{}.chunkTimeoutSeconds;
    seconds = std::clamp(seconds, 0.0, infrastructure::AnalysisSettings::kMaxChunkTimeoutSeconds);
    const double millis = std::max(1.0, std::round(seconds * 1000.0));
    options.dispatch.attemptTimeout = std::chrono::milliseconds(static_cast<long long>(millis));
    options.selectionMin = settings.selectionMin;
    options.selectionMax = settings.selectionMax;
    options.selectionRatio = settings.selectionRatio;
    return options;
}

} // namespace archlens::app
