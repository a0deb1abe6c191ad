/**
 * @file ArchitectureAnalysisService.cpp
 * @brief Implementation of ArchitectureAnalysisService.
 */

#include "application/ArchitectureAnalysisService.hpp"
#include "application/MergeEngine.hpp"
#include "domain/ImportanceScorer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace archlens::application {

ArchitectureAnalysisService::ArchitectureAnalysisService(std::shared_ptr<domain::InferenceService> service,
                                                         std::shared_ptr<domain::DiagnosticSink> sink,
                                                         Options options)
    : m_sink(sink ? std::move(sink) : std::make_shared<domain::NullDiagnosticSink>()),
      m_options(std::move(options)),
      m_dispatcher(std::move(service), m_sink, m_options.dispatch) {}

std::size_t ArchitectureAnalysisService::SelectionBudget(std::size_t corpusSize,
                                                         std::size_t minFiles,
                                                         std::size_t maxFiles,
                                                         double ratio) {
    const double scaled = std::floor(static_cast<double>(corpusSize) * std::max(0.0, ratio));
    const std::size_t proportional = static_cast<std::size_t>(scaled);
    return std::min(maxFiles, std::max(minFiles, proportional));
}

bool ArchitectureAnalysisService::LooksLikeTestSuite(const std::vector<domain::SourceFile>& files) {
    if (files.empty()) return false;
    std::size_t testLike = 0;
    for (const auto& file : files) {
        std::string path = file.path;
        std::transform(path.begin(), path.end(), path.begin(), [](unsigned char c) { return std::tolower(c); });
        if (path.find("test") != std::string::npos || path.find("spec") != std::string::npos ||
            path.find(".cy.") != std::string::npos || path.find("cypress") != std::string::npos) {
            ++testLike;
        }
    }
    return testLike * 2 > files.size();
}

domain::ArchitectureGraph ArchitectureAnalysisService::analyze(const std::vector<domain::SourceFile>& files) const {
    if (files.empty()) {
        m_sink->info("No files to analyze");
        return MergeEngine::Merge({}, files);
    }

    try {
        const std::size_t budget = SelectionBudget(files.size(), m_options.selectionMin, m_options.selectionMax,
                                                   m_options.selectionRatio);
        std::vector<domain::SourceFile> selected = domain::ImportanceScorer::SelectImportant(files, budget);
        if (selected.size() < files.size()) {
            m_sink->info("Selected " + std::to_string(selected.size()) + " of " + std::to_string(files.size()) +
                         " files for analysis");
        }

        const bool testSuite = LooksLikeTestSuite(selected);
        if (testSuite) {
            m_sink->info("Detected a test suite, using the test-suite prompt");
        }

        auto requests = ChunkDispatcher::Partition(selected, m_options.dispatch.chunkSize, files.size(), testSuite);
        m_sink->info("Processing " + std::to_string(selected.size()) + " files in " +
                     std::to_string(requests.size()) + " parallel chunks (" +
                     std::to_string(m_options.dispatch.chunkSize) + " files per chunk)");

        auto results = m_dispatcher.dispatch(requests);
        domain::ArchitectureGraph graph = MergeEngine::Merge(results, files);

        m_sink->info("Merged result: " + std::to_string(graph.modules.size()) + " modules, " +
                     std::to_string(graph.relationships.size()) + " relationships, pattern " +
                     domain::ToString(graph.pattern.name));
        return graph;
    } catch (const std::exception& e) {
        m_sink->error(std::string("Analysis failed, falling back to heuristics: ") + e.what());
    }
    return MergeEngine::Merge({}, files);
}

} // namespace archlens::application
