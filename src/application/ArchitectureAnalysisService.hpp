/**
 * @file ArchitectureAnalysisService.hpp
 * @brief Entry point of the extraction and recovery pipeline.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "application/ChunkDispatcher.hpp"
#include "domain/ArchitectureGraph.hpp"
#include "domain/DiagnosticSink.hpp"
#include "domain/InferenceService.hpp"
#include "domain/SourceFile.hpp"

namespace archlens::application {

/**
 * @class ArchitectureAnalysisService
 * @brief Wires scoring, chunk dispatch and merging into a single analyze() call.
 *
 * Large corpora are first down-selected to a budget of important files; only those are sent
 * to the inference service, but the returned graph still covers every input path.
 */
class ArchitectureAnalysisService {
public:
    struct Options {
        ChunkDispatcher::Options dispatch;
        std::size_t selectionMin = 5;
        std::size_t selectionMax = 10;
        double selectionRatio = 0.10;
    };

    ArchitectureAnalysisService(std::shared_ptr<domain::InferenceService> service,
                                std::shared_ptr<domain::DiagnosticSink> sink,
                                Options options);

    /**
     * @brief Analyzes @p files and returns the merged graph.
     *
     * Never throws: service failures end up as low recovery tiers in graph.chunks and as
     * heuristic modules. An empty input yields an empty graph with an Unknown pattern.
     */
    domain::ArchitectureGraph analyze(const std::vector<domain::SourceFile>& files) const;

    /** @brief min(max, max(min, floor(corpusSize * ratio))). */
    static std::size_t SelectionBudget(std::size_t corpusSize, std::size_t minFiles, std::size_t maxFiles, double ratio);

    /** @brief True when more than half of the paths look like test/spec/Cypress files. */
    static bool LooksLikeTestSuite(const std::vector<domain::SourceFile>& files);

private:
    std::shared_ptr<domain::DiagnosticSink> m_sink;
    Options m_options;
    ChunkDispatcher m_dispatcher;
};

} // namespace archlens::application
