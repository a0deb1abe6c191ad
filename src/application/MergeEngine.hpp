/**
 * @file MergeEngine.hpp
 * @brief Combines per-chunk fragments into one consistent ArchitectureGraph.
 */

#pragma once

#include <string>
#include <vector>

#include "application/ChunkDispatcher.hpp"
#include "domain/ArchitectureGraph.hpp"
#include "domain/SourceFile.hpp"

namespace archlens::application {

/**
 * @class MergeEngine
 * @brief Deterministic fan-in of chunk results.
 *
 * Results are visited in chunk-index order whatever order they arrive in, so the graph does
 * not depend on which chunk finished first.
 *
 * - Modules are keyed by path, relationships by (from, to); the first chunk to mention a key
 *   wins.
 * - Import edges resolved over the whole corpus are added for pairs no chunk reported.
 * - Every corpus file that no chunk described is backfilled from path heuristics.
 */
class MergeEngine {
public:
    /**
     * @param results Chunk results in any order.
     * @param corpus Every file of the analysis, including files that were not selected.
     */
    static domain::ArchitectureGraph Merge(const std::vector<ChunkResult>& results,
                                           const std::vector<domain::SourceFile>& corpus);

    /** @brief "imports" edges (strength medium) for every resolvable import, without self-edges. */
    static std::vector<domain::RelationshipRecord> ImportEdges(const std::vector<domain::SourceFile>& corpus);

    /** @brief Case-folded, trimmed layer name used as the layer identity. */
    static std::string LayerKey(const std::string& name);
};

} // namespace archlens::application
