/**
 * @file ResultNormalizer.hpp
 * @brief Path/name heuristics that fill in what the inference service left out.
 */

#pragma once

#include "domain/ArchitectureModel.hpp"
#include "domain/SourceFile.hpp"
#include <string>
#include <vector>

namespace archlens::domain {

/**
 * @class ResultNormalizer
 * @brief Deterministic classifiers for module type, layer, description and overall pattern.
 *
 * All checks are ordered and the first match wins; reordering them changes results for
 * paths that contain more than one keyword (e.g. "services/user_view.ts").
 */
class ResultNormalizer {
public:
    /** @brief Ordered substring checks: test, controller, service, model, view/component, util, config. */
    static ModuleType InferModuleType(const std::string& path);

    /** @brief Ordered substring checks: presentation, business, data, infrastructure. */
    static ArchitectureLayer InferLayer(const std::string& path);

    /**
     * @brief Pulls the first line comment ("//", "#", "<!--") out of the first ten lines.
     * @return At most 100 characters, or an empty string.
     */
    static std::string InferDescription(const std::string& content);

    /** @brief File name without directory and extension ("src/app.ts" -> "app"). */
    static std::string ModuleNameFromPath(const std::string& path);

    /** @brief Builds a complete record for a file using only heuristics. */
    static ModuleRecord SynthesizeModule(const SourceFile& file);

    /** @brief Same as SynthesizeModule when only a path is known. */
    static ModuleRecord SynthesizeModule(const std::string& path);

    /**
     * @brief Infers the architectural pattern from aggregate module signals.
     *
     * Rule order: MVC (0.85), Layered by layer diversity or service+model+view (0.75),
     * component-based front end (0.7), Flask-style web app (0.7), Microservices (0.6),
     * generic Layered (0.6), Unknown (0.3).
     */
    static PatternClassification ClassifyPattern(const std::vector<ModuleRecord>& modules,
                                                 const std::vector<RelationshipRecord>& relationships);

    /**
     * @brief Maps a free-form style name ("model-view-controller", "3-tier", "modular")
     *        onto the closed pattern set.
     */
    static PatternName CanonicalPatternName(const std::string& text);

    /** @brief Groups module paths by their layer; group names are capitalized layer names. */
    static std::vector<LayerGroup> GroupByLayers(const std::vector<ModuleRecord>& modules);
};

} // namespace archlens::domain
