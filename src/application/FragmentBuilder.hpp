/**
 * @file FragmentBuilder.hpp
 * @brief Turns a parsed (but unvalidated) chunk response into domain records.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/ArchitectureGraph.hpp"
#include "domain/SourceFile.hpp"

namespace archlens::application {

/**
 * @class FragmentBuilder
 * @brief Schema-tolerant mapping from JSON values to RecoveryFragment fields.
 *
 * Nothing in the input is trusted: every field is type-checked, unknown enum values fall
 * back to path heuristics, and entries that cannot name their endpoints are dropped.
 * None of the methods throw for malformed input.
 */
class FragmentBuilder {
public:
    /** @brief True if @p doc is an object carrying at least one architecture field. */
    static bool HasRecognizedField(const nlohmann::json& doc);

    /**
     * @brief Normalizes a "modules" array.
     *
     * String entries become synthesized modules. A module without a path borrows the path of
     * a batch file containing its name; unknown type/layer values are inferred from the path.
     */
    static std::vector<domain::ModuleRecord> BuildModules(const nlohmann::json& value,
                                                          const std::vector<domain::SourceFile>& batch);

    /**
     * @brief Normalizes a "relationships" array.
     *
     * Accepts from/to, source/target and parentModule/childModule(s) spellings. A
     * childModules list fans out into one "uses" edge per child.
     */
    static std::vector<domain::RelationshipRecord> BuildRelationships(const nlohmann::json& value);

    /**
     * @brief Normalizes the "pattern" field.
     *
     * Null falls back to classification from @p modules. A bare string gets confidence 0.8
     * when it names a known style, 0.5 otherwise; an object without a usable confidence gets
     * 0.7 or 0.3 the same way. Results are clamped to [0, 1].
     */
    static domain::PatternClassification BuildPattern(const nlohmann::json& value,
                                                      const std::vector<domain::ModuleRecord>& modules,
                                                      const std::vector<domain::RelationshipRecord>& relationships);

    /**
     * @brief Normalizes the "layers" field. Layers listed without members are filled from
     *        modules whose layer matches the layer name; a missing field groups @p modules.
     */
    static std::vector<domain::LayerGroup> BuildLayers(const nlohmann::json& value,
                                                       const std::vector<domain::ModuleRecord>& modules);

    /** @brief Non-empty strings of a JSON array, in order. */
    static std::vector<std::string> BuildStringList(const nlohmann::json& value);

    /**
     * @brief Builds a full fragment from a parsed document.
     * When no module survives normalization every batch file is synthesized instead.
     */
    static domain::RecoveryFragment Build(const nlohmann::json& doc,
                                          const std::vector<domain::SourceFile>& batch,
                                          domain::RecoveryTier tier);
};

} // namespace archlens::application
