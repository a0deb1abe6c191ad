/**
 * @file ArchitectureModel.hpp
 * @brief Records that make up an inferred architecture: modules, relationships, layers, pattern.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace archlens::domain {

/**
 * @enum ModuleType
 * @brief Architectural role of a single file.
 */
enum class ModuleType {
    Component,
    Service,
    Utility,
    Model,
    Controller,
    View,
    Config,
    Test,
    Other
};

/**
 * @enum ArchitectureLayer
 * @brief Logical layer a module belongs to.
 */
enum class ArchitectureLayer {
    Presentation,
    Business,
    Data,
    Infrastructure,
    Other
};

enum class RelationshipType {
    Imports,
    Extends,
    Implements,
    Uses,
    Calls,
    Depends,
    Aggregates,
    Composes
};

enum class RelationshipStrength {
    Weak,
    Medium,
    Strong
};

/**
 * @enum PatternName
 * @brief Closed set of architectural styles the pipeline can report.
 */
enum class PatternName {
    MVC,
    Layered,
    Microservices,
    EventDriven,
    ClientServer,
    Monolithic,
    Unknown
};

/**
 * @struct ModuleRecord
 * @brief One file as seen by the architecture graph. `path` is the identity.
 */
struct ModuleRecord {
    std::string name;
    std::string path;
    ModuleType type = ModuleType::Other;
    ArchitectureLayer layer = ArchitectureLayer::Other;
    std::string description;
    std::vector<std::string> exports;
    std::vector<std::string> imports;
};

/**
 * @struct RelationshipRecord
 * @brief Directed edge between two module paths. `(from, to)` is the identity.
 */
struct RelationshipRecord {
    std::string from;
    std::string to;
    RelationshipType type = RelationshipType::Depends;
    RelationshipStrength strength = RelationshipStrength::Medium;
    std::string description;

    std::string key() const { return from + "->" + to; }
};

struct PatternClassification {
    PatternName name = PatternName::Unknown;
    double confidence = 0.0; ///< Always within [0, 1].
    std::string description;
};

struct LayerGroup {
    std::string name;
    std::vector<std::string> modules; ///< Module paths, duplicate-free, insertion ordered.
};

/** @brief Lower-case wire names ("service", "presentation", "imports", ...). */
std::string ToString(ModuleType type);
std::string ToString(ArchitectureLayer layer);
std::string ToString(RelationshipType type);
std::string ToString(RelationshipStrength strength);
/** @brief Display names ("MVC", "Event-Driven", ...). */
std::string ToString(PatternName name);

/**
 * @brief Case-insensitive parsers for service-provided values.
 * @return std::nullopt when the text names no known value.
 */
std::optional<ModuleType> ParseModuleType(const std::string& text);
std::optional<ArchitectureLayer> ParseLayer(const std::string& text);
std::optional<RelationshipType> ParseRelationshipType(const std::string& text);
std::optional<RelationshipStrength> ParseStrength(const std::string& text);
std::optional<PatternName> ParsePatternName(const std::string& text);

} // namespace archlens::domain
