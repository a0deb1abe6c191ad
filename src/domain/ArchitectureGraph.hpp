/**
 * @file ArchitectureGraph.hpp
 * @brief Per-chunk decoding results and the final merged architecture graph.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/ArchitectureModel.hpp"

namespace archlens::domain {

/**
 * @enum RecoveryTier
 * @brief How far down the decoding ladder a response had to go. Lower means more trust.
 */
enum class RecoveryTier {
    CleanParse = 0,     ///< Response parsed after fence/prose stripping only.
    BalancedRepair = 1, ///< Balanced object extracted and syntactically repaired.
    FieldSalvage = 2,   ///< Individual fields extracted and parsed in isolation.
    MinimalFallback = 3 ///< Nothing usable; records synthesized from paths.
};

/**
 * @enum RequestProtocol
 * @brief Request shape used against the inference service.
 */
enum class RequestProtocol {
    Chat,      ///< Structured system/user message exchange (primary).
    Completion ///< Single prompt completion (fallback).
};

inline const char* ToString(RecoveryTier tier) {
    switch (tier) {
        case RecoveryTier::CleanParse: return "clean";
        case RecoveryTier::BalancedRepair: return "repaired";
        case RecoveryTier::FieldSalvage: return "salvaged";
        case RecoveryTier::MinimalFallback: return "minimal";
    }
    return "minimal";
}

inline const char* ToString(RequestProtocol protocol) {
    return protocol == RequestProtocol::Chat ? "chat" : "completion";
}

/**
 * @struct RecoveryFragment
 * @brief Best-effort structured view of one chunk response, tagged with its recovery tier.
 */
struct RecoveryFragment {
    RecoveryTier tier = RecoveryTier::MinimalFallback;
    std::vector<ModuleRecord> modules;
    std::vector<RelationshipRecord> relationships;
    std::optional<PatternClassification> pattern;
    std::vector<LayerGroup> layers;
    std::string summary;
    std::vector<std::string> entryPoints;
    std::vector<std::string> coreComponents;
};

/**
 * @struct ChunkReport
 * @brief What happened to one chunk, kept on the graph so callers can warn users.
 */
struct ChunkReport {
    std::size_t chunkIndex = 0;
    RecoveryTier tier = RecoveryTier::MinimalFallback;
    std::optional<RequestProtocol> protocol; ///< Protocol that answered; empty if none did.
};

/**
 * @struct ArchitectureGraph
 * @brief Final result of one analysis. Holds exactly one module per input path.
 */
struct ArchitectureGraph {
    std::vector<ModuleRecord> modules;
    std::vector<RelationshipRecord> relationships;
    PatternClassification pattern;
    std::vector<LayerGroup> layers;
    std::string summary;
    std::vector<std::string> entryPoints;
    std::vector<std::string> coreComponents;
    std::vector<ChunkReport> chunks;

    const ModuleRecord* findModule(const std::string& path) const {
        for (const auto& module : modules) {
            if (module.path == path) return &module;
        }
        return nullptr;
    }

    bool hasRelationship(const std::string& from, const std::string& to) const {
        for (const auto& rel : relationships) {
            if (rel.from == from && rel.to == to) return true;
        }
        return false;
    }
};

} // namespace archlens::domain
