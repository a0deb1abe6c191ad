/**
 * @file ArchitectureModel.cpp
 * @brief String conversions for the architecture enums.
 */

#include "domain/ArchitectureModel.hpp"
#include <cctype>

namespace archlens::domain {

namespace {

std::string Lowered(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

} // namespace

std::string ToString(ModuleType type) {
    switch (type) {
        case ModuleType::Component: return "component";
        case ModuleType::Service: return "service";
        case ModuleType::Utility: return "utility";
        case ModuleType::Model: return "model";
        case ModuleType::Controller: return "controller";
        case ModuleType::View: return "view";
        case ModuleType::Config: return "config";
        case ModuleType::Test: return "test";
        case ModuleType::Other: return "other";
    }
    return "other";
}

std::string ToString(ArchitectureLayer layer) {
    switch (layer) {
        case ArchitectureLayer::Presentation: return "presentation";
        case ArchitectureLayer::Business: return "business";
        case ArchitectureLayer::Data: return "data";
        case ArchitectureLayer::Infrastructure: return "infrastructure";
        case ArchitectureLayer::Other: return "other";
    }
    return "other";
}

std::string ToString(RelationshipType type) {
    switch (type) {
        case RelationshipType::Imports: return "imports";
        case RelationshipType::Extends: return "extends";
        case RelationshipType::Implements: return "implements";
        case RelationshipType::Uses: return "uses";
        case RelationshipType::Calls: return "calls";
        case RelationshipType::Depends: return "depends";
        case RelationshipType::Aggregates: return "aggregates";
        case RelationshipType::Composes: return "composes";
    }
    return "depends";
}

std::string ToString(RelationshipStrength strength) {
    switch (strength) {
        case RelationshipStrength::Weak: return "weak";
        case RelationshipStrength::Medium: return "medium";
        case RelationshipStrength::Strong: return "strong";
    }
    return "medium";
}

std::string ToString(PatternName name) {
    switch (name) {
        case PatternName::MVC: return "MVC";
        case PatternName::Layered: return "Layered";
        case PatternName::Microservices: return "Microservices";
        case PatternName::EventDriven: return "Event-Driven";
        case PatternName::ClientServer: return "Client-Server";
        case PatternName::Monolithic: return "Monolithic";
        case PatternName::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::optional<ModuleType> ParseModuleType(const std::string& text) {
    const std::string token = Lowered(text);
    if (token == "component") return ModuleType::Component;
    if (token == "service") return ModuleType::Service;
    if (token == "utility" || token == "util") return ModuleType::Utility;
    if (token == "model") return ModuleType::Model;
    if (token == "controller") return ModuleType::Controller;
    if (token == "view") return ModuleType::View;
    if (token == "config") return ModuleType::Config;
    if (token == "test") return ModuleType::Test;
    if (token == "other") return ModuleType::Other;
    return std::nullopt;
}

std::optional<ArchitectureLayer> ParseLayer(const std::string& text) {
    const std::string token = Lowered(text);
    if (token == "presentation") return ArchitectureLayer::Presentation;
    if (token == "business") return ArchitectureLayer::Business;
    if (token == "data") return ArchitectureLayer::Data;
    if (token == "infrastructure") return ArchitectureLayer::Infrastructure;
    if (token == "other") return ArchitectureLayer::Other;
    return std::nullopt;
}

std::optional<RelationshipType> ParseRelationshipType(const std::string& text) {
    const std::string token = Lowered(text);
    if (token == "imports") return RelationshipType::Imports;
    if (token == "extends") return RelationshipType::Extends;
    if (token == "implements") return RelationshipType::Implements;
    if (token == "uses") return RelationshipType::Uses;
    if (token == "calls") return RelationshipType::Calls;
    if (token == "depends") return RelationshipType::Depends;
    if (token == "aggregates") return RelationshipType::Aggregates;
    if (token == "composes") return RelationshipType::Composes;
    return std::nullopt;
}

std::optional<RelationshipStrength> ParseStrength(const std::string& text) {
    const std::string token = Lowered(text);
    if (token == "weak") return RelationshipStrength::Weak;
    if (token == "medium") return RelationshipStrength::Medium;
    if (token == "strong") return RelationshipStrength::Strong;
    return std::nullopt;
}

std::optional<PatternName> ParsePatternName(const std::string& text) {
    const std::string token = Lowered(text);
    if (token == "mvc") return PatternName::MVC;
    if (token == "layered") return PatternName::Layered;
    if (token == "microservices") return PatternName::Microservices;
    if (token == "event-driven") return PatternName::EventDriven;
    if (token == "client-server") return PatternName::ClientServer;
    if (token == "monolithic") return PatternName::Monolithic;
    if (token == "unknown") return PatternName::Unknown;
    return std::nullopt;
}

} // namespace archlens::domain
