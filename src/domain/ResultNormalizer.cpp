/**
 * @file ResultNormalizer.cpp
 * @brief Implementation of the ResultNormalizer heuristics.
 */

#include "domain/ResultNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iterator>
#include <sstream>

namespace archlens::domain {

namespace {

constexpr size_t kDescriptionLines = 10;
constexpr size_t kDescriptionMaxChars = 100;

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace

ModuleType ResultNormalizer::InferModuleType(const std::string& path) {
    const std::string lower = ToLower(path);
    if (Contains(lower, "test")) return ModuleType::Test;
    if (Contains(lower, "controller")) return ModuleType::Controller;
    if (Contains(lower, "service")) return ModuleType::Service;
    if (Contains(lower, "model")) return ModuleType::Model;
    if (Contains(lower, "view") || Contains(lower, "component")) return ModuleType::View;
    if (Contains(lower, "util")) return ModuleType::Utility;
    if (Contains(lower, "config")) return ModuleType::Config;
    return ModuleType::Other;
}

ArchitectureLayer ResultNormalizer::InferLayer(const std::string& path) {
    const std::string lower = ToLower(path);
    if (Contains(lower, "view") || Contains(lower, "component") || Contains(lower, "page") || Contains(lower, "ui")) {
        return ArchitectureLayer::Presentation;
    }
    if (Contains(lower, "service") || Contains(lower, "business") || Contains(lower, "logic")) {
        return ArchitectureLayer::Business;
    }
    if (Contains(lower, "model") || Contains(lower, "data") || Contains(lower, "db") || Contains(lower, "database")) {
        return ArchitectureLayer::Data;
    }
    if (Contains(lower, "config") || Contains(lower, "infra")) {
        return ArchitectureLayer::Infrastructure;
    }
    return ArchitectureLayer::Other;
}

std::string ResultNormalizer::InferDescription(const std::string& content) {
    std::istringstream ss(content);
    std::string line;
    for (size_t i = 0; i < kDescriptionLines && std::getline(ss, line); ++i) {
        size_t best = std::string::npos;
        size_t markerLength = 0;
        for (const char* marker : {"//", "#", "<!--"}) {
            size_t pos = line.find(marker);
            if (pos != std::string::npos && (best == std::string::npos || pos < best)) {
                best = pos;
                markerLength = std::char_traits<char>::length(marker);
            }
        }
        if (best == std::string::npos) continue;

        std::string text = line.substr(best + markerLength);
        size_t closer = text.rfind("-->");
        if (closer != std::string::npos) text.erase(closer);
        text = Trim(text);
        if (text.empty()) continue;
        if (text.size() > kDescriptionMaxChars) text.resize(kDescriptionMaxChars);
        return text;
    }
    return "";
}

std::string ResultNormalizer::ModuleNameFromPath(const std::string& path) {
    std::string base = path;
    size_t slash = base.find_last_of('/');
    if (slash != std::string::npos) base = base.substr(slash + 1);
    size_t dot = base.find_last_of('.');
    if (dot != std::string::npos && dot > 0) base = base.substr(0, dot);
    return base.empty() ? path : base;
}

ModuleRecord ResultNormalizer::SynthesizeModule(const SourceFile& file) {
    ModuleRecord module = SynthesizeModule(file.path);
    module.description = InferDescription(file.content);
    return module;
}

ModuleRecord ResultNormalizer::SynthesizeModule(const std::string& path) {
    ModuleRecord module;
    module.name = ModuleNameFromPath(path);
    module.path = path;
    module.type = InferModuleType(path);
    module.layer = InferLayer(path);
    return module;
}

PatternClassification ResultNormalizer::ClassifyPattern(const std::vector<ModuleRecord>& modules,
                                                        const std::vector<RelationshipRecord>& relationships) {
    bool hasControllers = false;
    bool hasViews = false;
    bool hasModels = false;
    bool hasServices = false;
    bool hasLayers = false;
    bool hasComponents = false;
    bool hasRoutes = false;
    bool hasFlask = false;
    bool hasReact = false;
    bool hasNext = false;

    for (const auto& m : modules) {
        const std::string path = ToLower(m.path);
        const std::string name = ToLower(m.name);

        if (m.type == ModuleType::Controller || Contains(path, "controller") || Contains(name, "controller")) {
            hasControllers = true;
        }
        if (m.type == ModuleType::View || Contains(path, "view") || Contains(name, "view") || Contains(path, "component")) {
            hasViews = true;
        }
        if (m.type == ModuleType::Model || Contains(path, "model") || Contains(name, "model")) {
            hasModels = true;
        }
        if (m.type == ModuleType::Service || Contains(path, "service") || Contains(name, "service")) {
            hasServices = true;
        }
        if (m.type == ModuleType::Component || Contains(path, "component")) {
            hasComponents = true;
        }
        if (Contains(path, "route") || Contains(path, "api/")) {
            hasRoutes = true;
        }
        if (m.layer != ArchitectureLayer::Other) {
            hasLayers = true;
        }
        if (Contains(path, "flask") || Contains(path, "app.py") || Contains(path, "main.py")) {
            hasFlask = true;
        }
        if (Contains(path, "react") || Contains(path, ".jsx") || Contains(path, ".tsx")) {
            hasReact = true;
        }
        if (Contains(path, "next") || Contains(path, "pages") || Contains(path, "app/")) {
            hasNext = true;
        }
    }

    if (hasControllers && hasViews && hasModels) {
        return {PatternName::MVC, 0.85,
                "Detected Model-View-Controller pattern with clear separation of concerns"};
    }
    if (hasLayers || (hasServices && hasModels && hasViews)) {
        return {PatternName::Layered, 0.75,
                "Detected layered architecture with separation of concerns across multiple layers"};
    }
    if (hasNext || (hasReact && hasComponents)) {
        return {PatternName::Layered, 0.7,
                "Detected component-based architecture typical of React/Next.js applications"};
    }
    if (hasFlask && hasRoutes) {
        return {PatternName::Layered, 0.7,
                "Detected Flask-based web application with layered structure"};
    }
    if (hasServices && modules.size() > 5 &&
        static_cast<double>(relationships.size()) > static_cast<double>(modules.size()) * 0.5) {
        return {PatternName::Microservices, 0.6,
                "Detected potential microservices architecture with multiple service modules"};
    }
    if (modules.size() > 3 && (hasServices || hasModels || hasViews)) {
        return {PatternName::Layered, 0.6,
                "Detected layered architecture based on module types and structure"};
    }
    return {PatternName::Unknown, 0.3,
            "Could not confidently determine architectural pattern from available information"};
}

PatternName ResultNormalizer::CanonicalPatternName(const std::string& text) {
    if (auto exact = ParsePatternName(text)) {
        return *exact;
    }
    const std::string normalized = ToLower(text);
    if (Contains(normalized, "mvc") || Contains(normalized, "model-view-controller")) return PatternName::MVC;
    if (Contains(normalized, "layered") || Contains(normalized, "tier")) return PatternName::Layered;
    if (Contains(normalized, "microservice")) return PatternName::Microservices;
    if (Contains(normalized, "monolith")) return PatternName::Monolithic;
    if (Contains(normalized, "event")) return PatternName::EventDriven;
    if (Contains(normalized, "client-server") || Contains(normalized, "client/server")) return PatternName::ClientServer;
    if (Contains(normalized, "modular") || Contains(normalized, "component")) return PatternName::Layered;
    return PatternName::Unknown;
}

std::vector<LayerGroup> ResultNormalizer::GroupByLayers(const std::vector<ModuleRecord>& modules) {
    std::vector<LayerGroup> groups;
    for (const auto& m : modules) {
        std::string name = ToString(m.layer);
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));

        auto it = std::find_if(groups.begin(), groups.end(), [&name](const LayerGroup& g) { return g.name == name; });
        if (it == groups.end()) {
            groups.push_back({name, {}});
            it = std::prev(groups.end());
        }
        if (std::find(it->modules.begin(), it->modules.end(), m.path) == it->modules.end()) {
            it->modules.push_back(m.path);
        }
    }
    return groups;
}

} // namespace archlens::domain
