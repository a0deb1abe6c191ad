/**
 * @file MergeEngine.cpp
 * @brief Implementation of MergeEngine.
 */

#include "application/MergeEngine.hpp"
#include "domain/ImportResolver.hpp"
#include "domain/ResultNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace archlens::application {

using domain::ArchitectureGraph;
using domain::LayerGroup;
using domain::PatternName;
using domain::RelationshipRecord;

namespace {

void AppendUnique(std::vector<std::string>& list, std::unordered_set<std::string>& seen, const std::string& value) {
    if (value.empty()) return;
    if (seen.insert(value).second) list.push_back(value);
}

class LayerIndex {
public:
    void add(const std::string& displayName, const std::string& modulePath) {
        const std::string key = MergeEngine::LayerKey(displayName);
        if (key.empty()) return;

        auto it = m_positions.find(key);
        if (it == m_positions.end()) {
            it = m_positions.emplace(key, m_groups.size()).first;
            m_groups.push_back({displayName, {}});
            m_members.emplace_back();
        }
        if (!modulePath.empty() && m_members[it->second].insert(modulePath).second) {
            m_groups[it->second].modules.push_back(modulePath);
        }
    }

    std::vector<LayerGroup> release() { return std::move(m_groups); }

private:
    std::vector<LayerGroup> m_groups;
    std::vector<std::unordered_set<std::string>> m_members;
    std::unordered_map<std::string, size_t> m_positions;
};

std::string DisplayName(domain::ArchitectureLayer layer) {
    std::string name = domain::ToString(layer);
    name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

} // namespace

std::string MergeEngine::LayerKey(const std::string& name) {
    const char* ws = " \t\r\n";
    size_t start = name.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = name.find_last_not_of(ws);
    std::string key = name.substr(start, end - start + 1);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
    return key;
}

std::vector<RelationshipRecord> MergeEngine::ImportEdges(const std::vector<domain::SourceFile>& corpus) {
    std::vector<RelationshipRecord> edges;
    std::unordered_set<std::string> seen;
    for (const auto& file : corpus) {
        for (const auto& literal : domain::ImportResolver::ExtractImports(file.content)) {
            auto target = domain::ImportResolver::Resolve(literal, file.path, corpus);
            if (!target || *target == file.path) continue;

            RelationshipRecord edge{file.path, *target, domain::RelationshipType::Imports,
                                    domain::RelationshipStrength::Medium, "Imports " + literal};
            if (seen.insert(edge.key()).second) {
                edges.push_back(std::move(edge));
            }
        }
    }
    return edges;
}

ArchitectureGraph MergeEngine::Merge(const std::vector<ChunkResult>& results,
                                     const std::vector<domain::SourceFile>& corpus) {
    std::vector<const ChunkResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& result : results) ordered.push_back(&result);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ChunkResult* a, const ChunkResult* b) { return a->index < b->index; });

    ArchitectureGraph graph;
    std::unordered_set<std::string> modulePaths;
    std::unordered_set<std::string> relationshipKeys;
    std::unordered_set<std::string> entryPoints;
    std::unordered_set<std::string> coreComponents;
    LayerIndex layers;
    std::vector<std::string> summaries;
    const domain::PatternClassification* best = nullptr;

    for (const ChunkResult* result : ordered) {
        const domain::RecoveryFragment& fragment = result->fragment;
        graph.chunks.push_back({result->index, fragment.tier, result->protocol});

        for (const auto& module : fragment.modules) {
            if (module.path.empty() || !modulePaths.insert(module.path).second) continue;
            graph.modules.push_back(module);
        }
        for (const auto& rel : fragment.relationships) {
            if (rel.from.empty() || rel.to.empty() || !relationshipKeys.insert(rel.key()).second) continue;
            graph.relationships.push_back(rel);
        }
        for (const auto& layer : fragment.layers) {
            layers.add(layer.name, "");
            for (const auto& path : layer.modules) {
                layers.add(layer.name, path);
            }
        }
        if (fragment.pattern && fragment.pattern->name != PatternName::Unknown &&
            (!best || fragment.pattern->confidence > best->confidence)) {
            best = &*fragment.pattern;
        }
        if (!fragment.summary.empty()) summaries.push_back(fragment.summary);
        for (const auto& path : fragment.entryPoints) AppendUnique(graph.entryPoints, entryPoints, path);
        for (const auto& path : fragment.coreComponents) AppendUnique(graph.coreComponents, coreComponents, path);
    }

    for (auto& edge : ImportEdges(corpus)) {
        if (relationshipKeys.insert(edge.key()).second) {
            graph.relationships.push_back(std::move(edge));
        }
    }

    for (const auto& file : corpus) {
        if (modulePaths.count(file.path)) continue;
        modulePaths.insert(file.path);
        graph.modules.push_back(domain::ResultNormalizer::SynthesizeModule(file));
        layers.add(DisplayName(graph.modules.back().layer), file.path);
    }
    graph.layers = layers.release();

    if (best) {
        graph.pattern = *best;
    } else {
        graph.pattern = {PatternName::Unknown, 0.0, "Could not determine pattern"};
    }

    if (summaries.empty()) {
        graph.summary = "Analyzed " + std::to_string(corpus.size()) + " files across " +
                        std::to_string(results.size()) + " chunks";
    } else {
        for (size_t i = 0; i < summaries.size(); ++i) {
            if (i > 0) graph.summary += " ";
            graph.summary += summaries[i];
        }
    }
    return graph;
}

} // namespace archlens::application
