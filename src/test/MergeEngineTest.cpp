#include <iostream>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <initializer_list>
#include <set>
#include <string>
#include <vector>
#include "application/MergeEngine.hpp"

using namespace archlens;
using application::ChunkResult;
using application::MergeEngine;
using domain::ArchitectureGraph;
using domain::PatternName;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

domain::ModuleRecord Module(const std::string& path, const std::string& description) {
    domain::ModuleRecord m;
    m.name = path;
    m.path = path;
    m.description = description;
    return m;
}

domain::RelationshipRecord Edge(const std::string& from, const std::string& to, domain::RelationshipType type) {
    return {from, to, type, domain::RelationshipStrength::Strong, ""};
}

std::vector<domain::SourceFile> Corpus() {
    return {
        domain::SourceFile("src/app.ts", "import { helper } from './util';"),
        domain::SourceFile("src/util.ts", "export const helper = 1;"),
        domain::SourceFile("src/views/home.tsx", "import { User } from '../models/user';"),
        domain::SourceFile("src/models/user.ts", "// User entity\nexport class User {}"),
    };
}

std::vector<ChunkResult> Results() {
    ChunkResult r0;
    r0.index = 0;
    r0.protocol = domain::RequestProtocol::Chat;
    r0.fragment.tier = domain::RecoveryTier::CleanParse;
    r0.fragment.modules = {Module("src/app.ts", "first"), Module("src/util.ts", "")};
    r0.fragment.relationships = {Edge("src/app.ts", "src/util.ts", domain::RelationshipType::Uses)};
    r0.fragment.layers = {{"Core", {"src/app.ts"}}};
    r0.fragment.pattern = domain::PatternClassification{PatternName::Unknown, 0.3, "unsure"};
    r0.fragment.summary = "Chunk one.";
    r0.fragment.entryPoints = {"src/app.ts"};

    ChunkResult r1;
    r1.index = 1;
    r1.protocol = domain::RequestProtocol::Completion;
    r1.fragment.tier = domain::RecoveryTier::FieldSalvage;
    r1.fragment.modules = {Module("src/app.ts", "second"), Module("src/views/home.tsx", "")};
    r1.fragment.relationships = {Edge("src/app.ts", "src/util.ts", domain::RelationshipType::Calls),
                                 Edge("src/views/home.tsx", "src/app.ts", domain::RelationshipType::Uses)};
    r1.fragment.layers = {{" core ", {"src/util.ts"}}, {"UI", {"src/views/home.tsx"}}};
    r1.fragment.pattern = domain::PatternClassification{PatternName::Layered, 0.6, "layers"};
    r1.fragment.entryPoints = {"src/app.ts", "src/main.ts"};

    ChunkResult r2;
    r2.index = 2;
    r2.fragment.tier = domain::RecoveryTier::MinimalFallback;
    r2.fragment.pattern = domain::PatternClassification{PatternName::MVC, 0.85, "mvc"};
    r2.fragment.summary = "Chunk three.";

    return {r0, r1, r2};
}

void TestMergeSemantics() {
    std::cout << "[Test] Merge semantics..." << std::endl;
    ArchitectureGraph graph = MergeEngine::Merge(Results(), Corpus());

    assert(graph.modules.size() == 4);
    for (const auto& file : Corpus()) {
        const auto count = std::count_if(graph.modules.begin(), graph.modules.end(),
                                         [&file](const domain::ModuleRecord& m) { return m.path == file.path; });
        assert(count == 1);
    }
    assert(graph.findModule("src/app.ts")->description == "first");
    const auto* backfilled = graph.findModule("src/models/user.ts");
    assert(backfilled && backfilled->description == "User entity");
    assert(backfilled->layer == domain::ArchitectureLayer::Data);

    assert(graph.relationships.size() == 3);
    assert(graph.relationships[0].type == domain::RelationshipType::Uses);
    assert(graph.hasRelationship("src/views/home.tsx", "src/app.ts"));
    assert(graph.relationships[2].from == "src/views/home.tsx" && graph.relationships[2].to == "src/models/user.ts");
    assert(graph.relationships[2].type == domain::RelationshipType::Imports);
    assert(graph.relationships[2].strength == domain::RelationshipStrength::Medium);

    assert(graph.pattern.name == PatternName::MVC && Near(graph.pattern.confidence, 0.85));
    assert(graph.summary == "Chunk one. Chunk three.");
    assert((graph.entryPoints == std::vector<std::string>{"src/app.ts", "src/main.ts"}));

    assert(graph.layers.size() == 3);
    assert(graph.layers[0].name == "Core");
    assert((graph.layers[0].modules == std::vector<std::string>{"src/app.ts", "src/util.ts"}));
    assert(graph.layers[1].name == "UI");
    assert(graph.layers[2].name == "Data");
    assert((graph.layers[2].modules == std::vector<std::string>{"src/models/user.ts"}));

    assert(graph.chunks.size() == 3);
    assert(graph.chunks[1].tier == domain::RecoveryTier::FieldSalvage);
    assert(graph.chunks[1].protocol == domain::RequestProtocol::Completion);
    assert(!graph.chunks[2].protocol);
    std::cout << "[PASS] Merge semantics" << std::endl;
}

void TestNoDuplicateKeys() {
    std::cout << "[Test] No duplicate keys..." << std::endl;
    ArchitectureGraph graph = MergeEngine::Merge(Results(), Corpus());

    std::set<std::string> paths;
    for (const auto& m : graph.modules) assert(paths.insert(m.path).second);
    std::set<std::string> keys;
    for (const auto& r : graph.relationships) assert(keys.insert(r.key()).second);
    for (const auto& layer : graph.layers) {
        std::set<std::string> members(layer.modules.begin(), layer.modules.end());
        assert(members.size() == layer.modules.size());
    }
    std::cout << "[PASS] No duplicate keys" << std::endl;
}

void TestOrderIndependence() {
    std::cout << "[Test] Completion-order independence..." << std::endl;
    auto forward = Results();
    auto reversed = forward;
    std::reverse(reversed.begin(), reversed.end());
    auto rotated = forward;
    std::rotate(rotated.begin(), rotated.begin() + 1, rotated.end());

    ArchitectureGraph a = MergeEngine::Merge(forward, Corpus());
    for (const auto& shuffled : {reversed, rotated}) {
        ArchitectureGraph b = MergeEngine::Merge(shuffled, Corpus());
        assert(a.modules.size() == b.modules.size());
        for (size_t i = 0; i < a.modules.size(); ++i) {
            assert(a.modules[i].path == b.modules[i].path);
            assert(a.modules[i].description == b.modules[i].description);
        }
        assert(a.relationships.size() == b.relationships.size());
        for (size_t i = 0; i < a.relationships.size(); ++i) {
            assert(a.relationships[i].key() == b.relationships[i].key());
            assert(a.relationships[i].type == b.relationships[i].type);
        }
        assert(a.pattern.name == b.pattern.name && Near(a.pattern.confidence, b.pattern.confidence));
        assert(a.summary == b.summary);
        assert(a.layers.size() == b.layers.size());
        for (size_t i = 0; i < a.layers.size(); ++i) {
            assert(a.layers[i].name == b.layers[i].name);
            assert(a.layers[i].modules == b.layers[i].modules);
        }
        assert(a.entryPoints == b.entryPoints);
    }
    std::cout << "[PASS] Completion-order independence" << std::endl;
}

void TestPatternTieAndDefaults() {
    std::cout << "[Test] Pattern tie-break and defaults..." << std::endl;
    ChunkResult first;
    first.index = 0;
    first.fragment.pattern = domain::PatternClassification{PatternName::Layered, 0.7, ""};
    ChunkResult second;
    second.index = 1;
    second.fragment.pattern = domain::PatternClassification{PatternName::MVC, 0.7, ""};

    ArchitectureGraph tied = MergeEngine::Merge({second, first}, {});
    assert(tied.pattern.name == PatternName::Layered);

    ChunkResult unknown;
    unknown.fragment.pattern = domain::PatternClassification{PatternName::Unknown, 0.9, ""};
    ArchitectureGraph none = MergeEngine::Merge({unknown}, Corpus());
    assert(none.pattern.name == PatternName::Unknown);
    assert(Near(none.pattern.confidence, 0.0));
    assert(none.pattern.description == "Could not determine pattern");
    assert(none.summary == "Analyzed 4 files across 1 chunks");
    assert(none.modules.size() == 4);

    ArchitectureGraph empty = MergeEngine::Merge({}, {});
    assert(empty.modules.empty() && empty.relationships.empty());
    assert(empty.pattern.name == PatternName::Unknown);
    std::cout << "[PASS] Pattern tie-break and defaults" << std::endl;
}

void TestImportEdges() {
    std::cout << "[Test] Import edges..." << std::endl;
    std::vector<domain::SourceFile> corpus = {
        domain::SourceFile("src/loop.ts", "import './loop';\nimport x from './other';"),
        domain::SourceFile("src/other.ts", "import y from 'react';"),
    };
    auto edges = MergeEngine::ImportEdges(corpus);
    assert(edges.size() == 1);
    assert(edges[0].from == "src/loop.ts" && edges[0].to == "src/other.ts");
    assert(MergeEngine::LayerKey("  Business Logic ") == "business logic");
    std::cout << "[PASS] Import edges" << std::endl;
}

} // namespace

int main() {
    TestMergeSemantics();
    TestNoDuplicateKeys();
    TestOrderIndependence();
    TestPatternTieAndDefaults();
    TestImportEdges();
    std::cout << "[Test] All MergeEngine tests passed." << std::endl;
    return 0;
}
