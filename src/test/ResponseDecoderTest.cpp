#include <iostream>
#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/FragmentBuilder.hpp"
#include "application/ResponseDecoder.hpp"

using namespace archlens;
using application::FragmentBuilder;
using application::ResponseDecoder;
using domain::RecoveryTier;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

std::vector<domain::SourceFile> Batch() {
    return {
        domain::SourceFile("src/services/a.ts", "// Service A\nexport const a = 1;"),
        domain::SourceFile("src/views/b.tsx", "import { a } from '../services/a';"),
    };
}

void TestLadderMonotonicity() {
    std::cout << "[Test] Decoder ladder..." << std::endl;
    ResponseDecoder decoder;
    const auto batch = Batch();

    const std::string clean =
        R"(Here you go: {"modules":[{"name":"a","path":"src/services/a.ts","type":"service","layer":"business"}],)"
        R"("relationships":[{"from":"src/views/b.tsx","to":"src/services/a.ts","type":"uses","strength":"strong"}],)"
        R"("pattern":{"name":"Layered","confidence":0.9,"description":"layers"},"summary":"Two modules"} Thanks)";
    auto f0 = decoder.decode(clean, batch);
    assert(f0.tier == RecoveryTier::CleanParse);
    assert(f0.modules.size() == 1);
    assert(f0.relationships.size() == 1);
    assert(f0.relationships[0].type == domain::RelationshipType::Uses);
    assert(f0.relationships[0].strength == domain::RelationshipStrength::Strong);
    assert(f0.pattern && f0.pattern->name == domain::PatternName::Layered && Near(f0.pattern->confidence, 0.9));
    assert(f0.summary == "Two modules");
    assert(f0.layers.size() == 1 && f0.layers[0].name == "Business");

    const std::string fenced =
        "```json\n{\"modules\": [{\"name\": \"a\", \"path\": \"src/services/a.ts\"},], \"summary\": \"ok\",}\n```";
    auto f1 = decoder.decode(fenced, batch);
    assert(f1.tier == RecoveryTier::BalancedRepair);
    assert(f1.modules.size() == 1);
    assert(f1.modules[0].type == domain::ModuleType::Service);
    assert(f1.summary == "ok");

    const std::string truncated =
        "{\"modules\": [{\"name\": \"a\", \"path\": \"src/services/a.ts\", \"type\": \"service\"}], "
        "\"relationships\": [{\"from\": \"src/services/a.ts\", \"to\": ";
    auto f2 = decoder.decode(truncated, batch);
    assert(f2.tier == RecoveryTier::FieldSalvage);
    assert(f2.modules.size() == 1 && f2.modules[0].path == "src/services/a.ts");
    assert(f2.relationships.empty());
    assert(f2.pattern && f2.pattern->name == domain::PatternName::Unknown && Near(f2.pattern->confidence, 0.3));
    assert(f2.pattern->description == "Partial recovery");
    assert(f2.layers.empty());

    auto f3 = decoder.decode("I'm sorry, I cannot analyze this code.", batch);
    assert(f3.tier == RecoveryTier::MinimalFallback);
    assert(f3.modules.size() == 2);
    assert(f3.relationships.empty());
    assert(f3.pattern && f3.pattern->name == domain::PatternName::Unknown && Near(f3.pattern->confidence, 0.0));
    assert(f3.summary == "Fallback analysis for 2 files");
    assert(f3.modules[0].description == "Service A");
    std::cout << "[PASS] Decoder ladder" << std::endl;
}

void TestDegenerateInputs() {
    std::cout << "[Test] Degenerate responses..." << std::endl;
    ResponseDecoder decoder;
    const auto batch = Batch();

    assert(decoder.decode("", batch).tier == RecoveryTier::MinimalFallback);
    assert(decoder.decode("   \n\t", batch).tier == RecoveryTier::MinimalFallback);
    // Valid JSON without any architecture field does not count as a success.
    assert(decoder.decode("{\"foo\": 1}", batch).tier == RecoveryTier::MinimalFallback);
    assert(decoder.decode("[1, 2, 3]", batch).tier == RecoveryTier::MinimalFallback);
    assert(decoder.decode(std::string(5000, '{'), batch).tier == RecoveryTier::MinimalFallback);
    assert(decoder.decode(std::string(5000, '"'), batch).tier == RecoveryTier::MinimalFallback);

    // A recognized but empty fragment is filled from the batch and keeps its tier.
    auto empty = decoder.decode("{\"modules\": []}", batch);
    assert(empty.tier == RecoveryTier::CleanParse);
    assert(empty.modules.size() == 2);
    std::cout << "[PASS] Degenerate responses" << std::endl;
}

void TestElementSalvage() {
    std::cout << "[Test] Element-wise salvage..." << std::endl;
    ResponseDecoder decoder;
    const std::string cut =
        "{\"modules\": [{\"name\": \"a\", \"path\": \"src/services/a.ts\"}, "
        "{\"name\": \"b\", \"path\": \"src/views/b.tsx\", \"type\": \"view\"}, {\"name\": \"c\", \"pa";
    auto fragment = decoder.decode(cut, Batch());
    assert(fragment.tier == RecoveryTier::FieldSalvage);
    assert(fragment.modules.size() == 2);
    assert(fragment.modules[1].type == domain::ModuleType::View);

    auto items = ResponseDecoder::SalvageArray("[{\"path\": \"x.ts\"}, {bad json here}, \"y.ts\", 7]");
    assert(items.size() == 3);
    assert(items[0]["path"] == "x.ts");
    assert(items[1] == "y.ts");
    assert(items[2] == 7);

    auto located = ResponseDecoder::LocateFieldValue("prose summary: {\"summary\": \"real\"}", "summary");
    assert(located && *located == "\"real\"");
    assert(!ResponseDecoder::LocateFieldValue("nothing to see", "modules"));
    std::cout << "[PASS] Element-wise salvage" << std::endl;
}

void TestNormalization() {
    std::cout << "[Test] Field normalization..." << std::endl;
    ResponseDecoder decoder;
    const std::string response = R"({
        "modules": ["src/views/b.tsx", {"name": "a"}, {"type": "service"}, 42],
        "relationships": [
            {"source": "src/views/b.tsx", "target": "src/services/a.ts"},
            {"parentModule": "src/services/a.ts", "childModules": ["x.ts", "y.ts"]},
            {"from": "only-from"}
        ],
        "pattern": "MVC",
        "layers": [{"name": "Business"}, {"name": "UI", "modules": ["src/views/b.tsx", "src/views/b.tsx"]}],
        "entryPoints": ["src/views/b.tsx", ""],
        "coreComponents": "notalist"
    })";
    auto f = decoder.decode(response, Batch());
    assert(f.tier == RecoveryTier::CleanParse);

    assert(f.modules.size() == 2);
    assert(f.modules[0].path == "src/views/b.tsx" && f.modules[0].name == "b");
    assert(f.modules[0].layer == domain::ArchitectureLayer::Presentation);
    assert(f.modules[1].name == "a" && f.modules[1].path == "src/services/a.ts");
    assert(f.modules[1].type == domain::ModuleType::Service);

    assert(f.relationships.size() == 3);
    assert(f.relationships[0].from == "src/views/b.tsx" && f.relationships[0].to == "src/services/a.ts");
    assert(f.relationships[0].type == domain::RelationshipType::Depends);
    assert(f.relationships[0].strength == domain::RelationshipStrength::Medium);
    assert(f.relationships[1].to == "x.ts" && f.relationships[1].type == domain::RelationshipType::Uses);
    assert(f.relationships[2].to == "y.ts");

    assert(f.pattern && f.pattern->name == domain::PatternName::MVC && Near(f.pattern->confidence, 0.8));

    assert(f.layers.size() == 2);
    assert((f.layers[0].modules == std::vector<std::string>{"src/services/a.ts"}));
    assert((f.layers[1].modules == std::vector<std::string>{"src/views/b.tsx"}));

    assert((f.entryPoints == std::vector<std::string>{"src/views/b.tsx"}));
    assert(f.coreComponents.empty());
    assert(f.summary == "Chunk analysis: 2 modules, 3 relationships");
    std::cout << "[PASS] Field normalization" << std::endl;
}

void TestPatternVariants() {
    std::cout << "[Test] Pattern variants..." << std::endl;
    std::vector<domain::ModuleRecord> none;
    using nlohmann::json;

    auto p = FragmentBuilder::BuildPattern(json{{"name", "Unknown"}}, none, {});
    assert(p.name == domain::PatternName::Unknown && Near(p.confidence, 0.3));

    p = FragmentBuilder::BuildPattern(json{{"name", "microservice architecture"}, {"confidence", 85}}, none, {});
    assert(p.name == domain::PatternName::Microservices && Near(p.confidence, 0.85));

    p = FragmentBuilder::BuildPattern(json{{"name", "Layered"}, {"confidence", -2}}, none, {});
    assert(p.name == domain::PatternName::Layered && Near(p.confidence, 0.7));
    assert(p.description == "Architecture pattern: Layered");

    p = FragmentBuilder::BuildPattern(json{{"name", "MVC"}, {"confidence", 1000}}, none, {});
    assert(Near(p.confidence, 1.0));

    p = FragmentBuilder::BuildPattern(json("weird style"), none, {});
    assert(p.name == domain::PatternName::Unknown && Near(p.confidence, 0.5));

    p = FragmentBuilder::BuildPattern(json(), none, {});
    assert(p.name == domain::PatternName::Unknown && Near(p.confidence, 0.3));
    std::cout << "[PASS] Pattern variants" << std::endl;
}

void TestOversizedResponses() {
    std::cout << "[Test] Oversized responses..." << std::endl;
    ResponseDecoder decoder;
    const auto batch = Batch();
    const auto hasModule = [](const domain::RecoveryFragment& fragment, const std::string& path) {
        return std::any_of(fragment.modules.begin(), fragment.modules.end(),
                           [&path](const domain::ModuleRecord& m) { return m.path == path; });
    };

    const std::string blanks(60000, ' ');
    const std::string spacedKey =
        "{\"summary\": \"x\", \"modules\"" + blanks + ": [{\"path\": \"src/services/a.ts\", \"name\": \"a\"}, "
        "{\"path\": \"src/views/b.tsx\", \"na";
    auto spaced = decoder.decode(spacedKey, batch);
    assert(spaced.tier == RecoveryTier::FieldSalvage);
    assert(spaced.summary == "x");
    assert(hasModule(spaced, "src/services/a.ts"));

    // More than 200 KB, blank runs on both sides of every colon, cut off mid-array.
    const std::string wide(70000, '\n');
    const std::string huge =
        "{\"summary\"" + wide + ":" + wide + "\"big\", \"relationships\"" + wide + ":" + wide +
        "[{\"from\": \"src/views/b.tsx\", \"to\": \"src/services/a.ts\"}, {\"from\": ";
    assert(huge.size() > 200 * 1024);
    const auto start = std::chrono::steady_clock::now();
    auto salvaged = decoder.decode(huge, batch);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    assert(salvaged.tier == RecoveryTier::FieldSalvage);
    assert(salvaged.summary == "big");
    assert(salvaged.relationships.size() == 1);
    assert(salvaged.relationships[0].from == "src/views/b.tsx");
    assert(elapsed < std::chrono::seconds(5));
    std::cout << "[PASS] Oversized responses" << std::endl;
}

} // namespace

int main() {
    TestLadderMonotonicity();
    TestDegenerateInputs();
    TestElementSalvage();
    TestNormalization();
    TestPatternVariants();
    TestOversizedResponses();
    std::cout << "[Test] All ResponseDecoder tests passed." << std::endl;
    return 0;
}
