#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace archlens::infrastructure;
namespace fs = std::filesystem;

namespace {

fs::path MakeTempDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("archlens_config_test_" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

void WriteFile(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

void TestMissingFile(const fs::path& dir) {
    std::cout << "[Test] Missing settings file..." << std::endl;
    AnalysisSettings settings = ConfigLoader::Load(dir / "absent.json");
    assert(settings.host == "localhost" && settings.port == 11434);
    assert(settings.chunkSize == 5 && settings.chunkTimeoutSeconds == 60.0);
    assert(settings.selectionMin == 5 && settings.selectionMax == 10);
    assert(settings.verbose);
    std::cout << "[PASS] Missing settings file" << std::endl;
}

void TestValidFile(const fs::path& dir) {
    std::cout << "[Test] Valid settings file..." << std::endl;
    fs::path path = dir / "valid.json";
    WriteFile(path, R"({"host": "gpu-box", "port": 8080, "model": "codellama:13b", "chunk_size": 3,
                       "chunk_timeout_seconds": 12.5, "selection_min": 2, "selection_max": 4,
                       "selection_ratio": 0.25, "verbose": false})");
    AnalysisSettings settings = ConfigLoader::Load(path);
    assert(settings.host == "gpu-box" && settings.port == 8080);
    assert(settings.model == "codellama:13b");
    assert(settings.chunkSize == 3 && settings.chunkTimeoutSeconds == 12.5);
    assert(settings.selectionMin == 2 && settings.selectionMax == 4 && settings.selectionRatio == 0.25);
    assert(!settings.verbose);
    std::cout << "[PASS] Valid settings file" << std::endl;
}

void TestWrongTypesKeepDefaults(const fs::path& dir) {
    std::cout << "[Test] Wrong-typed keys..." << std::endl;
    fs::path path = dir / "typed.json";
    WriteFile(path, R"({"host": 42, "port": "11434", "chunk_size": 0, "selection_min": 2.5,
                       "verbose": "yes", "model": "mistral:7b", "selection_max": 3, "selection_min_extra": 1})");
    AnalysisSettings settings = ConfigLoader::Load(path);
    assert(settings.host == "localhost" && settings.port == 11434);
    assert(settings.chunkSize == 5);
    assert(settings.selectionMin == 5);
    // selection_max below selection_min is raised to it.
    assert(settings.selectionMax == 5);
    assert(settings.verbose);
    assert(settings.model == "mistral:7b");
    std::cout << "[PASS] Wrong-typed keys" << std::endl;
}

void TestOutOfRangeKeepDefaults(const fs::path& dir) {
    std::cout << "[Test] Out-of-range keys..." << std::endl;
    fs::path path = dir / "ranges.json";
    WriteFile(path, R"({"port": 1e12, "chunk_timeout_seconds": 1e300, "selection_ratio": 2.0,
                       "chunk_size": 1000000000000, "selection_min": 3})");
    AnalysisSettings settings = ConfigLoader::Load(path);
    assert(settings.port == 11434);
    assert(settings.chunkTimeoutSeconds == 60.0);
    assert(settings.selectionRatio == 0.10);
    assert(settings.chunkSize == 5);
    assert(settings.selectionMin == 3);

    WriteFile(path, R"({"port": 70000, "chunk_timeout_seconds": -5, "selection_ratio": -0.1})");
    settings = ConfigLoader::Load(path);
    assert(settings.port == 11434 && settings.chunkTimeoutSeconds == 60.0 && settings.selectionRatio == 0.10);

    WriteFile(path, R"({"port": 0, "chunk_timeout_seconds": 0})");
    settings = ConfigLoader::Load(path);
    assert(settings.port == 11434 && settings.chunkTimeoutSeconds == 60.0);

    // The edges of each range are accepted.
    WriteFile(path, R"({"port": 65535, "chunk_timeout_seconds": 3600, "selection_ratio": 1})");
    settings = ConfigLoader::Load(path);
    assert(settings.port == 65535 && settings.chunkTimeoutSeconds == 3600.0 && settings.selectionRatio == 1.0);
    std::cout << "[PASS] Out-of-range keys" << std::endl;
}

void TestMalformedFile(const fs::path& dir) {
    std::cout << "[Test] Malformed settings file..." << std::endl;
    WriteFile(dir / "broken.json", "{\"host\": \"gpu-box\", ");
    assert(ConfigLoader::Load(dir / "broken.json").host == "localhost");

    WriteFile(dir / "array.json", "[1, 2, 3]");
    assert(ConfigLoader::Load(dir / "array.json").port == 11434);
    std::cout << "[PASS] Malformed settings file" << std::endl;
}

void TestSavePreservesUnknownKeys(const fs::path& dir) {
    std::cout << "[Test] Save preserves unknown keys..." << std::endl;
    fs::path path = dir / "nested" / "settings.json";
    fs::create_directories(path.parent_path());
    WriteFile(path, R"({"theme": "dark", "port": 1})");

    AnalysisSettings settings;
    settings.model = "starcoder:3b";
    settings.chunkSize = 7;
    assert(ConfigLoader::Save(path, settings));

    std::ifstream in(path);
    nlohmann::json saved;
    in >> saved;
    assert(saved["theme"] == "dark");
    assert(saved["port"] == 11434);
    assert(saved["chunk_size"] == 7);

    AnalysisSettings reloaded = ConfigLoader::Load(path);
    assert(reloaded.model == "starcoder:3b" && reloaded.chunkSize == 7);

    assert(ConfigLoader::Save(dir / "fresh" / "deeper" / "settings.json", settings));
    assert(fs::exists(dir / "fresh" / "deeper" / "settings.json"));
    std::cout << "[PASS] Save preserves unknown keys" << std::endl;
}

void TestDefaultLocation(const fs::path& dir) {
    std::cout << "[Test] Default settings location..." << std::endl;
    setenv("XDG_CONFIG_HOME", dir.string().c_str(), 1);
    assert(PathUtils::GetDefaultSettingsPath() == dir / "ArchLens" / "settings.json");

    AnalysisSettings settings;
    settings.host = "from-default-path";
    assert(ConfigLoader::Save(PathUtils::GetDefaultSettingsPath(), settings));
    assert(ConfigLoader::LoadDefault().host == "from-default-path");
    std::cout << "[PASS] Default settings location" << std::endl;
}

} // namespace

int main() {
    const fs::path dir = MakeTempDir();
    TestMissingFile(dir);
    TestValidFile(dir);
    TestWrongTypesKeepDefaults(dir);
    TestOutOfRangeKeepDefaults(dir);
    TestMalformedFile(dir);
    TestSavePreservesUnknownKeys(dir);
    TestDefaultLocation(dir);
    fs::remove_all(dir);
    std::cout << "[Test] All ConfigLoader tests passed." << std::endl;
    return 0;
}
