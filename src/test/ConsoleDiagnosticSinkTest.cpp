#include <iostream>
#include <cassert>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "infrastructure/ConsoleDiagnosticSink.hpp"

using archlens::infrastructure::ConsoleDiagnosticSink;

namespace {

size_t CountLines(const std::string& text) {
    size_t lines = 0;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) ++lines;
    return lines;
}

void TestRouting() {
    std::cout << "[Test] Info and error routing..." << std::endl;
    std::ostringstream out;
    std::ostringstream err;
    ConsoleDiagnosticSink sink("Chunks", true, out, err);

    sink.info("Chunk 1/2: analyzing 5 files");
    sink.error("Chunk 2/2: chat request timed out");
    assert(out.str() == "[Chunks] Chunk 1/2: analyzing 5 files\n");
    assert(err.str() == "[Chunks] ERROR: Chunk 2/2: chat request timed out\n");
    std::cout << "[PASS] Info and error routing" << std::endl;
}

void TestQuietMode() {
    std::cout << "[Test] Quiet mode..." << std::endl;
    std::ostringstream out;
    std::ostringstream err;
    ConsoleDiagnosticSink sink("ArchLens", false, out, err);

    sink.info("hidden");
    sink.error("shown");
    assert(out.str().empty());
    assert(err.str() == "[ArchLens] ERROR: shown\n");

    sink.setVerbose(true);
    sink.info("visible");
    assert(out.str() == "[ArchLens] visible\n");
    std::cout << "[PASS] Quiet mode" << std::endl;
}

void TestConcurrentWriters() {
    std::cout << "[Test] Concurrent writers..." << std::endl;
    std::ostringstream out;
    std::ostringstream err;
    ConsoleDiagnosticSink sink("ArchLens", true, out, err);

    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&sink, t]() {
            for (int i = 0; i < 50; ++i) {
                sink.info("writer " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& writer : writers) writer.join();

    assert(CountLines(out.str()) == 400);
    std::istringstream in(out.str());
    for (std::string line; std::getline(in, line);) {
        assert(line.rfind("[ArchLens] writer ", 0) == 0);
    }
    std::cout << "[PASS] Concurrent writers" << std::endl;
}

} // namespace

int main() {
    TestRouting();
    TestQuietMode();
    TestConcurrentWriters();
    std::cout << "[Test] All ConsoleDiagnosticSink tests passed." << std::endl;
    return 0;
}
