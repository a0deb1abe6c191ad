#include "infrastructure/PromptCatalog.hpp"
#include <sstream>

namespace archlens::infrastructure {

namespace {

constexpr std::size_t kLeadingExcerptLength = 1000;
constexpr std::size_t kExcerptLength = 500;
constexpr std::size_t kLeadingExcerptCount = 2;

const char* const kTestSuiteTask =
    "You are analyzing a TEST SUITE codebase. Your task is to identify:\n"
    "1. MODULES: List each test file and support file\n"
    "2. RELATIONSHIPS: Show how test files use support files, commands, or utilities\n"
    "3. SUMMARY: Describe what this test suite tests and its structure\n\n"
    "For TEST SUITES, modules should represent:\n"
    "- Test spec files (the actual tests)\n"
    "- Support files (commands, utilities)\n"
    "- Configuration files\n"
    "- Fixtures or helpers\n\n"
    "CRITICAL: You MUST return ONLY valid JSON. No markdown, no code blocks, no explanations before or after. "
    "Start directly with { and end with }.\n\n"
    "Return ONLY valid JSON with these exact fields:\n"
    "{\n"
    "    \"modules\": [\n"
    "        {\"name\": \"Landing Tests\", \"path\": \"cypress/e2e/01-landing.cy.js\", \"type\": \"test\", "
    "\"layer\": \"presentation\", \"description\": \"Tests for landing page functionality\"}\n"
    "    ],\n"
    "    \"relationships\": [\n"
    "        {\"from\": \"cypress/e2e/01-landing.cy.js\", \"to\": \"cypress/support/commands.js\", \"type\": \"uses\", "
    "\"strength\": \"medium\", \"description\": \"Uses custom Cypress commands\"}\n"
    "    ],\n"
    "    \"pattern\": {\"name\": \"Layered\", \"confidence\": 0.8, \"description\": \"Test suite organized by feature areas\"},\n"
    "    \"layers\": [\n"
    "        {\"name\": \"E2E Tests\", \"modules\": [\"cypress/e2e/01-landing.cy.js\"]},\n"
    "        {\"name\": \"Support\", \"modules\": [\"cypress/support/commands.js\"]}\n"
    "    ],\n"
    "    \"entryPoints\": [\"cypress.config.js\"],\n"
    "    \"coreComponents\": [\"cypress/support/commands.js\"],\n"
    "    \"summary\": \"A comprehensive E2E test suite\"\n"
    "}\n\n";

const char* const kArchitectureTask =
    "You are an expert software architect analyzing a codebase. Perform a comprehensive architectural analysis.\n\n"
    "TASK: Analyze the code structure and identify:\n"
    "1. MODULES: Each file/class with its architectural role\n"
    "2. RELATIONSHIPS: Dependencies and interactions between modules\n"
    "3. ARCHITECTURAL PATTERN: The overall architecture (MVC, Layered, Microservices, etc.)\n"
    "4. LAYERS: Logical layers (presentation, business, data, infrastructure)\n"
    "5. SUMMARY: Comprehensive description of the architecture\n\n"
    "For each MODULE, determine:\n"
    "- name: The file or class name\n"
    "- path: The file path\n"
    "- type: 'component' | 'service' | 'utility' | 'model' | 'controller' | 'view' | 'config' | 'test' | 'other'\n"
    "- layer: 'presentation' | 'business' | 'data' | 'infrastructure' | 'other'\n"
    "- description: Brief purpose description\n"
    "- exports: List of exported functions/classes (if identifiable)\n"
    "- imports: List of imports from other files (if identifiable)\n\n"
    "For each RELATIONSHIP, determine:\n"
    "- from: Source module path\n"
    "- to: Target module path\n"
    "- type: 'imports' | 'extends' | 'implements' | 'uses' | 'calls' | 'depends'\n"
    "- strength: 'weak' | 'medium' | 'strong' (based on coupling)\n"
    "- description: Brief description of the relationship\n\n"
    "ARCHITECTURAL PATTERN should include:\n"
    "- name: One of 'MVC' | 'Layered' | 'Microservices' | 'Event-Driven' | 'Client-Server' | 'Monolithic' | 'Unknown'\n"
    "- confidence: 0.0 to 1.0\n"
    "- description: Why this pattern was identified\n\n"
    "LAYERS should group modules by architectural layer:\n"
    "- name: Layer name (e.g., \"Presentation\", \"Business Logic\", \"Data Access\")\n"
    "- modules: Array of module paths in this layer\n\n"
    "CRITICAL: You MUST return ONLY valid JSON. No markdown, no code blocks, no explanations before or after. "
    "Start directly with { and end with }.\n\n"
    "Return ONLY valid JSON in this EXACT format:\n"
    "{\n"
    "    \"modules\": [\n"
    "        {\"name\": \"ExampleClass\", \"path\": \"src/example.ts\", \"type\": \"service\", \"layer\": \"business\", "
    "\"description\": \"Handles business logic\", \"exports\": [\"ExampleClass\"], \"imports\": [\"./utils\"]}\n"
    "    ],\n"
    "    \"relationships\": [\n"
    "        {\"from\": \"src/example.ts\", \"to\": \"src/utils.ts\", \"type\": \"imports\", \"strength\": \"medium\", "
    "\"description\": \"Uses utility functions\"}\n"
    "    ],\n"
    "    \"pattern\": {\"name\": \"Layered\", \"confidence\": 0.85, \"description\": \"Clear separation between layers\"},\n"
    "    \"layers\": [\n"
    "        {\"name\": \"Business Logic\", \"modules\": [\"src/example.ts\"]}\n"
    "    ],\n"
    "    \"entryPoints\": [\"src/main.ts\"],\n"
    "    \"coreComponents\": [\"src/example.ts\"],\n"
    "    \"summary\": \"A detailed architectural summary...\"\n"
    "}\n\n";

const char* const kArchitectureClosing =
    "CRITICAL INSTRUCTIONS:\n"
    "1. Return ONLY valid JSON - no markdown, no code blocks, no explanations\n"
    "2. Start with { and end with }\n"
    "3. Include ALL required fields: modules, relationships, summary, pattern, layers\n"
    "4. Make sure the JSON is complete and valid\n"
    "5. Do not stop mid-response - return the full JSON object\n\n"
    "Return the complete JSON now:\n";

const char* const kTestSuiteClosing = "Return ONLY the JSON object (no markdown, no extra text):\n";

} // namespace

std::string PromptCatalog::GetSystemPrompt() {
    return "You are a JSON-only response generator. You MUST respond with ONLY valid JSON. "
           "Never use markdown code blocks, never add explanations before or after. "
           "Your response must start with { and end with }. "
           "You MUST include all required fields: modules (array), relationships (array), summary (string), "
           "pattern (object), and layers (array). Return complete JSON, not partial.";
}

std::string PromptCatalog::GetCompletionHint() {
    return "\n\nCRITICAL: Return ONLY valid JSON. No markdown, no code blocks, no explanations. "
           "Start with { and end with }.";
}

std::string PromptCatalog::FormatExcerpt(const domain::SourceFile& file, std::size_t maxLength) {
    std::ostringstream oss;
    oss << "=== File: " << file.path << " ===\n" << file.content.substr(0, maxLength);
    if (file.content.size() > maxLength) {
        oss << "\n... (truncated)";
    }
    oss << "\n";
    return oss.str();
}

std::string PromptCatalog::BuildChunkPrompt(const std::vector<domain::SourceFile>& chunk,
                                            std::size_t corpusSize,
                                            bool testSuite,
                                            std::size_t chunkNumber,
                                            std::size_t totalChunks) {
    std::ostringstream oss;
    oss << (testSuite ? kTestSuiteTask : kArchitectureTask);
    oss << "Files to analyze (" << chunk.size() << " of " << corpusSize << " files):\n";
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        if (i > 0) oss << "\n\n";
        oss << FormatExcerpt(chunk[i], i < kLeadingExcerptCount ? kLeadingExcerptLength : kExcerptLength);
    }
    oss << "\nNote: This is chunk " << chunkNumber << " of " << totalChunks
        << ". The full codebase has " << corpusSize << " files total.\n\n";
    oss << (testSuite ? kTestSuiteClosing : kArchitectureClosing);
    return oss.str();
}

} // namespace archlens::infrastructure
