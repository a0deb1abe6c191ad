/**
 * @file OllamaInferenceAdapter.hpp
 * @brief Adapter for architecture inference against a local Ollama server.
 */

#pragma once
#include "domain/InferenceService.hpp"
#include "infrastructure/AnalysisSettings.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace archlens::infrastructure {

/**
 * @class OllamaInferenceAdapter
 * @brief Implements InferenceService using the Ollama REST API.
 *
 * Requests always ask for JSON output with deterministic sampling. Safe to call from several
 * chunk threads: each request opens its own HTTP connection.
 */
class OllamaInferenceAdapter : public domain::InferenceService {
public:
    explicit OllamaInferenceAdapter(const AnalysisSettings& settings);

    /** @brief Switches to the best served model when the configured one is missing. */
    void initialize() override;

    /** @see domain::InferenceService::chat */
    std::optional<std::string> chat(const std::vector<ChatMessage>& messages) override;

    /** @see domain::InferenceService::generate */
    std::optional<std::string> generate(const std::string& prompt) override;

    bool checkHealth() override;
    std::vector<std::string> getAvailableModels() override;
    std::string getCurrentModel() const override;

    /**
     * @brief Picks the model to run among those the server reports.
     *
     * Order: the configured tag itself, another tag of the configured family ("qwen2.5-coder:14b"
     * for "qwen2.5-coder:7b"), then code-tuned families, then general instruction families, then
     * whatever the server lists first. The family is the name without registry namespace and tag.
     * @return @p configured when @p served is empty.
     */
    static std::string ChooseModel(const std::vector<std::string>& served, const std::string& configured);

    /** @brief "registry/name:tag" -> "name". */
    static std::string ModelFamily(const std::string& model);

private:
    void detectBestModel();

    OllamaClient m_client;
    mutable std::mutex m_modelMutex;
    std::string m_model; ///< Target model name.
};

} // namespace archlens::infrastructure
