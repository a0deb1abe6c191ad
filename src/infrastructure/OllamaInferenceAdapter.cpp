/**
 * @file OllamaInferenceAdapter.cpp
 * @brief Implementation of the OllamaInferenceAdapter class.
 */
#include "infrastructure/OllamaInferenceAdapter.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>

using json = nlohmann::json;

namespace archlens::infrastructure {

namespace {

// Matched as family prefixes, best first.
const char* const kCodeFamilies[] = {"qwen2.5-coder", "deepseek-coder", "codellama", "starcoder", "codegemma"};
const char* const kGeneralFamilies[] = {"qwen2.5", "llama3", "mistral"};

template <size_t N>
std::optional<std::string> FirstOfFamilies(const std::vector<std::string>& served, const char* const (&families)[N]) {
    for (const char* family : families) {
        for (const auto& model : served) {
            if (OllamaInferenceAdapter::ModelFamily(model).rfind(family, 0) == 0) return model;
        }
    }
    return std::nullopt;
}

} // namespace

OllamaInferenceAdapter::OllamaInferenceAdapter(const AnalysisSettings& settings)
    : m_client(settings.host, settings.port), m_model(settings.model) {
    // The HTTP read limit trails the per-attempt limit so abandoned attempts still end.
    double seconds = settings.chunkTimeoutSeconds;
    if (!std::isfinite(seconds)) seconds = AnalysisSettings{}.chunkTimeoutSeconds;
    seconds = std::clamp(seconds, 0.0, AnalysisSettings::kMaxChunkTimeoutSeconds);
    const int readSeconds = static_cast<int>(std::ceil(seconds)) + 1;
    m_client.setTimeouts(5, readSeconds);
}

std::string OllamaInferenceAdapter::ModelFamily(const std::string& model) {
    size_t slash = model.find_last_of('/');
    std::string name = slash == std::string::npos ? model : model.substr(slash + 1);
    size_t colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(0, colon);
}

std::string OllamaInferenceAdapter::ChooseModel(const std::vector<std::string>& served, const std::string& configured) {
    if (served.empty()) return configured;
    if (std::find(served.begin(), served.end(), configured) != served.end()) return configured;

    const std::string family = ModelFamily(configured);
    auto sibling = std::find_if(served.begin(), served.end(),
                                [&family](const std::string& model) { return ModelFamily(model) == family; });
    if (sibling != served.end()) return *sibling;

    if (auto code = FirstOfFamilies(served, kCodeFamilies)) return *code;
    if (auto general = FirstOfFamilies(served, kGeneralFamilies)) return *general;
    return served.front();
}

void OllamaInferenceAdapter::initialize() {
    detectBestModel();
}

void OllamaInferenceAdapter::detectBestModel() {
    auto availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        std::cerr << "[OllamaInferenceAdapter] No models reported by Ollama, keeping " << getCurrentModel() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_modelMutex);
    std::string best = ChooseModel(availableModels, m_model);
    if (best != m_model) {
        std::cout << "[OllamaInferenceAdapter] Model " << m_model << " not available, using " << best << std::endl;
        m_model = best;
    }
}

std::optional<std::string> OllamaInferenceAdapter::chat(const std::vector<ChatMessage>& messages) {
    json payload = json::array();
    for (const auto& msg : messages) {
        payload.push_back({
            {"role", ChatMessage::RoleToString(msg.role)},
            {"content", msg.content}
        });
    }
    return m_client.chat(getCurrentModel(), payload);
}

std::optional<std::string> OllamaInferenceAdapter::generate(const std::string& prompt) {
    return m_client.generate(getCurrentModel(), prompt);
}

bool OllamaInferenceAdapter::checkHealth() {
    return m_client.isReachable();
}

std::vector<std::string> OllamaInferenceAdapter::getAvailableModels() {
    return m_client.getAvailableModels();
}

std::string OllamaInferenceAdapter::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

} // namespace archlens::infrastructure
