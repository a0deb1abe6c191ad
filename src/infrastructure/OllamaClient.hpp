/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace archlens::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Connection and read limits, in seconds, applied to chat and generate. */
    void setTimeouts(int connectSeconds, int readSeconds);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& prompt,
                                        bool forceJson = true);

    /** @brief Sends a POST request to /api/chat. */
    std::optional<std::string> chat(const std::string& model,
                                    const nlohmann::json& messages,
                                    bool forceJson = true);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    /** @brief True when /api/tags answers with HTTP 200. */
    bool isReachable();

    /** @brief Sampling options shared by every request: deterministic, bounded, fence stops. */
    static nlohmann::json BuildOptions();

    /**
     * @brief Pulls the assistant text out of a chat reply body.
     * Looks at message.content, then the last entry of messages[], then response.
     */
    static std::optional<std::string> ExtractChatContent(const nlohmann::json& body);

private:
    std::optional<std::string> post(const char* endpoint, const nlohmann::json& requestData);

    std::string m_host;
    int m_port;
    int m_connectTimeoutSeconds = 5;
    int m_readTimeoutSeconds = 60;
};

} // namespace archlens::infrastructure
