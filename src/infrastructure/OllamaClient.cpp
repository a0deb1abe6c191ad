#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace archlens::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kTopP = 0.9;
constexpr int kTopK = 40;
constexpr int kMaxPredictTokens = 2000;
constexpr int kTagsTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

void OllamaClient::setTimeouts(int connectSeconds, int readSeconds) {
    m_connectTimeoutSeconds = connectSeconds;
    m_readTimeoutSeconds = readSeconds;
}

json OllamaClient::BuildOptions() {
    return {
        {"temperature", kDeterministicTemperature},
        {"top_p", kTopP},
        {"top_k", kTopK},
        {"num_predict", kMaxPredictTokens},
        {"stop", json::array({"```", "```json"})}
    };
}

std::optional<std::string> OllamaClient::ExtractChatContent(const json& body) {
    if (!body.is_object()) return std::nullopt;

    auto message = body.find("message");
    if (message != body.end() && message->is_object()) {
        auto content = message->find("content");
        if (content != message->end() && content->is_string() && !content->get<std::string>().empty()) {
            return content->get<std::string>();
        }
    }

    auto messages = body.find("messages");
    if (messages != body.end() && messages->is_array() && !messages->empty()) {
        const json& last = messages->back();
        if (last.is_object() && last.contains("content") && last["content"].is_string()) {
            return last["content"].get<std::string>();
        }
    }

    auto response = body.find("response");
    if (response != body.end() && response->is_string()) {
        return response->get<std::string>();
    }
    return std::string();
}

std::optional<std::string> OllamaClient::post(const char* endpoint, const json& requestData) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_connectTimeoutSeconds);
    cli.set_read_timeout(m_readTimeoutSeconds);

    auto res = cli.Post(endpoint, requestData.dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] Connection failed (" << endpoint << "): "
                  << static_cast<int>(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << " on " << endpoint << ": "
                  << res->body.substr(0, 200) << std::endl;
        return std::nullopt;
    }
    return res->body;
}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& prompt,
                                                  bool forceJson) {
    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", BuildOptions()}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto raw = post("/api/generate", requestData);
    if (!raw) return std::nullopt;

    try {
        auto body = json::parse(*raw);
        if (body.contains("response") && body["response"].is_string()) {
            return body["response"].get<std::string>();
        }
        return std::string();
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<std::string> OllamaClient::chat(const std::string& model,
                                              const json& messages,
                                              bool forceJson) {
    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", BuildOptions()}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto raw = post("/api/chat", requestData);
    if (!raw) return std::nullopt;

    try {
        return ExtractChatContent(json::parse(*raw));
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kTagsTimeoutSeconds);
    cli.set_read_timeout(kTagsTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name") && item["name"].is_string()) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Malformed /api/tags reply: " << e.what() << std::endl;
        }
    }
    return models;
}

bool OllamaClient::isReachable() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kTagsTimeoutSeconds);
    cli.set_read_timeout(kTagsTimeoutSeconds);
    auto res = cli.Get("/api/tags");
    return res && res->status == 200;
}

} // namespace archlens::infrastructure
