/**
 * @file InferenceService.hpp
 * @brief Interface for the natural-language inference backend used to analyze source chunks.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace archlens::domain {

/**
 * @class InferenceService
 * @brief Abstract text-in/text-out backend.
 *
 * Both request forms return std::nullopt on transport-level failure (unreachable host,
 * HTTP error, unreadable envelope). A returned string, even an empty one, is content and is
 * never trusted to follow any schema.
 */
class InferenceService {
public:
    virtual ~InferenceService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @struct ChatMessage
     * @brief Represents a single message in a chat exchange.
     */
    struct ChatMessage {
        enum class Role { System, User, Assistant };
        Role role;
        std::string content;

        static std::string RoleToString(Role r) {
            switch (r) {
                case Role::System: return "system";
                case Role::User: return "user";
                case Role::Assistant: return "assistant";
            }
            return "user";
        }
    };

    /**
     * @brief Sends a structured message exchange.
     * @param messages System and user messages, in order.
     * @return Assistant content, or std::nullopt on transport failure.
     */
    virtual std::optional<std::string> chat(const std::vector<ChatMessage>& messages) = 0;

    /**
     * @brief Sends a single prompt for completion.
     * @param prompt Full prompt text.
     * @return Completion text, or std::nullopt on transport failure.
     */
    virtual std::optional<std::string> generate(const std::string& prompt) = 0;

    /** @brief Returns true when the backend answers at all. */
    virtual bool checkHealth() { return true; }

    /** @brief Models the backend can serve. */
    virtual std::vector<std::string> getAvailableModels() { return {}; }

    /** @brief Name of the model requests are sent to. */
    virtual std::string getCurrentModel() const { return ""; }
};

} // namespace archlens::domain
