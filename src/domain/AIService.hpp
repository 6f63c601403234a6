/**
 * @file AIService.hpp
 * @brief Interface for the chat-completion backend the agent talks to.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace noteagent::domain {

/**
 * @class AIService
 * @brief Abstract chat transport. Implementations own model choice, timeouts and wire format.
 */
class AIService {
public:
    virtual ~AIService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @struct ChatMessage
     * @brief Represents a single message in a chat conversation.
     */
    struct ChatMessage {
        enum class Role { System, User, Assistant };
        Role role;
        std::string content;

        static std::string RoleToString(Role r) {
            switch(r) {
                case Role::System: return "system";
                case Role::User: return "user";
                case Role::Assistant: return "assistant";
            }
            return "user";
        }
    };

    /**
     * @brief Sends a chat history to the AI and gets the next response.
     * @param history The conversation history, system prompt first.
     * @return The assistant's response content, or nullopt if the backend gave none.
     */
    virtual std::optional<std::string> chat(const std::vector<ChatMessage>& history) = 0;

    /**
     * @brief Retrieves a list of available AI models from the provider.
     * @return Vector of model names.
     */
    virtual std::vector<std::string> getAvailableModels() = 0;

    /**
     * @brief Sets the specific AI model to use for future requests.
     * @param modelName The name of the model to select.
     */
    virtual void setModel(const std::string& modelName) = 0;

    /** @brief Gets the name of the currently selected AI model. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace noteagent::domain
