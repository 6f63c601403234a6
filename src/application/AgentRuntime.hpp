/**
 * @file AgentRuntime.hpp
 * @brief Background agent that serves one chat turn at a time.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "domain/AIService.hpp"
#include "domain/ChatAction.hpp"
#include "domain/LexicalNode.hpp"

namespace noteagent::application {

/**
 * @struct ChatRequest
 * @brief One queued turn: the full message list and where to deliver the reply.
 */
struct ChatRequest {
    std::vector<domain::AIService::ChatMessage> messages;
    std::promise<std::string> reply;
};

/**
 * @class AgentRuntime
 * @brief Owns the worker thread that talks to the AIService.
 *
 * Requests pass through a one-slot queue; callers block until their turn is
 * answered, so at most one completion call is in flight. Channel failures are
 * reported as degraded reply text rather than errors.
 */
class AgentRuntime {
public:
    static constexpr const char* kNoReplyText = "Agent did not reply to interaction";
    static constexpr const char* kReceiveFailedText = "Failed to receive reply";

    /**
     * @param aiService Completion backend shared with the caller.
     * @param maxHistoryMessages History truncation for chat(); 0 keeps everything.
     */
    explicit AgentRuntime(std::shared_ptr<domain::AIService> aiService, std::size_t maxHistoryMessages = 0);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    /** @brief Launches the worker. A second call only logs a warning. */
    void start();

    /** @brief Lets the worker finish queued turns, then joins it. */
    void stop();

    bool isRunning() const;

    /**
     * @brief Sends a prepared message list and waits for the reply text.
     * @throws domain::NoteAgentError (AgentNotRunning) before start().
     */
    std::string sendChat(const std::vector<domain::AIService::ChatMessage>& messages);

    /**
     * @brief One full turn: brief + system prompt, completion, action parsing.
     * @throws domain::NoteAgentError from the parser or when not running.
     */
    domain::ChatAction chat(const std::vector<domain::AIService::ChatMessage>& history,
                            const domain::ChatContext& context);

private:
    void workerLoop();
    void serve(ChatRequest& request);

    std::shared_ptr<domain::AIService> m_aiService;
    std::size_t m_maxHistory;

    // One-slot request queue
    std::optional<ChatRequest> m_pending;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Serializes callers so only one turn waits on the slot at a time
    std::mutex m_turnMutex;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace noteagent::application
