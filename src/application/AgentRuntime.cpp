/**
 * @file AgentRuntime.cpp
 * @brief Implementation of AgentRuntime.
 */

#include "application/AgentRuntime.hpp"
#include "application/ActionParser.hpp"
#include "application/PromptAssembler.hpp"
#include "domain/NoteAgentError.hpp"
#include <exception>
#include <iostream>
#include <utility>

namespace noteagent::application {

AgentRuntime::AgentRuntime(std::shared_ptr<domain::AIService> aiService, std::size_t maxHistoryMessages)
    : m_aiService(std::move(aiService)), m_maxHistory(maxHistoryMessages), m_running(false) {}

AgentRuntime::~AgentRuntime() {
    stop();
}

void AgentRuntime::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        std::cerr << "[AgentRuntime] Agent is already running" << std::endl;
        return;
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_running = true;
    m_worker = std::thread(&AgentRuntime::workerLoop, this);
    std::cout << "[AgentRuntime] Agent started (model: " << m_aiService->getCurrentModel() << ")" << std::endl;
}

void AgentRuntime::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
    std::cout << "[AgentRuntime] Agent stopped" << std::endl;
}

bool AgentRuntime::isRunning() const {
    return m_running.load();
}

std::string AgentRuntime::sendChat(const std::vector<domain::AIService::ChatMessage>& messages) {
    std::lock_guard<std::mutex> turn(m_turnMutex);

    std::future<std::string> reply;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            throw domain::NoteAgentError(domain::ErrorKind::AgentNotRunning,
                                         "Agent is not running. Call start() first.");
        }
        m_pending.emplace();
        m_pending->messages = messages;
        reply = m_pending->reply.get_future();
    }
    m_cv.notify_one();

    try {
        return reply.get();
    } catch (const std::exception& e) {
        std::cerr << "[AgentRuntime] Failed to receive reply: " << e.what() << std::endl;
        return kReceiveFailedText;
    }
}

domain::ChatAction AgentRuntime::chat(const std::vector<domain::AIService::ChatMessage>& history,
                                      const domain::ChatContext& context) {
    auto messages = PromptAssembler::BuildConversation(context, history, m_maxHistory);
    return ActionParser::Parse(sendChat(messages));
}

void AgentRuntime::workerLoop() {
    while (true) {
        std::optional<ChatRequest> request;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return m_pending.has_value() || !m_running;
            });

            if (!m_pending) {
                return; // Stopped with nothing queued
            }

            request.emplace(std::move(*m_pending));
            m_pending.reset();
        }

        // Model call runs outside the lock
        serve(*request);
    }
}

void AgentRuntime::serve(ChatRequest& request) {
    try {
        auto content = m_aiService->chat(request.messages);
        if (!content) {
            std::cerr << "[AgentRuntime] " << kNoReplyText << std::endl;
            request.reply.set_value(kNoReplyText);
            return;
        }
        request.reply.set_value(*content);
    } catch (const std::exception& e) {
        std::cerr << "[AgentRuntime] Chat turn failed: " << e.what() << std::endl;
        request.reply.set_exception(std::current_exception());
    }
}

} // namespace noteagent::application
