/**
 * @file ChatAction.hpp
 * @brief Typed edit actions decoded from one assistant reply.
 */

#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace noteagent::domain {

/** @brief Free-text answer; the note is left untouched. */
struct ReplyAction {
    static constexpr const char* Type = "reply";
    std::string content;
};

/** @brief New node placed right after the top-level child `insertAfter`. */
struct InsertNodeAction {
    static constexpr const char* Type = "insert_node";
    std::uint32_t insertAfter = 0;
    std::string nodeType;
    std::string content;
};

/** @brief Rewrite of the top-level child `id`. */
struct ModifyNodeAction {
    static constexpr const char* Type = "modify_node";
    std::uint32_t id = 0;
    std::string nodeType;
    std::string content;
};

using ChatAction = std::variant<ReplyAction, InsertNodeAction, ModifyNodeAction>;

/** @brief Wire name of the action ("reply", "insert_node", "modify_node"). */
inline std::string ActionTypeOf(const ChatAction& action) {
    return std::visit([](const auto& a) -> std::string {
        return std::decay_t<decltype(a)>::Type;
    }, action);
}

/** @brief One-line description suitable for a status bar. */
inline std::string DescribeAction(const ChatAction& action) {
    if (const auto* insert = std::get_if<InsertNodeAction>(&action)) {
        return "Agent inserted a new " + insert->nodeType + " node";
    }
    if (const auto* modify = std::get_if<ModifyNodeAction>(&action)) {
        return "Agent modified " + modify->nodeType + " node at position " + std::to_string(modify->id);
    }
    return "Agent replied to your message";
}

} // namespace noteagent::domain
