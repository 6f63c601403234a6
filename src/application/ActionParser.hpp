/**
 * @file ActionParser.hpp
 * @brief Turns a raw model reply into exactly one typed ChatAction.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/ChatAction.hpp"

namespace noteagent::application {

/**
 * @class ActionParser
 * @brief Tolerant decoder for assistant replies.
 *
 * Plain prose becomes a ReplyAction. Anything that starts with '{' after
 * trimming and fence removal is treated as an action object and must parse;
 * failures throw domain::NoteAgentError (MalformedActionJson,
 * MalformedActionShape or UnsupportedActionType).
 */
class ActionParser {
public:
    static domain::ChatAction Parse(const std::string& rawReply);

    /**
     * @brief Trims, drops a leading ``` fence (with optional language tag) and a
     * trailing ``` fence, then trims again.
     */
    static std::string StripCodeFence(const std::string& text);

    /** @brief Wire form, e.g. `{"action":"insert_node","insert_after":2,...}`. */
    static nlohmann::json ToJson(const domain::ChatAction& action);
};

} // namespace noteagent::application
