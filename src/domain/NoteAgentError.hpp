/**
 * @file NoteAgentError.hpp
 * @brief Error type shared by the document model, the action parser and the agent runtime.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace noteagent::domain {

/**
 * @enum ErrorKind
 * @brief Recoverable failure categories. None of them is fatal to the process.
 */
enum class ErrorKind {
    UnrecognizedNodeType,     ///< Unknown node "type" discriminator in a document.
    MalformedDocument,        ///< Required document field missing or mistyped.
    UnsupportedFormatVersion, ///< Root schema version is not one we understand.
    MalformedActionJson,      ///< Reply looks like JSON but does not parse.
    MalformedActionShape,     ///< Reply parsed, but the named action lacks required fields.
    UnsupportedActionType,    ///< Explicit "action" value outside the known set.
    AgentNotRunning,          ///< Chat submitted before the runtime was started.
    InvalidNodeReference,     ///< Edit addresses a node index outside the note.
    ConfigurationError        ///< settings.json unreadable or mistyped.
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnrecognizedNodeType: return "UnrecognizedNodeType";
        case ErrorKind::MalformedDocument: return "MalformedDocument";
        case ErrorKind::UnsupportedFormatVersion: return "UnsupportedFormatVersion";
        case ErrorKind::MalformedActionJson: return "MalformedActionJson";
        case ErrorKind::MalformedActionShape: return "MalformedActionShape";
        case ErrorKind::UnsupportedActionType: return "UnsupportedActionType";
        case ErrorKind::AgentNotRunning: return "AgentNotRunning";
        case ErrorKind::InvalidNodeReference: return "InvalidNodeReference";
        case ErrorKind::ConfigurationError: return "ConfigurationError";
    }
    return "Unknown";
}

/**
 * @class NoteAgentError
 * @brief Exception carrying an ErrorKind plus a diagnostic detail (node path, raw action value, ...).
 */
class NoteAgentError : public std::runtime_error {
public:
    NoteAgentError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(std::string(ErrorKindToString(kind)) + ": " + detail),
          m_kind(kind),
          m_detail(detail) {}

    ErrorKind kind() const { return m_kind; }
    const std::string& detail() const { return m_detail; }

private:
    ErrorKind m_kind;
    std::string m_detail;
};

} // namespace noteagent::domain
