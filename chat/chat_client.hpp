#pragma once
#include <optional>
#include <string>

#include "settings.hpp"

namespace Chat {

struct Reply {
    std::string content;
    std::optional<std::string> conversationId;
};

// ------------------------------------------------------------
// Collaborator: the conversational backend.
// sendMessage() throws VoiceError(NetworkFailure).
// ------------------------------------------------------------
class Collaborator {
public:
    virtual ~Collaborator() = default;
    virtual Reply sendMessage(const std::string& text) = 0;
};

/// BackendChatClient
/// POST {base}/api/chat with {"message", "conversation_history": []}.
/// A refused connection on a loopback URL is retried once with the other
/// spelling (127.0.0.1 <-> localhost).
class BackendChatClient : public Collaborator {
public:
    explicit BackendChatClient(const VoiceSettings& settings);

    Reply sendMessage(const std::string& text) override;

private:
    Reply post(const std::string& baseUrl, const std::string& body, bool& connectFailed);

    std::string baseUrl_;
    int requestTimeoutMs_;
    int resourceTimeoutMs_;
};

// "http://127.0.0.1:8000" <-> "http://localhost:8000"; empty when not loopback
std::string alternateLoopback(const std::string& baseUrl);

} // namespace Chat
