#include "chat_client.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "speech/tts_backend.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace Chat {

std::string alternateLoopback(const std::string& baseUrl) {
    static const std::string ip = "127.0.0.1";
    static const std::string host = "localhost";

    std::string alt = baseUrl;
    auto pos = alt.find(ip);
    if (pos != std::string::npos) return alt.replace(pos, ip.size(), host);
    pos = alt.find(host);
    if (pos != std::string::npos) return alt.replace(pos, host.size(), ip);
    return "";
}

BackendChatClient::BackendChatClient(const VoiceSettings& settings)
    : baseUrl_(settings.backendUrl),
      requestTimeoutMs_(settings.requestTimeoutMs),
      resourceTimeoutMs_(settings.resourceTimeoutMs) {}

Reply BackendChatClient::post(const std::string& baseUrl, const std::string& body, bool& connectFailed) {
    connectFailed = false;
    std::string url = Speech::joinUrl(baseUrl, "/api/chat");
    LOG_DEBUG("Chat", "POST " + url);

    auto resp = cpr::Post(
        cpr::Url{url},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body},
        cpr::ConnectTimeout{requestTimeoutMs_},
        cpr::Timeout{resourceTimeoutMs_}
    );

    if (resp.error.code != cpr::ErrorCode::OK) {
        connectFailed = (resp.error.code == cpr::ErrorCode::COULDNT_CONNECT);
        throw VoiceError(ErrorKind::NetworkFailure, "Chat request failed: " + resp.error.message);
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw VoiceError(ErrorKind::NetworkFailure,
                         "Chat request: HTTP " + std::to_string(resp.status_code) + " " + resp.text);
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("response") || !j["response"].is_string()) {
        throw VoiceError(ErrorKind::NetworkFailure, "Malformed chat reply");
    }

    Reply reply;
    reply.content = j["response"].get<std::string>();
    if (j.contains("conversation_id") && j["conversation_id"].is_string()) {
        reply.conversationId = j["conversation_id"].get<std::string>();
    }
    return reply;
}

Reply BackendChatClient::sendMessage(const std::string& text) {
    if (baseUrl_.empty()) {
        throw VoiceError(ErrorKind::NetworkFailure, "Backend URL not configured");
    }

    std::string body = nlohmann::json{
        {"message", text},
        {"conversation_history", nlohmann::json::array()}
    }.dump();

    const std::string alternate = alternateLoopback(baseUrl_);
    bool connectFailed = false;
    try {
        return post(baseUrl_, body, connectFailed);
    } catch (const VoiceError&) {
        if (!connectFailed || alternate.empty()) throw;
        LOG_DEBUG("Chat", "Connection refused, retrying via " + alternate);
    }
    return post(alternate, body, connectFailed);
}

} // namespace Chat
