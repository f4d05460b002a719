#include "error_manager.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>

// ------------------------------------------------------------
// Kind → code table
// ------------------------------------------------------------
const char* errorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CaptureUnavailable:   return "ERR_CAPTURE_UNAVAILABLE";
        case ErrorKind::RecognitionFailure:   return "ERR_RECOGNITION_FAILURE";
        case ErrorKind::NetworkFailure:       return "ERR_NETWORK_FAILURE";
        case ErrorKind::DecodeFailure:        return "ERR_DECODE_FAILURE";
        case ErrorKind::ConfigurationFailure: return "ERR_AUDIO_SESSION_CONFIG";
        case ErrorKind::NoSpeech:             return "ERR_VOICE_NO_SPEECH";
    }
    return "ERR_UNKNOWN";
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CaptureUnavailable:   return "CaptureUnavailable";
        case ErrorKind::RecognitionFailure:   return "RecognitionFailure";
        case ErrorKind::NetworkFailure:       return "NetworkFailure";
        case ErrorKind::DecodeFailure:        return "DecodeFailure";
        case ErrorKind::ConfigurationFailure: return "ConfigurationFailure";
        case ErrorKind::NoSpeech:             return "NoSpeech";
    }
    return "Unknown";
}

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
namespace {
    std::mutex g_errorsMutex;
    nlohmann::json g_root = nlohmann::json::object();
}

void ErrorManager::load(const nlohmann::json& doc) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (doc.contains("errors") && doc["errors"].is_object()) {
        g_root = doc["errors"];
    } else if (doc.is_object()) {
        g_root = doc;
    } else {
        g_root = nlohmann::json::object();
    }
}

void ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return;
    }

    try {
        nlohmann::json doc;
        in >> doc;
        load(doc);
        LOG_DEBUG("ErrorManager", "Loaded error codes from: " + fs::absolute(path).string());
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("user")) {
        return g_root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("debug")) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

Notice ErrorManager::report(ErrorKind kind, const std::string& detail) {
    Notice notice;
    notice.kind    = kind;
    notice.code    = errorCode(kind);
    notice.message = getUserMessage(notice.code);
    notice.detail  = detail;

    std::string line = notice.code + " -> " + getDebugMessage(notice.code);
    if (!detail.empty()) line += " (" + detail + ")";

    if (kind == ErrorKind::NoSpeech) {
        LOG_DEBUG("ErrorManager", line);
    } else {
        LOG_ERROR("ErrorManager", line);
    }
    return notice;
}

Notice ErrorManager::report(const VoiceError& error) {
    return report(error.kind(), error.what());
}
