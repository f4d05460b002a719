#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// Error taxonomy shared by every voice component
// ------------------------------------------------------------
enum class ErrorKind {
    CaptureUnavailable,   // permission / hardware busy / already capturing
    RecognitionFailure,   // engine error or no hypothesis
    NetworkFailure,       // send or synthesis request failed
    DecodeFailure,        // malformed or undecodable audio
    ConfigurationFailure, // hardware session could not switch modes
    NoSpeech              // non-fatal: nothing to send
};

// ERR_* code used to look up user/debug messages
const char* errorCode(ErrorKind kind);
const char* errorKindName(ErrorKind kind);

class VoiceError : public std::runtime_error {
public:
    VoiceError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    const char* code() const { return errorCode(kind_); }

private:
    ErrorKind kind_;
};

// ------------------------------------------------------------
// Notice: transient message handed to the presentation layer
// ------------------------------------------------------------
struct Notice {
    ErrorKind kind;
    std::string code;     // ERR_* key
    std::string message;  // user-facing text
    std::string detail;   // debug text (exception what(), HTTP status, ...)
};

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from errors.json (or an already parsed document)
    void load(const std::string& path);
    void load(const nlohmann::json& doc);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the debug message for the error and build a Notice
    Notice report(const VoiceError& error);
    Notice report(ErrorKind kind, const std::string& detail = "");
}
