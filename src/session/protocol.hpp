#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace runbox::session {

struct SessionRequest {
    std::string identity;
    std::string secret;
    std::string program;
};

struct LoginRequest {
    std::string identity;
    std::string secret;
};

// First WebSocket message. std::nullopt when the text is not a JSON object.
// Absent fields become empty strings; identity and secret are trimmed.
std::optional<SessionRequest> ParseSessionRequest(const std::string& text);
std::optional<LoginRequest> ParseLoginRequest(const std::string& text);

// Payload of a {"type":"input","data":...} message, std::nullopt for anything else.
std::optional<std::string> ParseInputMessage(const std::string& text);

nlohmann::json MakeOutputMessage(const std::string& data);
nlohmann::json MakeEndMessage(int code);
// Notices are framed by newlines so they stand apart from program output.
nlohmann::json MakeNotice(const std::string& text);

// Incremental UTF-8 cleaner for chunked output. A sequence split across chunks
// is carried over; invalid bytes become U+FFFD.
class Utf8Sanitizer {
public:
    std::string Feed(const std::string& chunk);
    std::string Flush();

private:
    std::string carry_;
};

std::string SanitizeUtf8(const std::string& text);

}  // namespace runbox::session
