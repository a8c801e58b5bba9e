#include "session/protocol.hpp"

#include "utils/common.hpp"

namespace runbox::session {
namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

std::string StringField(const nlohmann::json& json, const char* key) {
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return {};
}

// Expected length of the sequence starting with lead, 0 when lead is invalid.
std::size_t SequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

bool ValidContinuation(unsigned char lead, std::size_t index, unsigned char byte) {
    if ((byte & 0xC0) != 0x80) {
        return false;
    }
    if (index != 1) {
        return true;
    }
    // Reject overlongs, surrogates and code points above U+10FFFF.
    if (lead == 0xE0) {
        return byte >= 0xA0;
    }
    if (lead == 0xED) {
        return byte <= 0x9F;
    }
    if (lead == 0xF0) {
        return byte >= 0x90;
    }
    if (lead == 0xF4) {
        return byte <= 0x8F;
    }
    return true;
}

}  // namespace

std::optional<SessionRequest> ParseSessionRequest(const std::string& text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    SessionRequest request;
    request.identity = utils::Trim(StringField(json, "identity"));
    request.secret = utils::Trim(StringField(json, "secret"));
    request.program = StringField(json, "program");
    return request;
}

std::optional<LoginRequest> ParseLoginRequest(const std::string& text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    LoginRequest request;
    request.identity = utils::Trim(StringField(json, "identity"));
    request.secret = utils::Trim(StringField(json, "secret"));
    return request;
}

std::optional<std::string> ParseInputMessage(const std::string& text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    if (StringField(json, "type") != "input" || !json.contains("data") || !json["data"].is_string()) {
        return std::nullopt;
    }
    return json["data"].get<std::string>();
}

nlohmann::json MakeOutputMessage(const std::string& data) {
    return {{"type", "output"}, {"data", data}};
}

nlohmann::json MakeEndMessage(int code) {
    return {{"type", "end"}, {"code", code}};
}

nlohmann::json MakeNotice(const std::string& text) {
    return MakeOutputMessage("\n" + text + "\n");
}

std::string Utf8Sanitizer::Feed(const std::string& chunk) {
    const std::string data = carry_ + chunk;
    carry_.clear();

    std::string out;
    out.reserve(data.size());
    std::size_t i = 0;
    while (i < data.size()) {
        const auto lead = static_cast<unsigned char>(data[i]);
        const auto length = SequenceLength(lead);
        if (length == 0) {
            out += kReplacement;
            ++i;
            continue;
        }
        if (length == 1) {
            out.push_back(data[i]);
            ++i;
            continue;
        }
        std::size_t valid = 1;
        while (valid < length && i + valid < data.size()
               && ValidContinuation(lead, valid, static_cast<unsigned char>(data[i + valid]))) {
            ++valid;
        }
        if (valid == length) {
            out.append(data, i, length);
            i += length;
        } else if (i + valid == data.size()) {
            // Truncated by the chunk boundary: wait for the rest.
            carry_ = data.substr(i);
            break;
        } else {
            out += kReplacement;
            i += valid;
        }
    }
    return out;
}

std::string Utf8Sanitizer::Flush() {
    if (carry_.empty()) {
        return {};
    }
    carry_.clear();
    return kReplacement;
}

std::string SanitizeUtf8(const std::string& text) {
    Utf8Sanitizer sanitizer;
    auto out = sanitizer.Feed(text);
    out += sanitizer.Flush();
    return out;
}

}  // namespace runbox::session
