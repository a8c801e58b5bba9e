#include "auth/credential_store.hpp"

#include <fstream>
#include <sstream>

#include "auth/secret_hash.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::auth {

std::optional<CredentialEntry> ParseCredentialLine(const std::string& line) {
    const auto trimmed = utils::Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
        return std::nullopt;
    }
    const auto colon = trimmed.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    CredentialEntry entry;
    entry.identity = utils::Trim(trimmed.substr(0, colon));
    entry.secret = utils::Trim(trimmed.substr(colon + 1));
    if (entry.identity.empty()) {
        return std::nullopt;
    }
    return entry;
}

std::vector<CredentialEntry> ParseCredentials(const std::string& content) {
    std::vector<CredentialEntry> entries;
    std::istringstream input(content);
    std::string line;
    while (std::getline(input, line)) {
        if (auto entry = ParseCredentialLine(line)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

CredentialStore::CredentialStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::optional<std::string> CredentialStore::Lookup(const std::string& identity) const {
    std::ifstream input(path_);
    if (!input.is_open()) {
        utils::LogWarn("system", "Credential file not readable: " + path_.string());
        return std::nullopt;
    }
    std::string line;
    while (std::getline(input, line)) {
        auto entry = ParseCredentialLine(line);
        if (entry && entry->identity == identity) {
            return entry->secret;
        }
    }
    return std::nullopt;
}

bool CredentialStore::Verify(const std::string& identity, const std::string& secret) const {
    if (identity.empty()) {
        return false;
    }
    const auto stored = Lookup(identity);
    if (!stored || stored->empty()) {
        return false;
    }
    return VerifySecret(*stored, secret);
}

}  // namespace runbox::auth
