#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runbox::auth {

struct CredentialEntry {
    std::string identity;
    std::string secret;
};

// Parses "identity:secret" lines. Split at the first ':', whitespace trimmed,
// blank lines and '#' comments skipped, malformed lines ignored.
std::vector<CredentialEntry> ParseCredentials(const std::string& content);
std::optional<CredentialEntry> ParseCredentialLine(const std::string& line);

class CredentialStore {
public:
    explicit CredentialStore(std::filesystem::path path);

    // The file is re-read on every call so edits apply without a restart.
    bool Verify(const std::string& identity, const std::string& secret) const;
    std::optional<std::string> Lookup(const std::string& identity) const;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace runbox::auth
