#pragma once

#include <string>

namespace runbox::auth {

constexpr int kDefaultHashIterations = 200000;
constexpr const char* kHashPrefix = "pbkdf2_sha256";

// Stored form: pbkdf2_sha256$<iterations>$<salt>$<hex digest>.
bool IsHashedSecret(const std::string& stored);
std::string HashSecret(const std::string& secret, int iterations = kDefaultHashIterations);
std::string HashSecretWithSalt(const std::string& secret, const std::string& salt, int iterations);

// Hashed values are checked in constant time, anything else must match exactly.
bool VerifySecret(const std::string& stored, const std::string& candidate);

}  // namespace runbox::auth
