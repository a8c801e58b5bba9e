#include "auth/secret_hash.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "utils/common.hpp"

namespace runbox::auth {
namespace {

constexpr std::size_t kSaltBytes = 16;
constexpr std::size_t kDigestBytes = 32;
constexpr std::size_t kMaxDigestBytes = 64;

std::string ToHex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<std::string> SplitFields(const std::string& value, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    fields.push_back(current);
    return fields;
}

bool Derive(const std::string& secret,
            const std::string& salt,
            int iterations,
            std::size_t length,
            std::vector<unsigned char>& out) {
    out.assign(length, 0);
    return PKCS5_PBKDF2_HMAC(secret.data(),
                             static_cast<int>(secret.size()),
                             reinterpret_cast<const unsigned char*>(salt.data()),
                             static_cast<int>(salt.size()),
                             iterations,
                             EVP_sha256(),
                             static_cast<int>(length),
                             out.data()) == 1;
}

}  // namespace

bool IsHashedSecret(const std::string& stored) {
    const std::string prefix = std::string(kHashPrefix) + "$";
    return stored.compare(0, prefix.size(), prefix) == 0;
}

std::string HashSecretWithSalt(const std::string& secret, const std::string& salt, int iterations) {
    if (iterations <= 0) {
        throw std::invalid_argument("iterations must be positive");
    }
    if (salt.empty() || salt.find('$') != std::string::npos) {
        throw std::invalid_argument("salt must be non-empty and must not contain '$'");
    }
    std::vector<unsigned char> digest;
    if (!Derive(secret, salt, iterations, kDigestBytes, digest)) {
        throw std::runtime_error("PBKDF2 derivation failed");
    }
    std::ostringstream oss;
    oss << kHashPrefix << '$' << iterations << '$' << salt << '$'
        << ToHex(digest.data(), digest.size());
    return oss.str();
}

std::string HashSecret(const std::string& secret, int iterations) {
    unsigned char salt[kSaltBytes];
    if (RAND_bytes(salt, static_cast<int>(sizeof(salt))) != 1) {
        throw std::runtime_error("failed to generate salt");
    }
    return HashSecretWithSalt(secret, ToHex(salt, sizeof(salt)), iterations);
}

bool VerifySecret(const std::string& stored, const std::string& candidate) {
    if (!IsHashedSecret(stored)) {
        return stored == candidate;
    }

    const auto fields = SplitFields(stored, '$');
    if (fields.size() != 4) {
        return false;
    }
    int iterations = 0;
    try {
        iterations = std::stoi(fields[1]);
    } catch (const std::exception&) {
        return false;
    }
    const auto& salt = fields[2];
    const auto expected = utils::ToLower(fields[3]);
    if (iterations <= 0 || salt.empty() || expected.empty() || expected.size() % 2 != 0
        || expected.size() / 2 > kMaxDigestBytes) {
        return false;
    }

    std::vector<unsigned char> digest;
    if (!Derive(candidate, salt, iterations, expected.size() / 2, digest)) {
        return false;
    }
    const auto actual = ToHex(digest.data(), digest.size());
    return CRYPTO_memcmp(actual.data(), expected.data(), expected.size()) == 0;
}

}  // namespace runbox::auth
