#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "auth/credential_store.hpp"
#include "auth/secret_hash.hpp"
#include "fakes.hpp"

namespace runbox::auth {
namespace {

class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = runbox::testing::MakeTempDir("runbox_creds_");
        path_ = dir_ / "students.txt";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

TEST(CredentialParsingTest, SkipsBlankAndCommentLines) {
    const auto entries = ParseCredentials("\n# header\n   \nalice:one\n  # indented comment\nbob:two\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].identity, "alice");
    EXPECT_EQ(entries[0].secret, "one");
    EXPECT_EQ(entries[1].identity, "bob");
    EXPECT_EQ(entries[1].secret, "two");
}

TEST(CredentialParsingTest, SplitsAtFirstColonAndTrims) {
    const auto entry = ParseCredentialLine("  dave :  pa:ss:word \r");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->identity, "dave");
    EXPECT_EQ(entry->secret, "pa:ss:word");
}

TEST(CredentialParsingTest, IgnoresLinesWithoutSeparator) {
    EXPECT_FALSE(ParseCredentialLine("no separator here").has_value());
    EXPECT_FALSE(ParseCredentialLine(":orphan").has_value());
}

TEST_F(CredentialStoreTest, VerifiesPlainSecrets) {
    runbox::testing::WriteFile(path_, "alice:wonderland\nbob:builder\n");
    CredentialStore store(path_);
    EXPECT_TRUE(store.Verify("alice", "wonderland"));
    EXPECT_FALSE(store.Verify("alice", "builder"));
    EXPECT_FALSE(store.Verify("mallory", "wonderland"));
    EXPECT_FALSE(store.Verify("", ""));
}

TEST_F(CredentialStoreTest, EmptyStoredSecretNeverMatches) {
    runbox::testing::WriteFile(path_, "ghost:\n");
    CredentialStore store(path_);
    EXPECT_FALSE(store.Verify("ghost", ""));
}

TEST_F(CredentialStoreTest, MissingFileAcceptsNobody) {
    CredentialStore store(dir_ / "absent.txt");
    EXPECT_FALSE(store.Verify("alice", "wonderland"));
    EXPECT_FALSE(store.Lookup("alice").has_value());
}

TEST_F(CredentialStoreTest, PicksUpEditsWithoutRestart) {
    runbox::testing::WriteFile(path_, "alice:old\n");
    CredentialStore store(path_);
    EXPECT_TRUE(store.Verify("alice", "old"));

    runbox::testing::WriteFile(path_, "alice:new\n");
    EXPECT_FALSE(store.Verify("alice", "old"));
    EXPECT_TRUE(store.Verify("alice", "new"));
}

TEST_F(CredentialStoreTest, VerifiesHashedSecrets) {
    runbox::testing::WriteFile(path_, "erin:" + HashSecret("s3cret", 1000) + "\n");
    CredentialStore store(path_);
    EXPECT_TRUE(store.Verify("erin", "s3cret"));
    EXPECT_FALSE(store.Verify("erin", "s3cret "));
    EXPECT_FALSE(store.Verify("erin", "wrong"));
}

TEST(SecretHashTest, MatchesKnownPbkdf2Vector) {
    EXPECT_EQ(HashSecretWithSalt("password", "salt", 1),
              "pbkdf2_sha256$1$salt$120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
}

TEST(SecretHashTest, RandomSaltsDiffer) {
    const auto first = HashSecret("same", 1000);
    const auto second = HashSecret("same", 1000);
    EXPECT_NE(first, second);
    EXPECT_TRUE(IsHashedSecret(first));
    EXPECT_TRUE(VerifySecret(first, "same"));
    EXPECT_TRUE(VerifySecret(second, "same"));
}

TEST(SecretHashTest, MalformedHashesNeverVerify) {
    EXPECT_FALSE(VerifySecret("pbkdf2_sha256$abc$salt$00", "x"));
    EXPECT_FALSE(VerifySecret("pbkdf2_sha256$1$salt", "x"));
    EXPECT_FALSE(VerifySecret("pbkdf2_sha256$0$salt$00", "x"));
    EXPECT_FALSE(VerifySecret("pbkdf2_sha256$1$salt$abc", "x"));
}

TEST(SecretHashTest, PlainValuesCompareExactly) {
    EXPECT_FALSE(IsHashedSecret("wonderland"));
    EXPECT_TRUE(VerifySecret("wonderland", "wonderland"));
    EXPECT_FALSE(VerifySecret("wonderland", "Wonderland"));
}

}  // namespace
}  // namespace runbox::auth
