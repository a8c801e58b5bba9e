#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "admission/admission_controller.hpp"
#include "auth/authenticator.hpp"
#include "auth/credential_store.hpp"
#include "fakes.hpp"
#include "guard/abuse_guard.hpp"
#include "sandbox/docker_client.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "session/session_handler.hpp"

// Runs real containers; opt in with RUNBOX_DOCKER_TESTS=1 on a host with a
// Docker engine and the configured image already pulled.
namespace runbox {
namespace {

using testing::FakeChannel;

class DockerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* enabled = std::getenv("RUNBOX_DOCKER_TESTS");
        if (enabled == nullptr || std::string(enabled) != "1") {
            GTEST_SKIP() << "set RUNBOX_DOCKER_TESTS=1 to run against a Docker engine";
        }
        const char* socket = std::getenv("DOCKER_SOCKET");
        client_ = std::make_shared<sandbox::DockerClient>(socket ? socket : "/var/run/docker.sock", "v1.41");
        if (!client_->Ping()) {
            GTEST_SKIP() << "Docker engine not reachable";
        }
        const char* image = std::getenv("RUNBOX_TEST_IMAGE");
        policy_.image = image ? image : "python:3.14-alpine";
        if (!client_->ImageExists(policy_.image)) {
            GTEST_SKIP() << policy_.image << " is not pulled";
        }

        root_ = testing::MakeTempDir("runbox_docker_");
        testing::WriteFile(root_ / "students.txt", "alice:wonderland\n");
        guard_ = std::make_unique<guard::AbuseGuard>(5, std::chrono::seconds(600));
        authenticator_ = std::make_unique<auth::Authenticator>(
            *guard_, auth::CredentialStore(root_ / "students.txt"), std::chrono::milliseconds(0));
        admission_ = std::make_unique<admission::AdmissionController>(2);
        provisioner_ = std::make_unique<sandbox::DockerProvisioner>(client_, policy_, root_ / "workspaces");

        options_.timeout = std::chrono::seconds(20);
        handler_ = std::make_unique<session::SessionHandler>(
            *admission_, *authenticator_, *provisioner_, options_);
    }

    void TearDown() override {
        if (!root_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
        }
    }

    static nlohmann::json Request(const std::string& program) {
        return {{"identity", "alice"}, {"secret", "wonderland"}, {"program", program}};
    }

    std::shared_ptr<sandbox::DockerClient> client_;
    sandbox::SandboxPolicy policy_;
    std::filesystem::path root_;
    std::unique_ptr<guard::AbuseGuard> guard_;
    std::unique_ptr<auth::Authenticator> authenticator_;
    std::unique_ptr<admission::AdmissionController> admission_;
    std::unique_ptr<sandbox::DockerProvisioner> provisioner_;
    session::WatchdogOptions options_;
    std::unique_ptr<session::SessionHandler> handler_;
};

TEST_F(DockerIntegrationTest, RunsProgramAndRemovesContainer) {
    FakeChannel channel;
    channel.PushJson(Request("print('hi')\n"));
    handler_->Handle(channel);

    EXPECT_NE(channel.OutputText().find("hi"), std::string::npos);
    EXPECT_EQ(channel.EndCode(), 0);
    EXPECT_TRUE(channel.LastIsEnd());
    EXPECT_TRUE(client_->ListContainers(sandbox::kSessionLabel).empty());
    EXPECT_EQ(admission_->HeldSlots(), 0u);
}

TEST_F(DockerIntegrationTest, NetworkIsUnreachable) {
    FakeChannel channel;
    channel.PushJson(Request(
        "import socket\n"
        "try:\n"
        "    socket.create_connection(('1.1.1.1', 53), timeout=2)\n"
        "    print('online')\n"
        "except OSError:\n"
        "    print('offline')\n"));
    handler_->Handle(channel);

    EXPECT_NE(channel.OutputText().find("offline"), std::string::npos);
    EXPECT_EQ(channel.EndCode(), 0);
}

TEST_F(DockerIntegrationTest, ReadsInteractiveInput) {
    FakeChannel channel;
    channel.PushJson(Request("name = input('who? ')\nprint('hello ' + name)\n"));
    channel.PushJson({{"type", "input"}, {"data", "bob\n"}});
    handler_->Handle(channel);

    EXPECT_NE(channel.OutputText().find("hello bob"), std::string::npos);
    EXPECT_EQ(channel.EndCode(), 0);
}

}  // namespace
}  // namespace runbox
