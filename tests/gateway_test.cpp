#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>

#include "auth/authenticator.hpp"
#include "auth/credential_store.hpp"
#include "fakes.hpp"
#include "admission/admission_controller.hpp"
#include "guard/abuse_guard.hpp"
#include "server/http_session.hpp"
#include "server/listener.hpp"
#include "server/server.hpp"
#include "server/websocket_channel.hpp"
#include "session/session_handler.hpp"

namespace runbox {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

using Response = http::response<http::string_body>;

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = testing::MakeTempDir("runbox_gateway_");
        testing::WriteFile(root_ / "students.txt", "alice:wonderland\n");

        guard_ = std::make_unique<guard::AbuseGuard>(
            2, std::chrono::seconds(60), [this]() { return now_; });
        authenticator_ = std::make_unique<auth::Authenticator>(
            *guard_, auth::CredentialStore(root_ / "students.txt"), kFailureDelay);
        routes_ = std::make_unique<server::GatewayRoutes>(server::GatewayRoutes{
            *authenticator_, [this](std::shared_ptr<server::WebSocketChannel> channel) {
                {
                    std::lock_guard<std::mutex> lock(opened_mutex_);
                    opened_.push_back(std::move(channel));
                }
                opened_cv_.notify_all();
            }});

        const tcp::endpoint endpoint{net::ip::make_address("127.0.0.1"), 0};
        listener_ = std::make_shared<server::Listener>(ioc_, endpoint, *routes_);
        listener_->Run();
        work_.emplace(net::make_work_guard(ioc_));
        io_thread_ = std::thread([this]() { ioc_.run(); });
    }

    void TearDown() override {
        listener_->Stop();
        {
            std::lock_guard<std::mutex> lock(opened_mutex_);
            for (const auto& channel : opened_) {
                channel->Close();
            }
        }
        work_.reset();
        ioc_.stop();
        io_thread_.join();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    tcp::endpoint Endpoint() const {
        return {net::ip::make_address("127.0.0.1"), listener_->Port()};
    }

    Response Call(http::verb verb, const std::string& target, const std::string& body = {}) {
        net::io_context ioc;
        tcp::socket socket(ioc);
        socket.connect(Endpoint());

        http::request<http::string_body> request{verb, target, 11};
        request.set(http::field::host, "127.0.0.1");
        if (!body.empty()) {
            request.set(http::field::content_type, "application/json");
            request.body() = body;
        }
        request.prepare_payload();
        http::write(socket, request);

        beast::flat_buffer buffer;
        Response response;
        http::read(socket, buffer, response);
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    static nlohmann::json Body(const Response& response) {
        return nlohmann::json::parse(response.body(), nullptr, false);
    }

    std::shared_ptr<server::WebSocketChannel> WaitForChannel() {
        std::unique_lock<std::mutex> lock(opened_mutex_);
        opened_cv_.wait_for(lock, std::chrono::seconds(5), [this] { return !opened_.empty(); });
        return opened_.empty() ? nullptr : opened_.back();
    }

    static constexpr std::chrono::milliseconds kFailureDelay{200};

    std::filesystem::path root_;
    guard::AbuseGuard::Clock::time_point now_ = guard::AbuseGuard::Clock::time_point{} + std::chrono::hours(1);
    std::unique_ptr<guard::AbuseGuard> guard_;
    std::unique_ptr<auth::Authenticator> authenticator_;
    std::unique_ptr<server::GatewayRoutes> routes_;

    net::io_context ioc_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::shared_ptr<server::Listener> listener_;
    std::thread io_thread_;

    std::mutex opened_mutex_;
    std::condition_variable opened_cv_;
    std::vector<std::shared_ptr<server::WebSocketChannel>> opened_;
};

TEST_F(GatewayTest, LoginWithValidCredentialsSucceeds) {
    const auto response = Call(http::verb::post, "/login", R"({"identity":" alice ","secret":"wonderland"})");
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::content_type], "application/json");
    EXPECT_EQ(Body(response), nlohmann::json({{"success", true}}));
}

TEST_F(GatewayTest, RejectedLoginIsAnsweredAfterFailureDelay) {
    const auto start = std::chrono::steady_clock::now();
    const auto response = Call(http::verb::post, "/login", R"({"identity":"alice","secret":"nope"})");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(Body(response), nlohmann::json({{"success", false}}));
    EXPECT_GE(elapsed, kFailureDelay);
    EXPECT_EQ(guard_->FailureCount("127.0.0.1"), 1);
}

TEST_F(GatewayTest, RepeatedFailuresAreRateLimitedWithWaitMessage) {
    Call(http::verb::post, "/login", R"({"identity":"alice","secret":"x"})");
    Call(http::verb::post, "/login", R"({"identity":"alice","secret":"y"})");

    // The cooldown applies to the origin, even with the right secret.
    const auto start = std::chrono::steady_clock::now();
    const auto response = Call(http::verb::post, "/login", R"({"identity":"alice","secret":"wonderland"})");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    const auto body = Body(response);
    EXPECT_EQ(body.value("success", true), false);
    EXPECT_EQ(body.value("msg", ""), "Wait 60s before trying again.");
    EXPECT_LT(elapsed, kFailureDelay);

    now_ += std::chrono::seconds(61);
    EXPECT_EQ(Body(Call(http::verb::post, "/login", R"({"identity":"alice","secret":"wonderland"})")),
              nlohmann::json({{"success", true}}));
}

TEST_F(GatewayTest, MalformedLoginBodyIsBadRequest) {
    EXPECT_EQ(Call(http::verb::post, "/login", "{ not json").result(), http::status::bad_request);
    EXPECT_EQ(Call(http::verb::post, "/login", "[1, 2]").result(), http::status::bad_request);
    EXPECT_EQ(guard_->FailureCount("127.0.0.1"), 0);
}

TEST_F(GatewayTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(Call(http::verb::get, "/login").result(), http::status::method_not_allowed);
    EXPECT_EQ(Call(http::verb::get, "/nowhere").result(), http::status::not_found);
    EXPECT_EQ(Call(http::verb::get, "/ws").result(), http::status::upgrade_required);
}

TEST_F(GatewayTest, ChannelKeepsOrderAndFlushesBeforeClosing) {
    net::io_context ioc;
    websocket::stream<tcp::socket> client(ioc);
    client.next_layer().connect(Endpoint());
    client.handshake("127.0.0.1", "/ws");

    auto channel = WaitForChannel();
    ASSERT_NE(channel, nullptr);
    EXPECT_EQ(channel->Origin(), "127.0.0.1");

    client.text(true);
    client.write(net::buffer(std::string(R"({"type":"input","data":"hi\n"})")));
    const auto received = channel->Receive(std::chrono::seconds(2));
    ASSERT_EQ(received.status, session::ReceiveStatus::kMessage);
    EXPECT_EQ(received.text, R"({"type":"input","data":"hi\n"})");

    // A small queue limit makes Send wait on the client instead of dropping.
    channel->SetSendLimits(4096, std::chrono::seconds(5));
    constexpr int kMessages = 300;
    std::thread sender([channel]() {
        const std::string padding(100, '.');
        for (int i = 0; i < kMessages; ++i) {
            channel->Send({{"type", "output"}, {"data", std::to_string(i) + padding}});
        }
        channel->Send({{"type", "end"}, {"code", 0}});
        channel->Close();
    });

    std::vector<nlohmann::json> messages;
    beast::error_code ec;
    while (true) {
        beast::flat_buffer buffer;
        client.read(buffer, ec);
        if (ec) {
            break;
        }
        messages.push_back(nlohmann::json::parse(beast::buffers_to_string(buffer.data())));
    }
    sender.join();

    EXPECT_TRUE(ec == websocket::error::closed) << ec.message();
    ASSERT_EQ(messages.size(), static_cast<std::size_t>(kMessages + 1));
    for (int i = 0; i < kMessages; ++i) {
        EXPECT_EQ(messages[static_cast<std::size_t>(i)]["data"].get<std::string>().substr(0, std::to_string(i).size()),
                  std::to_string(i));
    }
    EXPECT_EQ(messages.back(), nlohmann::json({{"type", "end"}, {"code", 0}}));
    EXPECT_EQ(channel->Receive(std::chrono::milliseconds(10)).status, session::ReceiveStatus::kClosed);
}

TEST_F(GatewayTest, ClientThatStopsReadingIsDisconnectedWithBoundedQueue) {
    net::io_context ioc;
    websocket::stream<tcp::socket> client(ioc);
    client.next_layer().connect(Endpoint());
    client.handshake("127.0.0.1", "/ws");

    auto channel = WaitForChannel();
    ASSERT_NE(channel, nullptr);
    constexpr std::size_t kLimit = 64 * 1024;
    channel->SetSendLimits(kLimit, std::chrono::milliseconds(300));

    const std::string chunk(1024, 'x');
    std::size_t peak = 0;
    std::size_t sent = 0;
    for (int i = 0; i < 200000 && !channel->IsClosing(); ++i) {
        channel->Send({{"type", "output"}, {"data", chunk}});
        sent += chunk.size();
        peak = std::max(peak, channel->QueuedBytes());
    }

    EXPECT_TRUE(channel->IsClosing());
    EXPECT_LE(peak, kLimit + 2 * chunk.size());
    EXPECT_LT(sent, 200000u * chunk.size());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!channel->IsClosed() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(channel->IsClosed());
    EXPECT_EQ(channel->QueuedBytes(), 0u);
    EXPECT_EQ(channel->Receive(std::chrono::milliseconds(10)).status, session::ReceiveStatus::kClosed);
}

TEST_F(GatewayTest, StoppingServerEndsLiveSessionsBeforeDestruction) {
    admission::AdmissionController admission(2);
    auto script = std::make_shared<testing::SandboxScript>();
    script->exit_immediately = false;
    testing::FakeProvisioner provisioner(script, root_ / "workspaces");
    session::WatchdogOptions options;
    options.poll_interval = std::chrono::milliseconds(10);
    session::SessionHandler handler(admission, *authenticator_, provisioner, options);

    config::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.io_threads = 1;

    for (int round = 0; round < 5; ++round) {
        auto gateway = std::make_unique<server::Server>(config, *authenticator_, handler);
        gateway->Start();

        net::io_context ioc;
        websocket::stream<tcp::socket> client(ioc);
        client.next_layer().connect({net::ip::make_address("127.0.0.1"), gateway->Port()});
        client.handshake("127.0.0.1", "/ws");
        client.text(true);
        client.write(net::buffer(std::string(R"json({"identity":"alice","secret":"wonderland","program":"input()"})json")));

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (admission.ActiveIdentities() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_EQ(gateway->LiveSessions(), 1u) << "round " << round;

        gateway->Stop();
        EXPECT_EQ(gateway->LiveSessions(), 0u);
        gateway.reset();

        EXPECT_EQ(admission.HeldSlots(), 0u);
        EXPECT_EQ(admission.ActiveIdentities(), 0u);
        EXPECT_TRUE(script->killed.load());
        script->killed = false;
    }
}

}  // namespace
}  // namespace runbox
