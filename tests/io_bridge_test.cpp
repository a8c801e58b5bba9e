#include <chrono>
#include <memory>

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "session/io_bridge.hpp"

namespace runbox::session {
namespace {

using runbox::testing::FakeChannel;
using runbox::testing::FakeSandbox;
using runbox::testing::SandboxScript;

TEST(IoBridgeTest, RelaysEveryChunkInOrder) {
    auto script = std::make_shared<SandboxScript>();
    script->output = {"one\n", "two\n", "three\n"};
    FakeSandbox box(script);
    FakeChannel channel;

    IoBridge bridge(box, channel, "alice");
    EXPECT_FALSE(bridge.HasOutput());
    bridge.Start();
    ASSERT_TRUE(bridge.WaitDrained(std::chrono::seconds(2)));

    EXPECT_TRUE(bridge.HasOutput());
    EXPECT_EQ(channel.OutputText(), "one\ntwo\nthree\n");
}

TEST(IoBridgeTest, LargeOutputIsSplitIntoChunks) {
    auto script = std::make_shared<SandboxScript>();
    script->output = {std::string(3000, 'x')};
    FakeSandbox box(script);
    FakeChannel channel;

    IoBridge bridge(box, channel, "alice");
    bridge.Start();
    ASSERT_TRUE(bridge.WaitDrained(std::chrono::seconds(2)));

    const auto outputs = channel.Outputs();
    ASSERT_EQ(outputs.size(), 3u);
    EXPECT_EQ(outputs[0].size(), IoBridge::kChunkSize);
    EXPECT_EQ(channel.OutputText(), std::string(3000, 'x'));
}

TEST(IoBridgeTest, MultibyteCharacterSplitAcrossReadsSurvives) {
    auto script = std::make_shared<SandboxScript>();
    script->output = {"caf\xC3", "\xA9\n"};
    FakeSandbox box(script);
    FakeChannel channel;

    IoBridge bridge(box, channel, "alice");
    bridge.Start();
    ASSERT_TRUE(bridge.WaitDrained(std::chrono::seconds(2)));
    EXPECT_EQ(channel.OutputText(), "caf\xC3\xA9\n");
}

TEST(IoBridgeTest, SilentProgramLeavesHasOutputUnset) {
    auto script = std::make_shared<SandboxScript>();
    FakeSandbox box(script);
    FakeChannel channel;

    IoBridge bridge(box, channel, "alice");
    bridge.Start();
    ASSERT_TRUE(bridge.WaitDrained(std::chrono::seconds(2)));
    EXPECT_FALSE(bridge.HasOutput());
    EXPECT_TRUE(channel.Sent().empty());
}

TEST(IoBridgeTest, WaitDrainedTimesOutThenCancelUnblocks) {
    auto script = std::make_shared<SandboxScript>();
    script->exit_immediately = false;
    FakeSandbox box(script);
    FakeChannel channel;

    IoBridge bridge(box, channel, "alice");
    bridge.Start();
    EXPECT_FALSE(bridge.WaitDrained(std::chrono::milliseconds(50)));

    const auto start = std::chrono::steady_clock::now();
    bridge.Cancel();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST(IoBridgeTest, ForwardsInputToSandbox) {
    auto script = std::make_shared<SandboxScript>();
    script->exit_immediately = false;
    FakeSandbox box(script);
    FakeChannel channel;

    IoBridge bridge(box, channel, "alice");
    bridge.ForwardInput("hello\n");
    ASSERT_EQ(script->inputs.size(), 1u);
    EXPECT_EQ(script->inputs[0], "hello\n");
}

}  // namespace
}  // namespace runbox::session
