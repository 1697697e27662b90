#include <gtest/gtest.h>

#include "commands/commands_core.hpp"
#include "commands/commands_helpers.hpp"
#include "commands/commands_system.hpp"
#include "meditation/narrator.hpp"
#include "voice/voice_pipeline.hpp"
#include "network_status.hpp"
#include "event_loop.hpp"
#include "fakes.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace std::chrono_literals;

TEST(CommandParseTest, SplitsCommandAndArgument) {
    auto [cmd, arg] = parseInput("  say   hello there  ");
    EXPECT_EQ(cmd, "say");
    EXPECT_EQ(arg, "hello there");

    auto [only, none] = parseInput("status");
    EXPECT_EQ(only, "status");
    EXPECT_EQ(none, "");
}

TEST(CommandParseTest, TrimHandlesBlankInput) {
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("\tconnect\n"), "connect");
}

// ------------------------------------------------------------
// Dispatch against a fake-backed pipeline
// ------------------------------------------------------------
class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto in = std::make_shared<FakeInputState>();
        auto out = std::make_shared<FakeOutputState>();
        PipelineOptions opts;
        opts.levelInterval = 10000ms;
        pipeline = std::make_unique<VoicePipeline>(
            loop, connector,
            [in]() -> std::unique_ptr<InputDevice> { return std::make_unique<FakeInput>(in); },
            [out]() -> std::unique_ptr<OutputDevice> { return std::make_unique<FakeOutput>(out); },
            opts);
        narrator = std::make_unique<Narrator>(loop, *pipeline, 0ms);

        Meditation m;
        m.id = "calm";
        m.title = "Calm";
        m.intro = "Sit down.";
        m.outro = "Done.";
        m.steps.push_back({"Breathe", "Slowly.", "", "", false});
        narrator->setMeditations({m});

        // Loop not started: commands run inline
        setCommandContext({&loop, pipeline.get(), narrator.get()});
    }

    void TearDown() override {
        setCommandContext({});
        narrator.reset();
        pipeline.reset();
        NetworkStatus::setHealthCheck(nullptr);
        NetworkStatus::reset();
        g_quitRequested = false;
    }

    EventLoop loop;
    FakeConnector connector;
    std::unique_ptr<VoicePipeline> pipeline;
    std::unique_ptr<Narrator> narrator;
};

TEST_F(CommandsTest, UnknownCommandReportsCode) {
    CommandResult r = handleCommand("frobnicate");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_CORE_UNKNOWN_COMMAND");
}

TEST_F(CommandsTest, NearMissIsCorrected) {
    CommandResult r = handleCommand("conect");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(pipeline->state(), ConnectionState::Connecting);
}

TEST_F(CommandsTest, CommandNamesAreCaseInsensitive) {
    CommandResult r = handleCommand("HELP");
    EXPECT_TRUE(r.success);
    EXPECT_NE(r.message.find("connect"), std::string::npos);
}

TEST_F(CommandsTest, ConnectTwiceIsRefused) {
    EXPECT_TRUE(handleCommand("connect").success);
    loop.runUntilIdle();
    CommandResult again = handleCommand("connect");
    EXPECT_FALSE(again.success);
    EXPECT_EQ(connector.connects, 1);
}

TEST_F(CommandsTest, ConnectFailureCarriesErrorCode) {
    connector.throwOnConnect = true;
    CommandResult r = handleCommand("connect");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_SESSION_OPEN_FAILED");
}

TEST_F(CommandsTest, DisconnectAlwaysSucceeds) {
    EXPECT_TRUE(handleCommand("disconnect").success);
    EXPECT_EQ(pipeline->state(), ConnectionState::Closed);
}

TEST_F(CommandsTest, SayNeedsTextAndConnection) {
    EXPECT_FALSE(handleCommand("say").success);

    CommandResult r = handleCommand("say hello");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_NOT_CONNECTED");

    handleCommand("connect");
    loop.runUntilIdle();
    EXPECT_TRUE(handleCommand("say hello").success);
    ASSERT_EQ(connector.session->texts.size(), 1u);
    EXPECT_EQ(connector.session->texts[0], "hello");
}

TEST_F(CommandsTest, StatusShowsState) {
    CommandResult r = handleCommand("status");
    EXPECT_TRUE(r.success);
    EXPECT_NE(r.message.find("idle"), std::string::npos);
}

TEST_F(CommandsTest, MeditationFlow) {
    CommandResult list = handleCommand("meditate list");
    EXPECT_NE(list.message.find("calm"), std::string::npos);

    CommandResult missing = handleCommand("meditate nope");
    EXPECT_EQ(missing.errorCode, "ERR_MEDITATION_NOT_FOUND");

    EXPECT_FALSE(handleCommand("next").success);

    EXPECT_TRUE(handleCommand("meditate calm").success);
    EXPECT_FALSE(handleCommand("prev").success);
    EXPECT_TRUE(handleCommand("next").success);
    EXPECT_TRUE(handleCommand("next").success);
    EXPECT_TRUE(narrator->isOutro());
    EXPECT_FALSE(handleCommand("next").success);

    EXPECT_TRUE(handleCommand("stop_meditation").success);
    EXPECT_EQ(narrator->stepIndex(), Narrator::kSelection);
}

TEST_F(CommandsTest, HealthReportsUnreachableBackend) {
    NetworkStatus::setHealthCheck([](const std::string&, int) { return false; });
    EXPECT_EQ(handleCommand("health").errorCode, "ERR_BACKEND_UNREACHABLE");

    NetworkStatus::setHealthCheck([](const std::string&, int) { return true; });
    EXPECT_TRUE(handleCommand("health").success);
}

TEST_F(CommandsTest, QuitSetsFlag) {
    EXPECT_TRUE(handleCommand("exit").success);
    EXPECT_TRUE(g_quitRequested);
}

TEST(RunOnLoopTest, RunsOnWorkerAndPropagatesErrors) {
    EventLoop loop;
    loop.start();
    setCommandContext({&loop, nullptr, nullptr});

    CommandResult r = runOnLoop([&loop]() -> CommandResult {
        return {loop.isLoopThread() ? "on loop" : "off loop", true, sf::Color::White, ""};
    });
    EXPECT_EQ(r.message, "on loop");

    EXPECT_THROW(runOnLoop([]() -> CommandResult { throw std::runtime_error("boom"); }),
                 std::runtime_error);

    setCommandContext({});
    loop.stop();
}
