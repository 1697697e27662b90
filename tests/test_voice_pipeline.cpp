#include <gtest/gtest.h>

#include "voice/voice_pipeline.hpp"
#include "audio/wire_codec.hpp"
#include "event_loop.hpp"
#include "fakes.hpp"

#include <chrono>
#include <memory>
#include <vector>

using namespace std::chrono_literals;

static std::string pcmSeconds(double s, int rate = kOutputSampleRate) {
    std::vector<std::uint8_t> raw(static_cast<std::size_t>(s * rate) * 2, 0);
    return WireCodec::base64Encode(raw.data(), raw.size());
}

static AudioFrame silentFrame() {
    AudioFrame f;
    f.samples.assign(kCaptureFrameSize, 0.0f);
    return f;
}

class VoicePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        input = std::make_shared<FakeInputState>();
        output = std::make_shared<FakeOutputState>();

        PipelineOptions opts;
        opts.levelInterval = 10000ms;   // keep the meter out of runUntilIdle
        opts.session.voiceName = "Charon";
        opts.session.systemInstruction = "persona";

        auto in = input;
        auto out = output;
        pipeline = std::make_unique<VoicePipeline>(
            loop, connector,
            [in]() -> std::unique_ptr<InputDevice> { return std::make_unique<FakeInput>(in); },
            [out]() -> std::unique_ptr<OutputDevice> { return std::make_unique<FakeOutput>(out); },
            opts);

        pipeline->onState([this](ConnectionState s) { states.push_back(s); });
        pipeline->onLevel([this](double u, double a) { levels.emplace_back(u, a); });
    }

    void TearDown() override {
        pipeline.reset();
    }

    void connect() {
        ASSERT_TRUE(pipeline->start());
        loop.runUntilIdle();
        ASSERT_EQ(pipeline->state(), ConnectionState::Connected);
    }

    EventLoop loop;
    FakeConnector connector;
    std::shared_ptr<FakeInputState> input;
    std::shared_ptr<FakeOutputState> output;
    std::unique_ptr<VoicePipeline> pipeline;
    std::vector<ConnectionState> states;
    std::vector<std::pair<double, double>> levels;
};

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------
TEST_F(VoicePipelineTest, ConnectGoesThroughConnectingToConnected) {
    ASSERT_TRUE(pipeline->start());
    EXPECT_EQ(pipeline->state(), ConnectionState::Connecting);

    loop.runUntilIdle();
    EXPECT_EQ(pipeline->state(), ConnectionState::Connected);
    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Connecting,
                                                    ConnectionState::Connected}));
    EXPECT_EQ(connector.connects, 1);
    EXPECT_EQ(connector.lastConfig.systemInstruction, "persona");
    EXPECT_EQ(input->opens, 1);
    EXPECT_EQ(output->opens, 1);
}

TEST_F(VoicePipelineTest, StartWhileActiveIsRejected) {
    connect();
    EXPECT_FALSE(pipeline->start());
    EXPECT_EQ(connector.connects, 1);
}

TEST_F(VoicePipelineTest, MicrophoneDeniedEndsInErrorWithoutSession) {
    input->allowOpen = false;
    EXPECT_FALSE(pipeline->start());

    EXPECT_EQ(pipeline->state(), ConnectionState::Error);
    EXPECT_EQ(pipeline->lastError(), "ERR_MIC_PERMISSION_DENIED");
    EXPECT_FALSE(pipeline->lastErrorMessage().empty());
    EXPECT_EQ(connector.connects, 0);
    EXPECT_EQ(output->opens, 0);
    EXPECT_EQ(input->destroyed, 1);
}

TEST_F(VoicePipelineTest, OutputFailureReleasesMicrophone) {
    output->allowOpen = false;
    EXPECT_FALSE(pipeline->start());

    EXPECT_EQ(pipeline->state(), ConnectionState::Error);
    EXPECT_EQ(pipeline->lastError(), "ERR_OUTPUT_DEVICE_UNAVAILABLE");
    EXPECT_EQ(input->stopTracks, 1);
    EXPECT_EQ(input->releases, 1);
    EXPECT_EQ(connector.connects, 0);
}

TEST_F(VoicePipelineTest, SessionOpenFailureTearsEverythingDown) {
    connector.throwOnConnect = true;
    EXPECT_FALSE(pipeline->start());

    EXPECT_EQ(pipeline->state(), ConnectionState::Error);
    EXPECT_EQ(pipeline->lastError(), "ERR_SESSION_OPEN_FAILED");
    EXPECT_EQ(input->releases, 1);
    EXPECT_EQ(output->releases, 1);
    EXPECT_EQ(loop.pendingTimers(), 0u);   // meter cancelled
}

TEST_F(VoicePipelineTest, ConnectorReturningNothingIsAnOpenFailure) {
    connector.returnNull = true;
    EXPECT_FALSE(pipeline->start());
    EXPECT_EQ(pipeline->lastError(), "ERR_SESSION_OPEN_FAILED");
    EXPECT_EQ(output->releases, 1);
}

TEST_F(VoicePipelineTest, RepeatedDisconnectConvergesToClosedOnce) {
    connect();

    pipeline->stop();
    pipeline->stop();
    connector.emit(InboundEvent::closed());
    loop.runUntilIdle();
    pipeline->stop();

    EXPECT_EQ(pipeline->state(), ConnectionState::Closed);
    EXPECT_EQ(input->stopTracks, 1);
    EXPECT_EQ(input->releases, 1);
    EXPECT_EQ(output->releases, 1);
    EXPECT_EQ(connector.session->closes, 1);
    EXPECT_EQ(loop.pendingTimers(), 0u);
    ASSERT_FALSE(levels.empty());
    EXPECT_EQ(levels.back(), std::make_pair(0.0, 0.0));
}

TEST_F(VoicePipelineTest, DisconnectBeforeAnyConnectIsHarmless) {
    EXPECT_NO_THROW(pipeline->stop());
    EXPECT_EQ(pipeline->state(), ConnectionState::Closed);
    EXPECT_EQ(input->opens, 0);
}

TEST_F(VoicePipelineTest, RemoteErrorThenCloseEndsClosed) {
    connect();
    connector.emit(InboundEvent::error("boom"));
    connector.emit(InboundEvent::closed("bye"));
    loop.runUntilIdle();

    EXPECT_EQ(pipeline->state(), ConnectionState::Closed);
    EXPECT_EQ(pipeline->lastError(), "ERR_SESSION_ERROR");
    EXPECT_EQ(input->releases, 1);
    EXPECT_EQ(output->releases, 1);
    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Connecting,
                                                    ConnectionState::Connected,
                                                    ConnectionState::Error,
                                                    ConnectionState::Closed}));
}

TEST_F(VoicePipelineTest, RemoteCloseTearsDown) {
    connect();
    connector.emit(InboundEvent::closed("network drop"));
    loop.runUntilIdle();

    EXPECT_EQ(pipeline->state(), ConnectionState::Closed);
    EXPECT_EQ(pipeline->lastError(), "ERR_SESSION_CLOSED");
    EXPECT_EQ(input->releases, 1);
    EXPECT_EQ(output->releases, 1);
}

TEST_F(VoicePipelineTest, NoConnectedAfterClosedWithinOneAttempt) {
    connector.autoOpen = false;
    ASSERT_TRUE(pipeline->start());
    pipeline->stop();

    connector.emit(InboundEvent::opened());
    loop.runUntilIdle();
    EXPECT_EQ(pipeline->state(), ConnectionState::Closed);
}

TEST_F(VoicePipelineTest, EventsFromEarlierAttemptAreDiscarded) {
    connect();
    EventSink firstSink = connector.sinks.front();
    pipeline->stop();

    connect();
    EXPECT_EQ(pipeline->generation(), 2u);

    firstSink(InboundEvent::error("late"));
    loop.runUntilIdle();
    EXPECT_EQ(pipeline->state(), ConnectionState::Connected);
}

TEST_F(VoicePipelineTest, ReconnectAfterCloseAcquiresFreshDevices) {
    connect();
    pipeline->stop();
    connect();

    EXPECT_EQ(input->opens, 2);
    EXPECT_EQ(output->opens, 2);
    EXPECT_EQ(input->releases, 1);
}

// ------------------------------------------------------------
// Capture
// ------------------------------------------------------------
TEST_F(VoicePipelineTest, CaptureSubscribesOnlyAfterOpened) {
    connector.autoOpen = false;
    ASSERT_TRUE(pipeline->start());
    loop.runUntilIdle();

    ASSERT_NE(input->live, nullptr);
    EXPECT_FALSE(input->live->hasSubscriber());
    input->live->emit(silentFrame());
    loop.runUntilIdle();
    EXPECT_EQ(connector.session->sent, 0);

    connector.emit(InboundEvent::opened());
    loop.runUntilIdle();
    EXPECT_TRUE(input->live->hasSubscriber());

    input->live->emit(silentFrame());
    input->live->emit(silentFrame());
    loop.runUntilIdle();
    EXPECT_EQ(connector.session->sent, 2);
    EXPECT_EQ(pipeline->framesSent(), 2u);
    EXPECT_EQ(connector.session->chunks[0].mimeType, "audio/pcm;rate=16000");
}

TEST_F(VoicePipelineTest, FramesInFlightAtCloseAreNeverSent) {
    connect();
    input->live->emit(silentFrame());   // posted, not yet run
    pipeline->stop();
    loop.runUntilIdle();

    EXPECT_EQ(connector.session->sent, 0);
}

TEST_F(VoicePipelineTest, SendFailureCountsAsDropAndKeepsSession) {
    connect();
    connector.session->throwOnSend = true;
    input->live->emit(silentFrame());
    loop.runUntilIdle();

    EXPECT_EQ(pipeline->framesDropped(), 1u);
    EXPECT_EQ(pipeline->state(), ConnectionState::Connected);
}

// ------------------------------------------------------------
// Playback / interrupt
// ------------------------------------------------------------
TEST_F(VoicePipelineTest, ModelAudioIsScheduledBackToBack) {
    connect();
    connector.emit(InboundEvent::audioChunk(pcmSeconds(1.0)));
    connector.emit(InboundEvent::audioChunk(pcmSeconds(0.5)));
    loop.runUntilIdle();

    ASSERT_EQ(output->scheduled.size(), 2u);
    EXPECT_NEAR(output->scheduled[0].when, 0.0, 1e-9);
    EXPECT_NEAR(output->scheduled[1].when, 1.0, 1e-9);
    EXPECT_EQ(pipeline->activeBuffers(), 2u);
}

TEST_F(VoicePipelineTest, NaturalEndIsPostedBackToTheLoop) {
    connect();
    connector.emit(InboundEvent::audioChunk(pcmSeconds(0.5)));
    loop.runUntilIdle();
    ASSERT_EQ(pipeline->activeBuffers(), 1u);

    output->live->finish(output->scheduled[0].id);
    EXPECT_EQ(pipeline->activeBuffers(), 1u);   // not until the loop runs
    loop.runUntilIdle();
    EXPECT_EQ(pipeline->activeBuffers(), 0u);
}

TEST_F(VoicePipelineTest, DecodeFailureSkipsChunkOnly) {
    connect();
    connector.emit(InboundEvent::audioChunk("%%% not audio %%%"));
    connector.emit(InboundEvent::audioChunk(pcmSeconds(0.5)));
    loop.runUntilIdle();

    EXPECT_EQ(pipeline->decodeFailures(), 1u);
    EXPECT_EQ(pipeline->state(), ConnectionState::Connected);
    ASSERT_EQ(output->scheduled.size(), 1u);
    EXPECT_NEAR(output->scheduled[0].when, 0.0, 1e-9);
}

TEST_F(VoicePipelineTest, InterruptFlushesPlaybackAndRestartsAtNow) {
    connect();
    connector.emit(InboundEvent::audioChunk(pcmSeconds(2.0)));
    loop.runUntilIdle();

    output->now = 0.5;
    connector.emit(InboundEvent::interrupted());
    loop.runUntilIdle();
    EXPECT_EQ(pipeline->activeBuffers(), 0u);
    EXPECT_EQ(output->stopped.size(), 1u);
    EXPECT_EQ(pipeline->interruptCount(), 1u);

    connector.emit(InboundEvent::audioChunk(pcmSeconds(0.25)));
    loop.runUntilIdle();
    ASSERT_EQ(output->scheduled.size(), 2u);
    EXPECT_NEAR(output->scheduled[1].when, 0.5, 1e-9);
}

TEST_F(VoicePipelineTest, DisconnectStopsQueuedPlayback) {
    connect();
    connector.emit(InboundEvent::audioChunk(pcmSeconds(1.0)));
    connector.emit(InboundEvent::audioChunk(pcmSeconds(1.0)));
    loop.runUntilIdle();

    pipeline->stop();
    EXPECT_EQ(output->stopped.size(), 2u);
    EXPECT_EQ(pipeline->activeBuffers(), 0u);
}

// ------------------------------------------------------------
// Transcript
// ------------------------------------------------------------
TEST_F(VoicePipelineTest, TurnCompleteClearsBothTranscripts) {
    std::vector<Turn> turns;
    std::pair<std::string, std::string> interim;
    pipeline->onTurn([&](const Turn& t) { turns.push_back(t); });
    pipeline->onTranscript([&](const std::string& u, const std::string& a) { interim = {u, a}; });

    connect();
    connector.emit(InboundEvent::inputTranscription("hel"));
    connector.emit(InboundEvent::inputTranscription("lo"));
    connector.emit(InboundEvent::outputTranscription("hi there"));
    loop.runUntilIdle();
    EXPECT_EQ(interim, std::make_pair(std::string("hello"), std::string("hi there")));

    connector.emit(InboundEvent::turnComplete());
    connector.emit(InboundEvent::outputTranscription("next"));
    loop.runUntilIdle();

    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].user, "hello");
    EXPECT_EQ(turns[0].assistant, "hi there");
    EXPECT_EQ(pipeline->transcript().user(), "");
    EXPECT_EQ(pipeline->transcript().assistant(), "next");
}

TEST_F(VoicePipelineTest, MessagesReachObserver) {
    std::vector<InboundEvent::Kind> kinds;
    pipeline->onMessage([&](const InboundEvent& e) { kinds.push_back(e.kind); });

    connect();
    connector.emit(InboundEvent::turnComplete());
    loop.runUntilIdle();

    EXPECT_EQ(kinds, (std::vector<InboundEvent::Kind>{InboundEvent::Kind::Opened,
                                                      InboundEvent::Kind::TurnComplete}));
}

// ------------------------------------------------------------
// Text turns
// ------------------------------------------------------------
TEST_F(VoicePipelineTest, SendTextRequiresConnection) {
    EXPECT_FALSE(pipeline->sendText("hello"));

    connect();
    EXPECT_TRUE(pipeline->sendText("hello"));
    ASSERT_EQ(connector.session->texts.size(), 1u);
    EXPECT_EQ(connector.session->texts[0], "hello");

    pipeline->stop();
    EXPECT_FALSE(pipeline->sendText("again"));
}
