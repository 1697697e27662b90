#include <gtest/gtest.h>

#include "meditation/narrator.hpp"
#include "voice/voice_pipeline.hpp"
#include "event_loop.hpp"
#include "fakes.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

static Meditation sampleMeditation() {
    Meditation m;
    m.id = "calm";
    m.title = "Calm";
    m.intro = "Sit down.";
    m.outro = "Open your eyes.";
    m.steps.push_back({"Breathe", "In for four, out for six.", "I am here.", "", false});
    m.steps.push_back({"Let Go", "Drop your shoulders.", "", "", false});
    return m;
}

class NarratorTest : public ::testing::Test {
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

        Meditation other = sampleMeditation();
        other.id = "other";
        narrator->setMeditations({sampleMeditation(), other});
    }

    void TearDown() override {
        narrator.reset();
        pipeline.reset();
    }

    void connect() {
        ASSERT_TRUE(pipeline->start());
        loop.runUntilIdle();
        ASSERT_EQ(pipeline->state(), ConnectionState::Connected);
    }

    EventLoop loop;
    FakeConnector connector;
    std::unique_ptr<VoicePipeline> pipeline;
    std::unique_ptr<Narrator> narrator;
};

TEST_F(NarratorTest, StartsAtSelection) {
    EXPECT_EQ(narrator->stepIndex(), Narrator::kSelection);
    EXPECT_EQ(narrator->current(), nullptr);
    EXPECT_EQ(narrator->narrationText(), "");
    EXPECT_EQ(narrator->stepLabel(), "Selection");
}

TEST_F(NarratorTest, WalksIntroStepsOutro) {
    ASSERT_TRUE(narrator->select("calm"));
    EXPECT_EQ(narrator->stepIndex(), Narrator::kIntro);
    EXPECT_EQ(narrator->narrationText(), "Sit down.");
    EXPECT_FALSE(narrator->prev());

    ASSERT_TRUE(narrator->next());
    EXPECT_EQ(narrator->narrationText(), "Breathe. In for four, out for six. I am here.");
    EXPECT_EQ(narrator->stepLabel(), "Step 1 of 2: Breathe");

    ASSERT_TRUE(narrator->next());
    EXPECT_EQ(narrator->narrationText(), "Let Go. Drop your shoulders.");

    ASSERT_TRUE(narrator->next());
    EXPECT_TRUE(narrator->isOutro());
    EXPECT_EQ(narrator->narrationText(), "Open your eyes.");
    EXPECT_EQ(narrator->stepLabel(), "Closing");
    EXPECT_FALSE(narrator->next());

    ASSERT_TRUE(narrator->prev());
    EXPECT_EQ(narrator->stepIndex(), 1);
}

TEST_F(NarratorTest, UnknownIdKeepsSelection) {
    EXPECT_FALSE(narrator->select("nope"));
    EXPECT_EQ(narrator->stepIndex(), Narrator::kSelection);
    EXPECT_FALSE(narrator->next());
}

TEST_F(NarratorTest, ResetReturnsToSelection) {
    narrator->select("calm");
    narrator->next();
    narrator->reset();
    EXPECT_EQ(narrator->stepIndex(), Narrator::kSelection);
    EXPECT_FALSE(narrator->narrationPending());
}

TEST_F(NarratorTest, RandomPickSelectsSomething) {
    ASSERT_TRUE(narrator->selectRandom());
    ASSERT_NE(narrator->current(), nullptr);
    EXPECT_EQ(narrator->stepIndex(), Narrator::kIntro);
}

TEST_F(NarratorTest, NarrationIsSpokenWhenConnected) {
    connect();
    narrator->select("calm");
    EXPECT_TRUE(narrator->narrationPending());

    loop.runUntilIdle();
    EXPECT_FALSE(narrator->narrationPending());
    EXPECT_EQ(narrator->narrationsSent(), 1u);
    ASSERT_EQ(connector.session->texts.size(), 1u);
    EXPECT_EQ(connector.session->texts[0], "Sit down.");
}

TEST_F(NarratorTest, NewerStepReplacesPendingNarration) {
    connect();
    narrator->select("calm");
    narrator->next();
    loop.runUntilIdle();

    ASSERT_EQ(connector.session->texts.size(), 1u);
    EXPECT_EQ(connector.session->texts[0], "Breathe. In for four, out for six. I am here.");
}

TEST_F(NarratorTest, NarrationSkippedWhenDisconnected) {
    narrator->select("calm");
    loop.runUntilIdle();
    EXPECT_EQ(narrator->narrationsSent(), 0u);
    EXPECT_TRUE(connector.session->texts.empty());
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
class NarratorLoadTest : public NarratorTest {
protected:
    void SetUp() override {
        NarratorTest::SetUp();
        dir = fs::temp_directory_path() / "livewire_meditation_test";
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
        NarratorTest::TearDown();
    }

    std::string write(const std::string& name, const std::string& body) {
        fs::path p = dir / name;
        std::ofstream(p) << body;
        return p.string();
    }

    fs::path dir;
};

TEST_F(NarratorLoadTest, LoadsScripts) {
    auto path = write("ok.json", R"({"meditations": [
        {"id": "a", "title": "A", "intro": "hi", "outro": "bye",
         "steps": [{"title": "S", "content": "C", "keyPhrase": "K", "isNeonSign": true}]}
    ]})");

    ASSERT_TRUE(narrator->load(path));
    ASSERT_EQ(narrator->meditations().size(), 1u);
    const Meditation& m = narrator->meditations()[0];
    EXPECT_EQ(m.title, "A");
    ASSERT_EQ(m.steps.size(), 1u);
    EXPECT_TRUE(m.steps[0].isNeonSign);
    EXPECT_EQ(m.steps[0].keyLabel, "");
}

TEST_F(NarratorLoadTest, InvalidScriptsKeepCurrentList) {
    auto path = write("bad.json", R"({"meditations": [ {"title": "no id"} ]})");
    EXPECT_FALSE(narrator->load(path));
    EXPECT_EQ(narrator->meditations().size(), 2u);

    auto broken = write("broken.json", "{ not json");
    EXPECT_FALSE(narrator->load(broken));
    EXPECT_EQ(narrator->meditations().size(), 2u);
}

TEST_F(NarratorLoadTest, MissingFileFails) {
    EXPECT_FALSE(narrator->load((dir / "absent.json").string()));
    EXPECT_EQ(narrator->meditations().size(), 2u);
}
