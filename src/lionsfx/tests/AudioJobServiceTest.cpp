#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <numbers>
#include <thread>

#include <lionsfx/lionsfx.hpp>

namespace {

using namespace lionsfx;
using namespace std::chrono_literals;

AudioBuffer sineBuffer(double frequency, uint32_t sampleRate, double seconds, float amplitude) {
    std::vector<float> x(static_cast<size_t>(seconds * sampleRate));
    for (size_t i = 0; i < x.size(); ++i)
        x[i] = amplitude * static_cast<float>(std::sin(2.0 * std::numbers::pi * frequency * static_cast<double>(i) / sampleRate));
    return AudioBuffer({x, x}, sampleRate);
}

class AudioJobServiceTest : public ::testing::Test {
protected:
    std::filesystem::path dir{};
    std::unique_ptr<AudioJobService> service{};
    std::unique_ptr<AudioCodec> reader{AudioCodec::create()};

    void SetUp() override {
        const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() / ("lionsfx-service-" + std::string{testInfo ? testInfo->name() : "service"});
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir);

        ServiceConfiguration config;
        config.outputDirectory = dir / "processed";
        config.workerCount = 2;
        service = std::make_unique<AudioJobService>(config);
    }

    void TearDown() override {
        service.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    TaskSnapshot waitForTerminal(const std::string& id) {
        const auto deadline = std::chrono::steady_clock::now() + 60s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto snapshot = service->pollStatus(id);
            if (!snapshot) {
                ADD_FAILURE() << "task " << id << " not found";
                return {};
            }
            if (isTerminal(snapshot->status))
                return *snapshot;
            std::this_thread::sleep_for(5ms);
        }
        ADD_FAILURE() << "task " << id << " did not finish";
        return {};
    }
};

TEST_F(AudioJobServiceTest, SilentSeparationCompletesWithSilentOutputs) {
    auto submitted = service->submitSeparation(AudioBuffer::silence(1, 44100 * 5, 44100));
    ASSERT_TRUE(submitted.success) << submitted.error;

    auto snapshot = waitForTerminal(submitted.taskId);
    ASSERT_EQ(snapshot.status, TaskStatus::Completed) << (snapshot.error ? snapshot.error->displayMessage() : "");
    EXPECT_EQ(snapshot.progress, 100);
    EXPECT_EQ(snapshot.kind, TaskKind::Separate);

    const auto& result = std::get<SeparationResult>(*snapshot.result);
    EXPECT_EQ(std::filesystem::path{result.vocalPath}.filename().string(), submitted.taskId + "_vocals.flac");
    EXPECT_EQ(std::filesystem::path{result.instrumentalPath}.filename().string(), submitted.taskId + "_instruments.flac");

    for (const auto& path : {result.vocalPath, result.instrumentalPath}) {
        auto decoded = reader->decode(path);
        EXPECT_EQ(decoded.numFrames(), 44100u * 5) << path;
        EXPECT_EQ(decoded.sampleRate(), 44100u) << path;
        EXPECT_LT(decoded.peakAmplitude(), 1.0e-4f) << path;
    }
}

TEST_F(AudioJobServiceTest, DistortionOutputStaysWithinFullScale) {
    auto submitted = service->submitEffect(sineBuffer(440.0, 44100, 1.0, 0.9f), "distortion", 100, "tone");
    ASSERT_TRUE(submitted.success);

    auto snapshot = waitForTerminal(submitted.taskId);
    ASSERT_EQ(snapshot.status, TaskStatus::Completed);
    const auto& result = std::get<EffectResult>(*snapshot.result);
    EXPECT_EQ(std::filesystem::path{result.outputPath}.filename().string(), "tone_distortion_100.flac");

    auto decoded = reader->decode(result.outputPath);
    EXPECT_EQ(decoded.numChannels(), 2u);
    EXPECT_EQ(decoded.numFrames(), 44100u);
    EXPECT_LE(decoded.peakAmplitude(), 1.0f);
}

TEST_F(AudioJobServiceTest, UnknownEffectFailsWithInvalidParameter) {
    auto submitted = service->submitEffect(sineBuffer(440.0, 22050, 0.2, 0.5f), "unknown", 50);
    ASSERT_TRUE(submitted.success);

    auto snapshot = waitForTerminal(submitted.taskId);
    ASSERT_EQ(snapshot.status, TaskStatus::Failed);
    EXPECT_FALSE(snapshot.result.has_value());
    ASSERT_TRUE(snapshot.error.has_value());
    EXPECT_EQ(snapshot.error->kind, ErrorKind::InvalidParameter);
    EXPECT_EQ(snapshot.error->displayMessage().rfind("InvalidParameter: Unknown effect: unknown", 0), 0u)
        << snapshot.error->displayMessage();
}

TEST_F(AudioJobServiceTest, FileSubmissionsUseTheFileStem) {
    const auto input = dir / "song.wav";
    reader->encode(sineBuffer(330.0, 22050, 0.5, 0.6f), input);

    auto split = service->submitSeparationFromFile(input);
    auto effect = service->submitEffectFromFile(input, "Reverb", 170);
    ASSERT_TRUE(split.success);
    ASSERT_TRUE(effect.success);

    auto splitDone = waitForTerminal(split.taskId);
    ASSERT_EQ(splitDone.status, TaskStatus::Completed);
    const auto& parts = std::get<SeparationResult>(*splitDone.result);
    EXPECT_EQ(parts.vocalPath, (dir / "processed" / "song_vocals.flac").string());
    EXPECT_EQ(parts.instrumentalPath, (dir / "processed" / "song_instruments.flac").string());
    EXPECT_TRUE(std::filesystem::exists(parts.vocalPath));

    auto effectDone = waitForTerminal(effect.taskId);
    ASSERT_EQ(effectDone.status, TaskStatus::Completed);
    EXPECT_EQ(std::get<EffectResult>(*effectDone.result).outputPath,
              (dir / "processed" / "song_reverb_100.flac").string());
    EXPECT_EQ(effectDone.description, "Reverb@170 song.wav");
}

TEST_F(AudioJobServiceTest, MissingInputFileFailsWithDecodeError) {
    auto submitted = service->submitSeparationFromFile(dir / "does-not-exist.wav");
    ASSERT_TRUE(submitted.success);
    auto snapshot = waitForTerminal(submitted.taskId);
    ASSERT_EQ(snapshot.status, TaskStatus::Failed);
    EXPECT_EQ(snapshot.error->kind, ErrorKind::DecodeError);
}

TEST_F(AudioJobServiceTest, EmptyBufferFailsWithInvalidParameter) {
    auto submitted = service->submitEffect(AudioBuffer({std::vector<float>{}}, 44100), EffectType::Echo, 50);
    ASSERT_TRUE(submitted.success);
    auto snapshot = waitForTerminal(submitted.taskId);
    ASSERT_EQ(snapshot.status, TaskStatus::Failed);
    EXPECT_EQ(snapshot.error->kind, ErrorKind::InvalidParameter);
}

TEST_F(AudioJobServiceTest, UnknownTaskIsNotFound) {
    EXPECT_FALSE(service->pollStatus("not-a-task").has_value());
}

TEST_F(AudioJobServiceTest, InspectsAudioFiles) {
    const auto input = dir / "probe.wav";
    reader->encode(sineBuffer(100.0, 48000, 0.25, 0.1f), input);

    auto info = service->inspectAudioFile(input);
    EXPECT_EQ(info.sampleRate, 48000u);
    EXPECT_EQ(info.numChannels, 2u);
    EXPECT_EQ(info.numFrames, 12000u);

    auto json = toJson(info);
    EXPECT_EQ(json["format"].getString(), "wav");
    EXPECT_EQ(json["sampleRate"].getInt64(), 48000);
}

TEST_F(AudioJobServiceTest, ReportsServiceStatus) {
    auto status = service->serviceStatus();
    EXPECT_EQ(status.name, "Lions Flute Audio FX");
    EXPECT_FALSE(status.version.empty());
    EXPECT_EQ(status.supportedEffects.size(), 7u);
    EXPECT_EQ(status.outputFormat, "flac");
    EXPECT_EQ(status.engine.workerCount, 2u);

    auto json = toJson(status);
    EXPECT_EQ(json["status"].getString(), "running");
    EXPECT_EQ(json["supportedEffects"].size(), 7u);
    EXPECT_EQ(json["engine"]["workerCount"].getInt64(), 2);
}

TEST_F(AudioJobServiceTest, SnapshotJsonCarriesResultOrError) {
    auto ok = service->submitEffect(sineBuffer(440.0, 22050, 0.2, 0.5f), EffectType::Compressor, 40, "clip");
    auto bad = service->submitEffect(sineBuffer(440.0, 22050, 0.2, 0.5f), "wobble", 40);

    auto okJson = toJson(waitForTerminal(ok.taskId));
    EXPECT_EQ(okJson["status"].getString(), "completed");
    EXPECT_EQ(okJson["progress"].getInt32(), 100);
    EXPECT_TRUE(okJson["result"].hasObjectMember("output"));
    EXPECT_FALSE(okJson.hasObjectMember("error"));

    auto badJson = toJson(waitForTerminal(bad.taskId));
    EXPECT_EQ(badJson["status"].getString(), "failed");
    EXPECT_EQ(badJson["errorKind"].getString(), "InvalidParameter");
    EXPECT_FALSE(badJson.hasObjectMember("result"));
}

TEST(AudioJobServiceConfigurationTest, RejectsInvalidConfiguration) {
    ServiceConfiguration config;
    config.outputFormat = "mp3";
    EXPECT_THROW(AudioJobService{config}, AudioJobError);
}

} // namespace
