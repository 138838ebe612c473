#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <numbers>
#include <string>

#include <lionsfx/lionsfx.hpp>

namespace {

using namespace lionsfx;

std::filesystem::path createTempDirectory(const std::string& testName) {
    auto dir = std::filesystem::temp_directory_path() / ("lionsfx-codec-" + testName);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir;
}

AudioBuffer stereoTestSignal() {
    std::vector<float> left(4410), right(4410);
    for (size_t i = 0; i < left.size(); ++i) {
        left[i] = 0.5f * static_cast<float>(std::sin(2.0 * std::numbers::pi * 440.0 * static_cast<double>(i) / 44100.0));
        right[i] = -0.25f * static_cast<float>(std::cos(2.0 * std::numbers::pi * 1000.0 * static_cast<double>(i) / 44100.0));
    }
    return AudioBuffer({left, right}, 44100);
}

ErrorKind kindOf(const std::function<void()>& action) {
    try {
        action();
    } catch (const AudioJobError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected AudioJobError";
    return ErrorKind::ProcessingError;
}

class AudioCodecTest : public ::testing::Test {
protected:
    std::filesystem::path dir{};

    void SetUp() override {
        const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = createTempDirectory(testInfo ? testInfo->name() : "codec");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void expectRoundTrip(SampleFormat format, const std::string& fileName, float tolerance) {
        const auto original = stereoTestSignal();
        auto codec = AudioCodec::create(format);
        const auto path = dir / fileName;
        codec->encode(original, path);
        ASSERT_TRUE(std::filesystem::exists(path));

        auto decoded = codec->decode(path);
        ASSERT_EQ(decoded.numChannels(), original.numChannels());
        ASSERT_EQ(decoded.numFrames(), original.numFrames());
        EXPECT_EQ(decoded.sampleRate(), original.sampleRate());
        for (uint32_t ch = 0; ch < original.numChannels(); ++ch)
            for (size_t i = 0; i < original.numFrames(); i += 7)
                ASSERT_NEAR(decoded.channel(ch)[i], original.channel(ch)[i], tolerance) << fileName << " ch " << ch << " frame " << i;
    }
};

TEST_F(AudioCodecTest, WavFloatRoundTrip) {
    expectRoundTrip(SampleFormat::Float32, "float.wav", 1.0e-6f);
}

TEST_F(AudioCodecTest, Wav16BitRoundTrip) {
    expectRoundTrip(SampleFormat::Int16, "int16.wav", 1.0e-3f);
}

TEST_F(AudioCodecTest, Flac24BitRoundTrip) {
    expectRoundTrip(SampleFormat::Int24, "int24.flac", 1.0e-4f);
}

TEST_F(AudioCodecTest, EncodeCreatesMissingDirectories) {
    auto codec = AudioCodec::create();
    const auto path = dir / "nested" / "deeper" / "out.flac";
    codec->encode(stereoTestSignal(), path);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(AudioCodecTest, InspectReportsStreamProperties) {
    auto codec = AudioCodec::create(SampleFormat::Int16);
    const auto path = dir / "info.wav";
    codec->encode(stereoTestSignal(), path);

    auto info = codec->inspect(path);
    EXPECT_EQ(info.formatName, "wav");
    EXPECT_EQ(info.sampleRate, 44100u);
    EXPECT_EQ(info.numChannels, 2u);
    EXPECT_EQ(info.numFrames, 4410u);
    EXPECT_NEAR(info.durationSeconds, 0.1, 1.0e-9);
    EXPECT_GT(info.fileSizeBytes, 4410u * 2 * 2);
}

TEST_F(AudioCodecTest, MissingFileIsDecodeError) {
    auto codec = AudioCodec::create();
    EXPECT_EQ(kindOf([&] { codec->decode(dir / "missing.wav"); }), ErrorKind::DecodeError);
    EXPECT_EQ(kindOf([&] { codec->inspect(dir / "missing.flac"); }), ErrorKind::DecodeError);
}

TEST_F(AudioCodecTest, GarbageFileIsDecodeError) {
    const auto path = dir / "garbage.wav";
    {
        std::ofstream ofs{path, std::ios::binary};
        ofs << "this is not a RIFF file at all, just some text";
    }
    auto codec = AudioCodec::create();
    EXPECT_EQ(kindOf([&] { codec->decode(path); }), ErrorKind::DecodeError);
}

TEST_F(AudioCodecTest, UnwritableFormatIsEncodeError) {
    auto codec = AudioCodec::create();
    const auto path = dir / "out.mp3";
    EXPECT_EQ(kindOf([&] { codec->encode(stereoTestSignal(), path); }), ErrorKind::EncodeError);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(AudioCodecTest, ExtensionListsCoverWavAndFlac) {
    auto readable = readableAudioFileExtensions();
    auto writable = writableAudioFileExtensions();
    EXPECT_NE(std::find(readable.begin(), readable.end(), "ogg"), readable.end());
    EXPECT_NE(std::find(writable.begin(), writable.end(), "flac"), writable.end());
    EXPECT_NE(std::find(writable.begin(), writable.end(), "wav"), writable.end());
}

} // namespace
