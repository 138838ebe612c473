#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

#include <choc/text/choc_JSON.h>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

namespace {

AudioJobError configError(const std::string& message)
{
    return AudioJobError(ErrorKind::InvalidParameter, std::format("Invalid configuration: {}", message));
}

double readNumber(const choc::value::ValueView& obj, const char* key)
{
    auto v = obj[key];
    if (!v.isInt() && !v.isFloat())
        throw configError(std::format("'{}' must be a number", key));
    return v.get<double>();
}

template <typename T>
void readUnsigned(const choc::value::ValueView& obj, const char* key, T& target)
{
    if (!obj.hasObjectMember(key))
        return;
    const double v = readNumber(obj, key);
    if (v < 0.0 || std::floor(v) != v)
        throw configError(std::format("'{}' must be a non-negative integer", key));
    target = static_cast<T>(v);
}

template <typename T>
void readReal(const choc::value::ValueView& obj, const char* key, T& target)
{
    if (obj.hasObjectMember(key))
        target = static_cast<T>(readNumber(obj, key));
}

void readString(const choc::value::ValueView& obj, const char* key, std::string& target)
{
    if (!obj.hasObjectMember(key))
        return;
    auto v = obj[key];
    if (!v.isString())
        throw configError(std::format("'{}' must be a string", key));
    target = std::string{v.getString()};
}

void readSeparation(const choc::value::ValueView& obj, SeparationSettings& s)
{
    if (!obj.isObject())
        throw configError("'separation' must be an object");
    readUnsigned(obj, "frameSize", s.frameSize);
    readUnsigned(obj, "hopSize", s.hopSize);
    readUnsigned(obj, "harmonicFilterWidth", s.harmonicFilterWidth);
    readUnsigned(obj, "percussiveFilterWidth", s.percussiveFilterWidth);
    readReal(obj, "maskPower", s.maskPower);
    readReal(obj, "dominanceThreshold", s.dominanceThreshold);
    readReal(obj, "subtractionStrength", s.subtractionStrength);
    readReal(obj, "vocalBandLowHz", s.vocalBandLowHz);
    readReal(obj, "vocalBandHighHz", s.vocalBandHighHz);
    readReal(obj, "outOfBandVocalGain", s.outOfBandVocalGain);
}

} // namespace

void ServiceConfiguration::validate() const
{
    if (outputDirectory.empty())
        throw configError("'outputDirectory' must not be empty");
    if (outputFormat != "flac" && outputFormat != "wav")
        throw configError(std::format("unsupported output format '{}' (expected flac or wav)", outputFormat));
    if (outputBitDepth != 16 && outputBitDepth != 24 && outputBitDepth != 32)
        throw configError(std::format("unsupported bit depth {}", outputBitDepth));
    if (retentionSeconds < 0)
        throw configError("'retentionSeconds' must not be negative");
    if (sweepIntervalSeconds <= 0)
        throw configError("'sweepIntervalSeconds' must be positive");
    // the separator checks its own settings
    HarmonicPercussiveSeparator separator(separation);
}

TaskEngineOptions ServiceConfiguration::engineOptions() const
{
    TaskEngineOptions options;
    options.workerCount = workerCount;
    options.maxPendingTasks = maxPendingTasks;
    options.retention = std::chrono::seconds(retentionSeconds);
    options.sweepInterval = std::chrono::seconds(sweepIntervalSeconds);
    return options;
}

SampleFormat ServiceConfiguration::sampleFormat() const
{
    switch (outputBitDepth) {
        case 16: return SampleFormat::Int16;
        case 32: return SampleFormat::Float32;
        default: return SampleFormat::Int24;
    }
}

ServiceConfiguration ServiceConfiguration::fromJson(std::string_view json)
{
    choc::value::Value root;
    try {
        root = choc::json::parse(json);
    } catch (const choc::json::ParseError& e) {
        throw configError(std::format("{} (line {}, column {})", e.what(), e.lineAndColumn.line, e.lineAndColumn.column));
    }
    if (!root.isObject())
        throw configError("the top level must be an object");

    ServiceConfiguration config;
    std::string outputDirectory;
    readString(root, "outputDirectory", outputDirectory);
    if (!outputDirectory.empty())
        config.outputDirectory = outputDirectory;
    readString(root, "outputFormat", config.outputFormat);
    readUnsigned(root, "outputBitDepth", config.outputBitDepth);
    readUnsigned(root, "workerCount", config.workerCount);
    readUnsigned(root, "maxPendingTasks", config.maxPendingTasks);
    readUnsigned(root, "retentionSeconds", config.retentionSeconds);
    readUnsigned(root, "sweepIntervalSeconds", config.sweepIntervalSeconds);
    if (root.hasObjectMember("separation"))
        readSeparation(root["separation"], config.separation);

    config.validate();
    return config;
}

ServiceConfiguration ServiceConfiguration::load(const std::filesystem::path& path)
{
    std::ifstream ifs{path};
    if (!ifs)
        throw configError(std::format("cannot open {}", path.string()));
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return fromJson(ss.str());
}

std::string ServiceConfiguration::toJson() const
{
    auto sep = choc::value::createObject("SeparationSettings",
        "frameSize", static_cast<int64_t>(separation.frameSize),
        "hopSize", static_cast<int64_t>(separation.hopSize),
        "harmonicFilterWidth", static_cast<int64_t>(separation.harmonicFilterWidth),
        "percussiveFilterWidth", static_cast<int64_t>(separation.percussiveFilterWidth),
        "maskPower", static_cast<double>(separation.maskPower),
        "dominanceThreshold", static_cast<double>(separation.dominanceThreshold),
        "subtractionStrength", static_cast<double>(separation.subtractionStrength),
        "vocalBandLowHz", separation.vocalBandLowHz,
        "vocalBandHighHz", separation.vocalBandHighHz,
        "outOfBandVocalGain", static_cast<double>(separation.outOfBandVocalGain));

    auto j = choc::value::createObject("ServiceConfiguration",
        "outputDirectory", outputDirectory.string(),
        "outputFormat", outputFormat,
        "outputBitDepth", static_cast<int64_t>(outputBitDepth),
        "workerCount", static_cast<int64_t>(workerCount),
        "maxPendingTasks", static_cast<int64_t>(maxPendingTasks),
        "retentionSeconds", retentionSeconds,
        "sweepIntervalSeconds", sweepIntervalSeconds,
        "separation", sep);
    return choc::json::toString(j, true);
}

void ServiceConfiguration::save(const std::filesystem::path& path) const
{
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path()))
        std::filesystem::create_directories(path.parent_path());

    std::ofstream ofs{path};
    if (!ofs)
        throw configError(std::format("cannot write {}", path.string()));
    ofs << toJson();
}

} // namespace lionsfx
