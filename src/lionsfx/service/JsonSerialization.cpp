#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

namespace {

int64_t epochMilliseconds(std::chrono::system_clock::time_point t)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

choc::value::Value stringArray(const std::vector<std::string>& items)
{
    std::vector<choc::value::Value> values;
    for (auto& item : items)
        values.emplace_back(choc::value::createString(item));
    return choc::value::createArray(values);
}

choc::value::Value resultToJson(const TaskResult& result)
{
    if (auto separation = std::get_if<SeparationResult>(&result))
        return choc::value::createObject("SeparationResult",
                                         "vocals", separation->vocalPath,
                                         "instrumental", separation->instrumentalPath);
    const auto& effect = std::get<EffectResult>(result);
    return choc::value::createObject("EffectResult", "output", effect.outputPath);
}

} // namespace

choc::value::Value toJson(const TaskSnapshot& snapshot)
{
    auto j = choc::value::createObject("Task",
        "id", snapshot.id,
        "kind", std::string{taskKindName(snapshot.kind)},
        "status", std::string{taskStatusName(snapshot.status)},
        "progress", static_cast<int32_t>(snapshot.progress),
        "description", snapshot.description,
        "createdAt", epochMilliseconds(snapshot.createdAt));
    if (snapshot.startedAt)
        j.addMember("startedAt", epochMilliseconds(*snapshot.startedAt));
    if (snapshot.finishedAt)
        j.addMember("finishedAt", epochMilliseconds(*snapshot.finishedAt));
    if (snapshot.result)
        j.addMember("result", resultToJson(*snapshot.result));
    if (snapshot.error) {
        j.addMember("error", snapshot.error->displayMessage());
        j.addMember("errorKind", std::string{errorKindName(snapshot.error->kind)});
    }
    return j;
}

choc::value::Value toJson(const ServiceStatus& status)
{
    const auto& e = status.engine;
    auto engine = choc::value::createObject("EngineStatistics",
        "queued", static_cast<int64_t>(e.queued),
        "processing", static_cast<int64_t>(e.processing),
        "completed", static_cast<int64_t>(e.completed),
        "failed", static_cast<int64_t>(e.failed),
        "pendingQueueDepth", static_cast<int64_t>(e.pendingQueueDepth),
        "workerCount", static_cast<int64_t>(e.workerCount),
        "totalSubmitted", static_cast<int64_t>(e.totalSubmitted));

    return choc::value::createObject("ServiceStatus",
        "name", status.name,
        "version", status.version,
        "status", std::string{"running"},
        "supportedInputFormats", stringArray(status.supportedInputFormats),
        "supportedEffects", stringArray(status.supportedEffects),
        "outputFormat", status.outputFormat,
        "engine", engine);
}

choc::value::Value toJson(const AudioFileInfo& info)
{
    return choc::value::createObject("AudioFileInfo",
        "path", info.path.string(),
        "format", info.formatName,
        "sampleRate", static_cast<int64_t>(info.sampleRate),
        "channels", static_cast<int64_t>(info.numChannels),
        "frames", static_cast<int64_t>(info.numFrames),
        "duration", info.durationSeconds,
        "fileSize", static_cast<int64_t>(info.fileSizeBytes));
}

} // namespace lionsfx
