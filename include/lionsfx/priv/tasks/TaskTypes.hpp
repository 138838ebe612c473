#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "../common.hpp"

namespace lionsfx {

    enum class TaskKind {
        Separate,
        ApplyEffect
    };

    // Queued -> Processing -> Completed | Failed. Terminal states never change.
    enum class TaskStatus {
        Queued,
        Processing,
        Completed,
        Failed
    };

    const char* taskKindName(TaskKind kind);
    const char* taskStatusName(TaskStatus status);
    inline bool isTerminal(TaskStatus status) {
        return status == TaskStatus::Completed || status == TaskStatus::Failed;
    }

    struct SeparationResult {
        std::string vocalPath{};
        std::string instrumentalPath{};
    };

    struct EffectResult {
        std::string outputPath{};
    };

    using TaskResult = std::variant<SeparationResult, EffectResult>;

    struct TaskError {
        ErrorKind kind{ErrorKind::ProcessingError};
        std::string message{};

        // "<Kind>: <message>", suitable for display.
        std::string displayMessage() const;
    };

    // Consistent copy of a task, taken under the task's lock.
    struct TaskSnapshot {
        std::string id{};
        TaskKind kind{TaskKind::Separate};
        TaskStatus status{TaskStatus::Queued};
        int progress{0};
        std::string description{};
        std::chrono::system_clock::time_point createdAt{};
        std::optional<std::chrono::system_clock::time_point> startedAt{};
        std::optional<std::chrono::system_clock::time_point> finishedAt{};
        // present only when Completed
        std::optional<TaskResult> result{};
        // present only when Failed
        std::optional<TaskError> error{};
    };

    struct SubmitResult {
        bool success{false};
        std::string taskId{};
        // "<Kind>: <message>" when the submission was rejected
        std::string error{};
    };

    struct TaskEngineStatistics {
        size_t queued{0};
        size_t processing{0};
        size_t completed{0};
        size_t failed{0};
        size_t pendingQueueDepth{0};
        size_t workerCount{0};
        uint64_t totalSubmitted{0};
    };

}
