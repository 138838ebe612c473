#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "TaskTypes.hpp"

namespace lionsfx {

    class TaskEngine;

    // Handed to a running work unit. It is the only way a work unit talks back to the engine
    // besides its return value or the exception it throws.
    class TaskContext {
        TaskEngine& engine_;
        std::string id_;

    public:
        TaskContext(TaskEngine& engine, std::string id) : engine_(engine), id_(std::move(id)) {}

        const std::string& id() const { return id_; }
        void reportProgress(int percent);
        ProgressCallback progressCallback();
    };

    using TaskWorkUnit = std::function<TaskResult(TaskContext& context)>;

    inline constexpr size_t kMinDefaultWorkers = 2;

    struct TaskEngineOptions {
        // 0 picks std::thread::hardware_concurrency(), but never fewer than kMinDefaultWorkers
        size_t workerCount{0};
        // tasks waiting for a worker; submissions beyond this are rejected. 0 means unbounded.
        size_t maxPendingTasks{0};
        // terminal tasks older than this (measured from creation) are removed
        std::chrono::milliseconds retention{std::chrono::hours(1)};
        std::chrono::milliseconds sweepInterval{std::chrono::minutes(1)};
    };

    // Owns the task registry, a fixed worker pool fed by a FIFO admission queue (optionally bounded),
    // and the reaper thread. All member functions are thread-safe.
    class TaskEngine {
    protected:
        TaskEngine() = default;

    public:
        virtual ~TaskEngine() = default;

        // Throws AudioJobError(InvalidParameter) for unusable options.
        static std::unique_ptr<TaskEngine> create(TaskEngineOptions options = {});

        // Registers a Queued task and returns without waiting for any processing.
        // Fails only when a bounded admission queue is full or the engine is shut down.
        virtual SubmitResult submit(TaskKind kind, std::string description, TaskWorkUnit workUnit) = 0;

        // std::nullopt when the id is unknown or the task has been reaped.
        virtual std::optional<TaskSnapshot> getStatus(const std::string& taskId) = 0;

        // Clamped to [0, 100]; ignored unless the task is Processing and the value does not go backwards.
        virtual void reportProgress(const std::string& taskId, int percent) = 0;

        // One reaper sweep. Returns the number of removed tasks.
        virtual size_t reapExpiredTasks() = 0;

        virtual TaskEngineStatistics statistics() = 0;
        virtual const TaskEngineOptions& options() const = 0;

        // Stops admission, fails the tasks still waiting in the queue, waits for running
        // tasks and joins all threads. Idempotent; also run by the destructor.
        virtual void shutdown() = 0;
    };

}
