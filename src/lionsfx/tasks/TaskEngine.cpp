#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <system_error>
#include <thread>
#include <unordered_map>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

void TaskContext::reportProgress(int percent)
{
    engine_.reportProgress(id_, percent);
}

ProgressCallback TaskContext::progressCallback()
{
    return [this](int percent) { reportProgress(percent); };
}

namespace {

struct TaskRecord {
    std::mutex mutex{};
    TaskSnapshot state{};
    std::chrono::steady_clock::time_point createdSteady{};
    // released once the task starts, so the input buffer dies with the worker's stack frame
    TaskWorkUnit work{};
};

class TaskEngineImpl : public TaskEngine {
    TaskEngineOptions options_;

    std::shared_mutex registry_mutex_{};
    std::unordered_map<std::string, std::shared_ptr<TaskRecord>> tasks_{};
    std::mt19937_64 id_generator_{std::random_device{}()};

    // lock order: queue_mutex_, then registry_mutex_, then a task mutex
    std::mutex queue_mutex_{};
    std::condition_variable queue_cv_{};
    std::deque<std::shared_ptr<TaskRecord>> pending_{};

    std::vector<std::thread> workers_{};
    std::thread reaper_{};
    std::mutex reaper_mutex_{};
    std::condition_variable reaper_cv_{};

    std::atomic<bool> stopping_{false};
    std::mutex shutdown_mutex_{};
    bool shut_down_{false};
    std::atomic<uint64_t> total_submitted_{0};

    std::string generateIdLocked();
    void workerLoop(size_t index);
    void reaperLoop();
    void runTask(const std::shared_ptr<TaskRecord>& task);
    void finishTask(TaskRecord& task, std::optional<TaskResult> result, std::optional<TaskError> error);
    void stopThreads();

public:
    explicit TaskEngineImpl(TaskEngineOptions options);
    ~TaskEngineImpl() override;

    SubmitResult submit(TaskKind kind, std::string description, TaskWorkUnit workUnit) override;
    std::optional<TaskSnapshot> getStatus(const std::string& taskId) override;
    void reportProgress(const std::string& taskId, int percent) override;
    size_t reapExpiredTasks() override;
    TaskEngineStatistics statistics() override;
    const TaskEngineOptions& options() const override { return options_; }
    void shutdown() override;
};

TaskEngineOptions resolveOptions(TaskEngineOptions options)
{
    if (options.workerCount == 0)
        options.workerCount = std::max<size_t>(kMinDefaultWorkers, std::thread::hardware_concurrency());
    if (options.retention.count() < 0)
        throw AudioJobError(ErrorKind::InvalidParameter, "Task retention must not be negative");
    if (options.sweepInterval.count() <= 0)
        throw AudioJobError(ErrorKind::InvalidParameter, "Reaper sweep interval must be positive");
    return options;
}

TaskEngineImpl::TaskEngineImpl(TaskEngineOptions options)
    : options_(resolveOptions(options))
{
    workers_.reserve(options_.workerCount);
    try {
        for (size_t i = 0; i < options_.workerCount; ++i)
            workers_.emplace_back([this, i] { workerLoop(i); });
        reaper_ = std::thread([this] { reaperLoop(); });
    } catch (const std::system_error& e) {
        // the destructor does not run for a throwing constructor
        stopThreads();
        throw AudioJobError(ErrorKind::ResourceExhausted, std::format("Cannot start task engine threads: {}", e.what()));
    }

    Logger::global()->logInfo("Task engine started: %zu workers, queue limit %zu (0: none), retention %lld s",
                              options_.workerCount, options_.maxPendingTasks,
                              static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(options_.retention).count()));
}

TaskEngineImpl::~TaskEngineImpl()
{
    shutdown();
}

std::string TaskEngineImpl::generateIdLocked()
{
    while (true) {
        auto id = std::format("{:016x}", id_generator_());
        if (!tasks_.contains(id))
            return id;
    }
}

SubmitResult TaskEngineImpl::submit(TaskKind kind, std::string description, TaskWorkUnit workUnit)
{
    SubmitResult result;
    if (!workUnit) {
        result.error = TaskError{ErrorKind::InvalidParameter, "Task has no work unit"}.displayMessage();
        return result;
    }

    std::lock_guard queueLock(queue_mutex_);
    if (stopping_) {
        result.error = TaskError{ErrorKind::ProcessingError, "Task engine is shut down"}.displayMessage();
        return result;
    }
    if (options_.maxPendingTasks > 0 && pending_.size() >= options_.maxPendingTasks) {
        result.error = TaskError{ErrorKind::ResourceExhausted,
                                 std::format("Too many pending tasks ({})", pending_.size())}.displayMessage();
        Logger::global()->logWarning("Rejected task (%s): admission queue is full", description.c_str());
        return result;
    }

    auto task = std::make_shared<TaskRecord>();
    task->state.kind = kind;
    task->state.status = TaskStatus::Queued;
    task->state.progress = 0;
    task->state.description = std::move(description);
    task->state.createdAt = std::chrono::system_clock::now();
    task->createdSteady = std::chrono::steady_clock::now();
    task->work = std::move(workUnit);
    {
        std::unique_lock registryLock(registry_mutex_);
        task->state.id = generateIdLocked();
        tasks_.emplace(task->state.id, task);
    }
    pending_.push_back(task);
    ++total_submitted_;

    Logger::global()->logInfo("Task %s queued (%s): %s", task->state.id.c_str(), taskKindName(kind), task->state.description.c_str());

    result.success = true;
    result.taskId = task->state.id;
    queue_cv_.notify_one();
    return result;
}

std::optional<TaskSnapshot> TaskEngineImpl::getStatus(const std::string& taskId)
{
    std::shared_ptr<TaskRecord> task;
    {
        std::shared_lock lock(registry_mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end())
            return std::nullopt;
        task = it->second;
    }
    std::lock_guard lock(task->mutex);
    return task->state;
}

void TaskEngineImpl::reportProgress(const std::string& taskId, int percent)
{
    std::shared_ptr<TaskRecord> task;
    {
        std::shared_lock lock(registry_mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end())
            return;
        task = it->second;
    }
    const int clamped = std::clamp(percent, 0, 100);
    std::lock_guard lock(task->mutex);
    if (task->state.status == TaskStatus::Processing && clamped >= task->state.progress)
        task->state.progress = clamped;
}

void TaskEngineImpl::workerLoop(size_t index)
{
    setCurrentThreadNameIfPossible(std::format("lionsfx-w{}", index));
    while (true) {
        std::shared_ptr<TaskRecord> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (pending_.empty())
                return;
            task = std::move(pending_.front());
            pending_.pop_front();
        }
        runTask(task);
    }
}

void TaskEngineImpl::runTask(const std::shared_ptr<TaskRecord>& task)
{
    TaskWorkUnit work;
    std::string id;
    {
        std::lock_guard lock(task->mutex);
        task->state.status = TaskStatus::Processing;
        task->state.progress = 0;
        task->state.startedAt = std::chrono::system_clock::now();
        work = std::move(task->work);
        task->work = nullptr;
        id = task->state.id;
    }
    Logger::global()->logInfo("Task %s started", id.c_str());

    TaskContext context(*this, id);
    try {
        auto result = work(context);
        finishTask(*task, std::move(result), std::nullopt);
    } catch (const AudioJobError& e) {
        finishTask(*task, std::nullopt, TaskError{e.kind(), e.what()});
    } catch (const std::exception& e) {
        finishTask(*task, std::nullopt, TaskError{ErrorKind::ProcessingError, e.what()});
    } catch (...) {
        finishTask(*task, std::nullopt, TaskError{ErrorKind::ProcessingError, "unknown error"});
    }
}

void TaskEngineImpl::finishTask(TaskRecord& task, std::optional<TaskResult> result, std::optional<TaskError> error)
{
    std::string id;
    std::string message;
    std::chrono::milliseconds elapsed{};
    {
        std::lock_guard lock(task.mutex);
        const auto now = std::chrono::system_clock::now();
        if (error) {
            task.state.status = TaskStatus::Failed;
            task.state.error = std::move(error);
            message = task.state.error->displayMessage();
        } else {
            task.state.status = TaskStatus::Completed;
            task.state.progress = 100;
            task.state.result = std::move(result);
        }
        task.state.finishedAt = now;
        if (task.state.startedAt)
            elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *task.state.startedAt);
        id = task.state.id;
    }

    if (message.empty())
        Logger::global()->logInfo("Task %s completed in %lld ms", id.c_str(), static_cast<long long>(elapsed.count()));
    else
        Logger::global()->logError("Task %s failed: %s", id.c_str(), message.c_str());
}

size_t TaskEngineImpl::reapExpiredTasks()
{
    const auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    {
        std::unique_lock registryLock(registry_mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            bool expired;
            {
                std::lock_guard lock(it->second->mutex);
                expired = isTerminal(it->second->state.status) && now - it->second->createdSteady >= options_.retention;
            }
            if (expired) {
                it = tasks_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0)
        Logger::global()->logInfo("Reaper removed %zu expired task(s)", removed);
    return removed;
}

void TaskEngineImpl::reaperLoop()
{
    setCurrentThreadNameIfPossible("lionsfx-reaper");
    std::unique_lock lock(reaper_mutex_);
    while (!reaper_cv_.wait_for(lock, options_.sweepInterval, [this] { return stopping_.load(); })) {
        lock.unlock();
        reapExpiredTasks();
        lock.lock();
    }
}

TaskEngineStatistics TaskEngineImpl::statistics()
{
    TaskEngineStatistics stats;
    stats.workerCount = workers_.size();
    stats.totalSubmitted = total_submitted_;
    {
        std::lock_guard lock(queue_mutex_);
        stats.pendingQueueDepth = pending_.size();
    }
    std::shared_lock registryLock(registry_mutex_);
    for (auto& [id, task] : tasks_) {
        std::lock_guard lock(task->mutex);
        switch (task->state.status) {
            case TaskStatus::Queued: ++stats.queued; break;
            case TaskStatus::Processing: ++stats.processing; break;
            case TaskStatus::Completed: ++stats.completed; break;
            case TaskStatus::Failed: ++stats.failed; break;
        }
    }
    return stats;
}

void TaskEngineImpl::stopThreads()
{
    {
        std::lock_guard lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    {
        std::lock_guard lock(reaper_mutex_);
    }
    reaper_cv_.notify_all();

    for (auto& worker : workers_)
        if (worker.joinable())
            worker.join();
    if (reaper_.joinable())
        reaper_.join();
}

void TaskEngineImpl::shutdown()
{
    std::lock_guard shutdownLock(shutdown_mutex_);
    if (shut_down_)
        return;

    std::deque<std::shared_ptr<TaskRecord>> abandoned;
    {
        std::lock_guard lock(queue_mutex_);
        stopping_ = true;
        abandoned.swap(pending_);
    }
    for (auto& task : abandoned) {
        {
            std::lock_guard lock(task->mutex);
            task->work = nullptr;
        }
        finishTask(*task, std::nullopt, TaskError{ErrorKind::ProcessingError, "engine shut down before the task started"});
    }

    stopThreads();

    shut_down_ = true;
    Logger::global()->logInfo("Task engine shut down (%zu queued task(s) abandoned)", abandoned.size());
}

} // namespace

std::unique_ptr<TaskEngine> TaskEngine::create(TaskEngineOptions options)
{
    return std::make_unique<TaskEngineImpl>(options);
}

} // namespace lionsfx
