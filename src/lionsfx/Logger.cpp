#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>

#include <lionsfx/lionsfx.hpp>
#include <rtlog/rtlog.h>

constexpr auto MAX_NUM_LOG_MESSAGES = 256;
constexpr auto MAX_LOG_MESSAGE_LENGTH = 1024;

static std::atomic<std::size_t> log_serial{ 0 };

struct LogContext {
    lionsfx::Logger::LogLevel level;
    const lionsfx::Logger* owner;
};

// Worker threads of the task engine log concurrently, hence the multi-writer queue.
using QueuedLogger = rtlog::Logger<LogContext, MAX_NUM_LOG_MESSAGES, MAX_LOG_MESSAGE_LENGTH, log_serial, rtlog::MultiRealtimeWriterQueueType>;
static QueuedLogger queued_logger;

void lionsfx::Logger::log(LogLevel level, const char *format, ...) {
    va_list args;
    va_start(args, format);
    logv(level, format, args);
    va_end(args);
}

class CallbackMessageFunctor
{
public:
    CallbackMessageFunctor() = default;
    CallbackMessageFunctor(const CallbackMessageFunctor&) = delete;
    CallbackMessageFunctor(CallbackMessageFunctor&&) = delete;
    CallbackMessageFunctor& operator=(const CallbackMessageFunctor&) = delete;
    CallbackMessageFunctor& operator=(CallbackMessageFunctor&&) = delete;

#if WIN32
    void operator()(const LogContext& data, size_t serial, const char* format, ...)
#else
    void operator()(const LogContext& data, size_t serial, const char* format, ...) __attribute__ ((format (printf, 4, 5)))
#endif
    {
        std::array<char, MAX_LOG_MESSAGE_LENGTH> buffer;

        va_list args;
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);
        for (auto& func : data.owner->callbacks)
            func(data.level, serial, buffer.data());
    }
};

static CallbackMessageFunctor ForwardToCallbacks;

rtlog::LogProcessingThread<QueuedLogger, CallbackMessageFunctor>* getLaunchedLoggerThread() {
    static rtlog::LogProcessingThread thread(queued_logger, ForwardToCallbacks, std::chrono::milliseconds(10));
    return &thread;
}

class lionsfx::Logger::Impl {
    Logger* owner;

public:
    explicit Impl(Logger* owner) :
        owner(owner) {
        initializeGlobalLogger();
    }

    void initializeGlobalLogger();

    void logv(LogLevel level, const char *format, va_list args) {
        queued_logger.Logv(LogContext{.level = level, .owner = owner}, format, args);
    }
};

lionsfx::Logger::Logger() {
    impl = new Impl(this);
}

lionsfx::Logger::~Logger() {
    delete impl;
}

static const char* levelString(lionsfx::Logger::LogLevel level) {
    switch (level) {
        case lionsfx::Logger::LogLevel::INFO: return "I";
        case lionsfx::Logger::LogLevel::WARNING: return "W";
        case lionsfx::Logger::LogLevel::ERROR: return "E";
        case lionsfx::Logger::LogLevel::DIAGNOSTIC: return "D";
    }
    return "";
}

void lionsfx::Logger::Impl::initializeGlobalLogger() {
    static std::atomic<bool> loggerInitialized{false};

    if (!loggerInitialized.exchange(true)) {
        owner->callbacks.emplace_back([](lionsfx::Logger::LogLevel level, size_t serial, const char* s) {
            switch (level) {
                // DSP stages are chatty
                case LogLevel::DIAGNOSTIC: break;
                default:
                    std::cerr << "[lionsfx #" << serial << " (" << levelString(level) << ")]: " << s << std::endl;
                    break;
            }
        });
        getLaunchedLoggerThread();
    }
}

void lionsfx::Logger::logv(LogLevel level, const char *format, va_list args) {
    impl->logv(level, format, args);
}

void lionsfx::Logger::stopDefaultLogger() {
    getLaunchedLoggerThread()->Stop();
}

#define DEFINE_DEFAULT_LOGGER(UPPER, CAMEL) \
void lionsfx::Logger::log##CAMEL(const char *format, ...) { \
va_list args; \
va_start(args, format); \
impl->logv(UPPER, format, args); \
va_end(args); \
}

DEFINE_DEFAULT_LOGGER(ERROR , Error)
DEFINE_DEFAULT_LOGGER(WARNING , Warning)
DEFINE_DEFAULT_LOGGER(INFO , Info)
DEFINE_DEFAULT_LOGGER(DIAGNOSTIC , Diagnostic)

const char* lionsfx::errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DecodeError: return "DecodeError";
        case ErrorKind::EncodeError: return "EncodeError";
        case ErrorKind::InvalidParameter: return "InvalidParameter";
        case ErrorKind::ProcessingError: return "ProcessingError";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::ResourceExhausted: return "ResourceExhausted";
    }
    return "UnknownError";
}

static lionsfx::Logger instance{};
lionsfx::Logger* lionsfx::Logger::global() {
    return &instance;
}
