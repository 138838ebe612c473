#pragma once

#include <cstdarg>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#if !WIN32
#include <pthread.h>
#endif

namespace lionsfx {

    class Logger {
    public:
        class Impl;

#undef ERROR
        enum LogLevel {
            DIAGNOSTIC,
            INFO,
            WARNING,
            ERROR
        };

        static Logger* global();
        void logError(const char* format, ...);
        void logWarning(const char* format, ...);
        void logInfo(const char* format, ...);
        void logDiagnostic(const char* format, ...);
        static void stopDefaultLogger();

        Logger();
        ~Logger();

        void log(LogLevel level, const char* format, ...);
        void logv(LogLevel level, const char* format, va_list args);

        std::vector<std::function<void(LogLevel level, size_t serial, const char* s)>> callbacks;

    private:
        Impl *impl{nullptr};
    };

    enum class ErrorKind {
        DecodeError,
        EncodeError,
        InvalidParameter,
        ProcessingError,
        NotFound,
        ResourceExhausted
    };

    const char* errorKindName(ErrorKind kind);

    // Thrown by the codec, the DSP code and the job service.
    // The task engine converts it into a failed task, keeping the kind.
    class AudioJobError : public std::runtime_error {
        ErrorKind kind_;
    public:
        AudioJobError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const { return kind_; }
    };

    // Reports coarse progress in percent (0-100).
    using ProgressCallback = std::function<void(int percent)>;

    inline void setCurrentThreadNameIfPossible(std::string const threadName) {
#if __APPLE__
        pthread_setname_np(threadName.c_str());
#elif defined(__unix__)
        // Linux limits thread names to 15 characters.
        pthread_setname_np(pthread_self(), threadName.substr(0, 15).c_str());
#endif
    }

}
