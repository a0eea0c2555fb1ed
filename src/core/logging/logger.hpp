#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace conductor::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole process shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Redirects output; the stream must outlive every later log call.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        // Run id tag for log lines written by the calling thread.
        static void set_thread_run_id(const std::string& id) {
            thread_run_id() = id;
        }

        static const std::string& current_run_id() {
            return thread_run_id();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            const std::string& run_id = thread_run_id();
            *out_ << "[" << level_to_string(level) << "] "
                  << (run_id.empty() ? "" : "[" + run_id + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::ostream* out_ = &std::cout;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string& thread_run_id() {
            thread_local std::string run_id;
            return run_id;
        }

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // Tags the current thread's log lines with a run id for the scope's lifetime.
    class ScopedRunId {
    public:
        explicit ScopedRunId(const std::string& run_id)
            : previous_(Logger::current_run_id()) {
            Logger::set_thread_run_id(run_id);
        }

        ~ScopedRunId() { Logger::set_thread_run_id(previous_); }

        ScopedRunId(const ScopedRunId&) = delete;
        ScopedRunId& operator=(const ScopedRunId&) = delete;

    private:
        std::string previous_;
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::ERROR, msg)

} // namespace conductor::core::logging
