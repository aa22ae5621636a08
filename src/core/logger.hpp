/**
 * Mnemo Logger
 *
 * File-based logging for failed attempts and failsafe diagnosis.
 * Logs to ~/.mnemo/mnemo.log with timestamps and rotation.
 * Nothing is written until init() succeeds.
 */

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <cstdint>
#include <cstdlib>
#include <system_error>

namespace mnemo {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // Named ERR to avoid Windows ERROR macro conflict
        FATAL
    };

    static constexpr uintmax_t MAX_LOG_SIZE = 10 * 1024 * 1024;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "", bool debug = false) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (initialized_) {
            debug_ = debug;
            return true;
        }

        // Determine log directory
        std::string dir = log_dir;
        if (dir.empty()) {
            const char* home = nullptr;
#ifdef _WIN32
            home = std::getenv("USERPROFILE");
#else
            home = std::getenv("HOME");
#endif
            if (home) {
                dir = std::string(home) + "/.mnemo";
            } else {
                dir = ".";
            }
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        log_path_ = dir + "/mnemo.log";
        rotate_if_needed();

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        initialized_ = true;
        debug_ = debug;

        // Write directly: the mutex is already held
        log_file_ << timestamp() << " [INFO ] === Mnemo Logger Started ===\n";
        log_file_.flush();

        return true;
    }

    void log(Level level, const std::string& message) {
        if (!initialized_) return;
        if (level == Level::DEBUG && !debug_) return;

        std::lock_guard<std::mutex> lock(mutex_);

        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    void log_startup(const std::string& version, size_t count, const std::string& pattern,
                     const std::string& wordlist_dir) {
        std::stringstream ss;
        ss << "STARTUP: Version=" << version
           << ", Count=" << count
           << ", Pattern=" << (pattern.empty() ? "<random>" : pattern)
           << ", Wordlists=" << wordlist_dir;
        log(Level::INFO, ss.str());
    }

    void log_config_loaded(const std::string& path) {
        log(Level::INFO, "CONFIG: Loaded " + path);
    }

    void log_wordlist_loaded(const std::string& name, size_t entries) {
        std::stringstream ss;
        ss << "WORDLIST: Cached " << name << " (" << entries << " entries)";
        log(Level::DEBUG, ss.str());
    }

    void log_attempt_failed(int attempt, const std::string& pattern, const std::string& reason) {
        std::stringstream ss;
        ss << "ATTEMPT_FAILED: Attempt=" << attempt
           << ", Pattern=" << pattern
           << ", Reason=" << reason;
        log(Level::WARN, ss.str());
    }

    void log_failsafe(int attempts, const std::string& last_pattern) {
        std::stringstream ss;
        ss << "FAILSAFE: All " << attempts << " attempts failed"
           << ", LastPattern=" << last_pattern;
        log(Level::WARN, ss.str());
    }

    void log_shutdown(size_t generated, double elapsed_sec) {
        std::stringstream ss;
        ss << "SHUTDOWN: Generated=" << generated
           << ", ElapsedSec=" << std::fixed << std::setprecision(3) << elapsed_sec;
        log(Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    std::string get_log_path() const { return log_path_; }
    bool is_initialized() const { return initialized_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== Mnemo Logger Stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false), debug_(false) {}

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Move an oversized log aside; a failed rotation keeps appending
    void rotate_if_needed() {
        std::error_code ec;
        if (!std::filesystem::exists(log_path_, ec)) return;

        auto size = std::filesystem::file_size(log_path_, ec);
        if (ec || size <= MAX_LOG_SIZE) return;

        std::string backup = log_path_ + ".old";
        std::filesystem::remove(backup, ec);
        std::filesystem::rename(log_path_, backup, ec);
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    bool initialized_;
    bool debug_;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_INFO(msg)  mnemo::Logger::instance().log(mnemo::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  mnemo::Logger::instance().log(mnemo::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) mnemo::Logger::instance().log(mnemo::Logger::Level::ERR, msg)
#define LOG_DEBUG(msg) mnemo::Logger::instance().log(mnemo::Logger::Level::DEBUG, msg)

}  // namespace mnemo
