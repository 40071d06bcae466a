#include "logger.h"
#include "utils.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace vortex_l0 {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG] ";
        case LogLevel::INFO:  return "[INFO ] ";
        case LogLevel::WARN:  return "[WARN ] ";
        case LogLevel::ERROR: return "[ERROR] ";
    }
    return "[?????] ";
}

std::string local_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::ostream& console_for(LogLevel level) {
    return level >= LogLevel::WARN ? std::cerr : std::cout;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    const std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

// One instance for the process; every member takes mutex_, so query_async
// threads may log while another thread calls shutdown().
class Logger::Impl {
public:
    void open(LogLevel min_level, const std::string& output_file) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = min_level;
        active_ = true;
        if (output_file.empty() || output_file == file_path_) {
            return;
        }
        file_.close();
        file_.clear();
        file_path_ = output_file;
        file_.open(output_file, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Warning: cannot open log file " << output_file << ", logging to console only"
                      << std::endl;
            file_path_.clear();
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        min_level_ = LogLevel::INFO;
        if (file_.is_open()) {
            file_.flush();
            file_.close();
        }
        file_path_.clear();
    }

    void write(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            if (level != LogLevel::DEBUG) {
                console_for(level) << message << std::endl;
            }
            return;
        }
        if (level < min_level_) {
            return;
        }

        const std::string line = level_tag(level) + local_timestamp() + ": " + message;
        console_for(level) << line << std::endl;
        if (file_.is_open()) {
            file_ << line << '\n';
            if (level >= LogLevel::WARN) file_.flush();
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    bool active_ = false;
    LogLevel min_level_ = LogLevel::INFO;
    std::string file_path_;
    std::ofstream file_;
};

Logger::Impl& Logger::instance() {
    static Impl impl;
    return impl;
}

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    instance().open(min_level, output_file);
}

void Logger::shutdown() {
    instance().close();
}

void Logger::log(LogLevel level, const std::string& message) {
    instance().write(level, message);
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message)  { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message)  { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

void Logger::set_level(LogLevel level) {
    instance().set_level(level);
}

LogLevel Logger::get_level() {
    return instance().level();
}

} // namespace vortex_l0
