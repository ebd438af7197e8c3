// include/trend_lab/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "trend_lab/core/config_base.hpp"

namespace trend_lab {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERR,  // aborted run
    FATAL
};

enum class LogDestination { CONSOLE, FILE, BOTH };

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination destination);
Result<LogLevel> level_from_string(const std::string& str);
Result<LogDestination> log_destination_from_string(const std::string& str);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"trend_lab"};  // <prefix>_<YYYYMMDD_HHMMSS>_part<N>.log
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // bytes before rotating to the next part
    size_t max_files{5};                     // oldest files beyond this are deleted

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide logger shared by the engine, the data sources and the apps
 *
 * Messages logged before initialize() go to stderr with a warning.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration and open a new log session
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close the current file and return to the uninitialized state
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level);

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages logged from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void rotate_log_files();
    void enforce_retention();
    void open_log_file();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};  // read by LOG without the mutex
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;
    int current_part_number_{1};
};

// LOG(level, "window=" << w): the stream expression is only evaluated when the level is enabled
#define LOG(level, message)                                                     \
    do {                                                                        \
        if (level >= ::trend_lab::Logger::instance().get_min_level()) {         \
            std::ostringstream os;                                              \
            os << message;                                                      \
            ::trend_lab::Logger::instance().log(level, os.str());               \
        }                                                                       \
    } while (0)

#define TRACE(message) LOG(::trend_lab::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::trend_lab::LogLevel::DEBUG, message)
#define INFO(message) LOG(::trend_lab::LogLevel::INFO, message)
#define WARN(message) LOG(::trend_lab::LogLevel::WARNING, message)
#define ERROR(message) LOG(::trend_lab::LogLevel::ERR, message)
#define FATAL(message) LOG(::trend_lab::LogLevel::FATAL, message)
}  // namespace trend_lab
