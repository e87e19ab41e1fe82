#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <optional>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace bridgefinder {

/*
    Installs the process wide default logger: a daily rotating file under
    `log_dir` plus coloured stderr output. Library code logs through the
    spdlog::info()/debug()/... free functions.

        bridgefinder::Logger logger(spdlog::level::info, core::path::kLogDir);
*/
class Logger {
    using LoggerType = spdlog::async_logger;

public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);

        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (log_dir / "bridgefinder.log").string(), 0, 0, false, 7, handlers);
        // stdout is reserved for results.
        console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        logger_ = std::make_shared<LoggerType>("bridgefinder",
                                               spdlog::sinks_init_list{file_sink, console_sink_},
                                               thread_pool_,
                                               spdlog::async_overflow_policy::overrun_oldest);

#ifdef BRIDGEFINDER_RELEASE
        console_sink_->set_level(Level::warn);
#endif
#ifdef BRIDGEFINDER_DEBUG
        level = Level::debug;
#endif
        logger_->set_level(level);
        logger_->flush_on(Level::warn);
        logger_->set_error_handler(
            [](const std::string& msg) {
                std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str());
            });

        console_sink_->set_pattern("\033[36m[%H:%M:%S.%e] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
    }

    // "debug", "info", "warning"/"warn", "error"/"err"; std::nullopt otherwise.
    static std::optional<Level> ParseLevel(std::string_view name) {
        if (name == "warning") {
            return Level::warn;
        }
        auto level = spdlog::level::from_str(std::string(name));
        if (level == Level::off && name != "off") {
            return std::nullopt;
        }
        return level;
    }

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

private:
    std::shared_ptr<LoggerType> logger_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
};

} // namespace bridgefinder
