#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Evo {

namespace fs = std::filesystem;

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(spdlog::level::level_enum level) {
        logger_->set_level(level);
    }

    // Accepts debug|info|warning|error|none. Unknown names leave the level as is.
    void setLogLevel(const std::string& name) {
        spdlog::level::level_enum level;
        if (parseLevel(name, level)) {
            setLogLevel(level);
        } else {
            logger_->warn("Unknown log level '" + name + "'");
        }
    }

    static bool parseLevel(const std::string& name, spdlog::level::level_enum& out) {
        if (name == "debug") out = spdlog::level::debug;
        else if (name == "info") out = spdlog::level::info;
        else if (name == "warning") out = spdlog::level::warn;
        else if (name == "error") out = spdlog::level::err;
        else if (name == "none") out = spdlog::level::off;
        else return false;
        return true;
    }

    void debug(const std::string& message) {
        logger_->debug(message);
    }

    void info(const std::string& message) {
        logger_->info(message);
    }

    void warning(const std::string& message) {
        logger_->warn(message);
    }

    void error(const std::string& message) {
        logger_->error(message);
    }

private:
    Logger() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks = {console_sink};

        // Add file sink if EVO_LOG_DIR is set
        const char* log_dir = std::getenv("EVO_LOG_DIR");
        if (log_dir) {
            fs::path log_path = fs::path(log_dir) / "evo_system.log";
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>("evo_logger", sinks.begin(), sinks.end());

        spdlog::level::level_enum level = spdlog::level::info;
        if (const char* env_level = std::getenv("EVO_LOG_LEVEL")) {
            parseLevel(env_level, level);
        }
        logger_->set_level(level);

        spdlog::set_default_logger(logger_);
    }

    ~Logger() {
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace Evo
