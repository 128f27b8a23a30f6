#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

namespace searchlink {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(const Options& options) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!options.log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false));
        }

        auto logger = std::make_shared<spdlog::logger>("searchlink", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(options.level));
        logger->set_pattern(options.pattern);

        logger_ = logger;
        logger_->debug("Logger initialized (level={}, file={})",
                       levelToString(options.level),
                       options.log_file.empty() ? "<none>" : options.log_file);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "searchlink: log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::init(const std::string& log_file, Level level) {
    Options options;
    options.log_file = log_file;
    options.level = level;
    init(options);
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        logger_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        init(); // Auto-initialize with defaults
    }
    return logger_;
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

void Logger::setLevel(Level level) {
    get()->set_level(toSpdlogLevel(level));
}

void Logger::setPattern(const std::string& pattern) {
    get()->set_pattern(pattern);
}

std::optional<Logger::Level> Logger::levelFromString(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return std::nullopt;
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace searchlink
