#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace orderguard {

namespace {
// Reasons may contain commas; keep the CSV row parseable.
std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += "\"\"";
        else if (c == '\n') out += ' ';
        else out += c;
    }
    out += "\"";
    return out;
}
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/orderguard.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        order_logger_ = spdlog::daily_logger_mt("orders", logs_path.string() + "/orders.log");
        order_logger_->set_pattern("%Y-%m-%dT%H:%M:%S.%e,%v");
        order_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized (level={})", level);
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        main_logger_.reset();
        order_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logOrder(const std::string& intent_id, const std::string& symbol,
                      const std::string& side, const std::string& qty,
                      const std::string& order_type, const std::string& outcome,
                      const std::string& reason) {
    if (order_logger_) {
        std::ostringstream oss;
        oss << csvField(intent_id) << "," << csvField(symbol) << ","
            << side << "," << qty << "," << order_type << ","
            << outcome << "," << csvField(reason);
        order_logger_->info(oss.str());
    }
}

void Logger::shutdown() {
    if (main_logger_) {
        main_logger_->flush();
    }
    if (order_logger_) {
        order_logger_->flush();
    }
    spdlog::shutdown();
    main_logger_.reset();
    order_logger_.reset();
    initialized_ = false;
}

} // namespace orderguard
