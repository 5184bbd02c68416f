#include "chunkflow/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace chunkflow {

Result<void> configure_logging(const LoggingOptions& options) {
    const auto level = spdlog::level::from_str(options.level);
    if (level == spdlog::level::off && options.level != "off") {
        return Err<void>("Unknown log level: " + options.level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!options.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file.string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            return Err<void>(std::string("Cannot open log file: ") + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("chunkflow", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(options.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return Ok();
}

} // namespace chunkflow
