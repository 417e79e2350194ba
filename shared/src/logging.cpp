#include "portbridge/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace portbridge {

std::shared_ptr<spdlog::logger> init_logging(const std::string& path, const std::string& level) {
    spdlog::drop(logger_name);

    std::shared_ptr<spdlog::logger> logger;
    if (path.empty()) {
        logger = spdlog::stderr_color_mt(logger_name);
    } else {
        logger = spdlog::basic_logger_mt(logger_name, path);
    }
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return logger;
}

} // namespace portbridge
