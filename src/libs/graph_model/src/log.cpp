#include <graph_model/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace graph_model {

std::shared_ptr<spdlog::logger> graph_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        logger = spdlog::get("task_graph");
        if (!logger) {
            logger = spdlog::stderr_color_mt("task_graph");
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        }
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace graph_model
