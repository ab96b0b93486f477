#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace graph_model {

// Shared "task_graph" logger used by the model, placement and loaders.
// Falls back to the spdlog default logger if the sink cannot be created.
std::shared_ptr<spdlog::logger> graph_logger();

} // namespace graph_model
