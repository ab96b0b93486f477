#pragma once

#include <graph_model/document.hpp>

namespace graph_loaders {

// Small release-planning graph shown when no document file exists yet.
graph_model::GraphDocument generate_sample_graph();

} // namespace graph_loaders
