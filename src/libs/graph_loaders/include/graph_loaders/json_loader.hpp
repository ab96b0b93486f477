#pragma once

#include <graph_model/document.hpp>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace graph_loaders {

// Documents that are not an object, lack the "tasks"/"dependencies" arrays,
// or carry a task without a string name or a dependency without string
// endpoints are rejected. Missing "pos" is left unset; missing or unknown
// "status" reads as todo.
std::optional<graph_model::GraphDocument> load_graph_document_from_json(std::istream& in);
std::optional<graph_model::GraphDocument> load_graph_document_from_json_file(const std::string& path);
std::optional<graph_model::GraphDocument> load_graph_document_from_json_string(const std::string& text);

// Saving fails (false, or an empty string) when a name is not valid UTF-8.
bool save_graph_document_to_json(std::ostream& out, const graph_model::GraphDocument& document);
bool save_graph_document_to_json_file(const std::string& path, const graph_model::GraphDocument& document);
std::string graph_document_to_json_string(const graph_model::GraphDocument& document, int indent = 2);

} // namespace graph_loaders
