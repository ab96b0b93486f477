#include <graph_loaders/json_loader.hpp>
#include <graph_model/log.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace graph_loaders {

namespace {

std::optional<graph_geometry::Point> parse_pos(const nlohmann::json& t) {
    if (!t.contains("pos") || !t["pos"].is_object()) return std::nullopt;
    const auto& p = t["pos"];
    graph_geometry::Point pos;
    pos.x = p.contains("x") && p["x"].is_number() ? p["x"].get<double>() : 0;
    pos.y = p.contains("y") && p["y"].is_number() ? p["y"].get<double>() : 0;
    return pos;
}

std::optional<graph_model::GraphDocument> parse_json(const nlohmann::json& j) {
    auto log = graph_model::graph_logger();
    graph_model::GraphDocument doc;
    if (!j.is_object()) {
        log->error("graph document rejected: top level is not an object");
        return std::nullopt;
    }
    if (!j.contains("tasks") || !j["tasks"].is_array()) {
        log->error("graph document rejected: \"tasks\" is missing or not an array");
        return std::nullopt;
    }
    if (!j.contains("dependencies") || !j["dependencies"].is_array()) {
        log->error("graph document rejected: \"dependencies\" is missing or not an array");
        return std::nullopt;
    }

    for (const auto& t : j["tasks"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
            log->error("graph document rejected: task #{} has no name", doc.tasks.size());
            return std::nullopt;
        }
        graph_model::TaskRecord rec;
        rec.name = t["name"].get<std::string>();
        rec.pos = parse_pos(t);
        if (t.contains("status") && t["status"].is_string()) {
            const std::string status = t["status"].get<std::string>();
            auto parsed = graph_model::task_status_from_string(status);
            if (!parsed) log->warn("task '{}' has unknown status '{}', using todo", rec.name, status);
            rec.status = parsed.value_or(graph_model::TaskStatus::Todo);
        }
        doc.tasks.push_back(std::move(rec));
    }

    for (const auto& d : j["dependencies"]) {
        if (!d.is_object() || !d.contains("predecessor") || !d["predecessor"].is_string() ||
            !d.contains("successor") || !d["successor"].is_string())
        {
            log->error("graph document rejected: dependency #{} has no endpoints", doc.dependencies.size());
            return std::nullopt;
        }
        doc.dependencies.push_back(graph_model::DependencyRecord{
            d["predecessor"].get<std::string>(), d["successor"].get<std::string>() });
    }

    return doc;
}

nlohmann::json to_json(const graph_model::GraphDocument& document) {
    nlohmann::json j;
    j["tasks"] = nlohmann::json::array();
    j["dependencies"] = nlohmann::json::array();
    for (const auto& t : document.tasks) {
        nlohmann::json task;
        task["name"] = t.name;
        const graph_geometry::Point pos = t.pos.value_or(graph_geometry::Point{});
        task["pos"] = { { "x", pos.x }, { "y", pos.y } };
        task["status"] = graph_model::to_string(t.status);
        j["tasks"].push_back(std::move(task));
    }
    for (const auto& d : document.dependencies)
        j["dependencies"].push_back({ { "predecessor", d.predecessor }, { "successor", d.successor } });
    return j;
}

// dump() rejects strings that are not valid UTF-8.
std::optional<std::string> serialize(const graph_model::GraphDocument& document, int indent) {
    try {
        return to_json(document).dump(indent);
    } catch (const nlohmann::json::exception& e) {
        graph_model::graph_logger()->error("graph document not serializable: {}", e.what());
        return std::nullopt;
    }
}

} // namespace

std::optional<graph_model::GraphDocument> load_graph_document_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        graph_model::graph_logger()->error("graph document parse failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<graph_model::GraphDocument> load_graph_document_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        graph_model::graph_logger()->info("graph document not found: {}", path);
        return std::nullopt;
    }
    return load_graph_document_from_json(f);
}

std::optional<graph_model::GraphDocument> load_graph_document_from_json_string(const std::string& text) {
    std::istringstream in(text);
    return load_graph_document_from_json(in);
}

bool save_graph_document_to_json(std::ostream& out, const graph_model::GraphDocument& document) {
    const auto text = serialize(document, 2);
    if (!text) return false;
    out << *text << '\n';
    return static_cast<bool>(out);
}

bool save_graph_document_to_json_file(const std::string& path, const graph_model::GraphDocument& document) {
    auto log = graph_model::graph_logger();
    const std::filesystem::path file(path);
    std::error_code ec;
    if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
        log->error("cannot create directory for {}: {}", path, ec.message());
        return false;
    }
    // Serialize before truncating the previous file.
    const auto text = serialize(document, 2);
    if (!text) return false;
    std::ofstream f(file);
    if (!f) {
        log->error("cannot open {} for writing", path);
        return false;
    }
    f << *text << '\n';
    if (!f) {
        log->error("write failed: {}", path);
        return false;
    }
    log->debug("graph saved to {} tasks={} dependencies={}", path,
        document.tasks.size(), document.dependencies.size());
    return true;
}

std::string graph_document_to_json_string(const graph_model::GraphDocument& document, int indent) {
    return serialize(document, indent).value_or(std::string{});
}

} // namespace graph_loaders
