/**
 * @file WorkspaceJson.cpp
 * @brief Implementation of WorkspaceJson.
 */

#include "infrastructure/WorkspaceJson.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "domain/scaffold/ScaffoldCatalog.hpp"
#include "infrastructure/AtomicFileWriter.hpp"

namespace pioneer::infrastructure {

using nlohmann::json;
using namespace pioneer::domain;

namespace {

json PositionToJson(const Position& p) {
    return json{{"x", p.x}, {"y", p.y}};
}

Position PositionFromJson(const json& j) {
    Position p;
    if (!j.is_object()) return p;
    p.x = j.value("x", 0.0f);
    p.y = j.value("y", 0.0f);
    return p;
}

json NodeToJson(const Node& node) {
    json files = json::array();
    for (const auto& f : node.getFiles()) {
        files.push_back({
            {"id", f.id},
            {"path", f.path},
            {"name", f.name},
            {"language", LanguageToString(f.language)},
            {"content", f.content}
        });
    }

    json j = {
        {"id", node.getId()},
        {"name", node.getName()},
        {"type", NodeTypeToString(node.getType())},
        {"framework", scaffold::ScaffoldCatalog::KeyOf(node.getFramework())},
        {"language", LanguageToString(node.getLanguage())},
        {"position", PositionToJson(node.getPosition())},
        {"files", files},
        {"connections", node.getConnections()}
    };
    j["selectedFileId"] = node.getSelectedFileId() ? json(*node.getSelectedFileId()) : json(nullptr);
    j["projectPath"] = node.getProjectPath() ? json(*node.getProjectPath()) : json(nullptr);
    j["environmentPath"] = node.getEnvironmentPath() ? json(*node.getEnvironmentPath()) : json(nullptr);
    return j;
}

std::string OptionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::optional<Node> NodeFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    std::string id = OptionalString(j, "id");
    if (id.empty()) return std::nullopt;

    auto framework = scaffold::ScaffoldCatalog::FrameworkFromKey(OptionalString(j, "framework"));
    Node node(id,
              OptionalString(j, "name"),
              NodeTypeFromString(OptionalString(j, "type")),
              framework.value_or(scaffold::ScaffoldCatalog::DefaultFramework()),
              PositionFromJson(j.value("position", json::object())));

    if (j.contains("files") && j["files"].is_array()) {
        for (const auto& jf : j["files"]) {
            if (!jf.is_object()) continue;
            std::string path = OptionalString(jf, "path");
            auto language = LanguageFromString(OptionalString(jf, "language"));
            if (!language) language = LanguageFromPath(path);
            ProjectFile file(OptionalString(jf, "id"), path, OptionalString(jf, "content"),
                             language.value_or(CodeLanguage::Scaffolding));
            std::string name = OptionalString(jf, "name");
            if (!name.empty()) file.name = name;
            if (!node.addFile(std::move(file))) {
                std::cerr << "[WorkspaceJson] Skipping invalid or duplicate file '" << path
                          << "' in node " << id << std::endl;
            }
        }
    }

    std::string selected = OptionalString(j, "selectedFileId");
    if (!selected.empty()) node.selectFile(selected);

    if (j.contains("connections") && j["connections"].is_array()) {
        for (const auto& c : j["connections"]) {
            if (c.is_string()) node.connect(c.get<std::string>());
        }
    }

    node.assignProjectPath(OptionalString(j, "projectPath"));
    node.assignEnvironmentPath(OptionalString(j, "environmentPath"));
    return node;
}

} // namespace

std::string WorkspaceJson::Serialize(const WorkspaceDocument& doc) {
    json nodes = json::array();
    for (const auto& node : doc.nodes) nodes.push_back(NodeToJson(node));

    json j = {
        {"version", doc.version},
        {"name", doc.name},
        {"created", doc.createdMs},
        {"modified", doc.modifiedMs},
        {"canvas", {{"offset", PositionToJson(doc.canvas.offset)}, {"scale", doc.canvas.scale}}},
        {"nodes", nodes}
    };
    j["selectedNodeId"] = doc.selectedNodeId ? json(*doc.selectedNodeId) : json(nullptr);
    return j.dump(2);
}

std::optional<WorkspaceDocument> WorkspaceJson::Parse(const std::string& text, std::string& error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        error = std::string("invalid JSON: ") + e.what();
        return std::nullopt;
    }
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) {
        error = "not a workspace document (missing 'nodes' array)";
        return std::nullopt;
    }

    WorkspaceDocument doc;
    try {
        doc.version = j.value("version", doc.version);
        doc.name = j.value("name", doc.name);
        doc.createdMs = j.value("created", std::int64_t{0});
        doc.modifiedMs = j.value("modified", std::int64_t{0});

        if (j.contains("canvas") && j["canvas"].is_object()) {
            const auto& canvas = j["canvas"];
            doc.canvas.offset = PositionFromJson(canvas.value("offset", json::object()));
            doc.canvas.scale = CanvasTransform::ClampScale(canvas.value("scale", 1.0f));
        }

        for (const auto& jn : j["nodes"]) {
            auto node = NodeFromJson(jn);
            if (!node) {
                std::cerr << "[WorkspaceJson] Skipping node without id." << std::endl;
                continue;
            }
            doc.nodes.push_back(std::move(*node));
        }

        std::string selected = OptionalString(j, "selectedNodeId");
        if (!selected.empty()) doc.selectedNodeId = selected;
    } catch (const json::exception& e) {
        error = std::string("malformed workspace document: ") + e.what();
        return std::nullopt;
    }
    return doc;
}

bool WorkspaceJson::SaveToFile(const std::string& path, const WorkspaceDocument& doc, std::string& error) {
    return AtomicFileWriter::Write(path, Serialize(doc), error);
}

std::optional<WorkspaceDocument> WorkspaceJson::LoadFromFile(const std::string& path, std::string& error) {
    std::string text;
    if (!AtomicFileWriter::Read(path, text)) {
        error = "cannot read " + path;
        return std::nullopt;
    }
    return Parse(text, error);
}

} // namespace pioneer::infrastructure
