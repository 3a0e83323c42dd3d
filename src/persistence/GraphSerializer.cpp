#include "canvascore/persistence/GraphSerializer.h"
#include "canvascore/graph/GraphStore.h"
#include "canvascore/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace canvascore {

namespace {

json optionalText(const std::optional<std::string>& text) {
    return text ? json(*text) : json(nullptr);
}

std::optional<std::string> readOptionalText(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

}  // namespace

std::string GraphSerializer::toJson(const GraphSnapshot& snapshot) {
    json j;
    j["format"] = "canvascore-backup";
    j["version"] = FORMAT_VERSION;
    j["graphVersion"] = snapshot.version;

    json nodes = json::array();
    for (const auto& node : snapshot.nodes) {
        nodes.push_back({
            {"id", node.id},
            {"position", {{"x", node.position.x}, {"y", node.position.y}}},
            {"size", {{"width", node.size.width}, {"height", node.size.height}}},
            {"kind", node.content.kind},
            {"payload", node.content.payload},
            {"color", optionalText(node.color)},
            {"createdAt", node.createdAt},
            {"updatedAt", node.updatedAt}
        });
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : snapshot.edges) {
        edges.push_back({
            {"id", edge.id},
            {"source", edge.source},
            {"target", edge.target},
            {"color", optionalText(edge.color)},
            {"createdAt", edge.createdAt}
        });
    }
    j["edges"] = edges;

    return j.dump(2);
}

bool GraphSerializer::fromJson(LoadedRecords& out, const std::string& jsonStr) {
    out.nodes.clear();
    out.edges.clear();

    try {
        json j = json::parse(jsonStr);

        int version = j.value("version", 0);
        if (version > FORMAT_VERSION) {
            LOG_WARN("backup format {} is newer than supported {}", version, FORMAT_VERSION);
            return false;
        }

        if (j.contains("nodes")) {
            for (const auto& nodeJson : j["nodes"]) {
                Node node;
                node.id = nodeJson["id"].get<NodeId>();
                node.position.x = nodeJson["position"]["x"].get<float>();
                node.position.y = nodeJson["position"]["y"].get<float>();
                node.size.width = nodeJson["size"]["width"].get<float>();
                node.size.height = nodeJson["size"]["height"].get<float>();
                node.content.kind = nodeJson.value("kind", "");
                node.content.payload = nodeJson.value("payload", "");
                node.color = readOptionalText(nodeJson, "color");
                node.createdAt = nodeJson["createdAt"].get<Timestamp>();
                node.updatedAt = nodeJson.value("updatedAt", node.createdAt);
                out.nodes.push_back(std::move(node));
            }
        }

        if (j.contains("edges")) {
            for (const auto& edgeJson : j["edges"]) {
                Edge edge;
                edge.id = edgeJson["id"].get<EdgeId>();
                edge.source = edgeJson["source"].get<NodeId>();
                edge.target = edgeJson["target"].get<NodeId>();
                edge.color = readOptionalText(edgeJson, "color");
                edge.createdAt = edgeJson["createdAt"].get<Timestamp>();
                out.edges.push_back(std::move(edge));
            }
        }

        return true;
    } catch (const json::exception& e) {
        LOG_WARN("invalid backup document: {}", e.what());
        out.nodes.clear();
        out.edges.clear();
        return false;
    }
}

bool GraphSerializer::saveToFile(const GraphSnapshot& snapshot, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("cannot write backup {}", path);
        return false;
    }
    file << toJson(snapshot);
    return file.good();
}

bool GraphSerializer::loadFromFile(LoadedRecords& out, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("cannot read backup {}", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(out, buffer.str());
}

}  // namespace canvascore
