#include "canvascore/config/CanvasConfig.h"
#include "canvascore/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace canvascore {

namespace {

json sizeToJson(const Size& size) {
    return {{"width", size.width}, {"height", size.height}};
}

void readSize(const json& j, const char* key, Size& out) {
    if (!j.contains(key) || !j[key].is_object()) {
        return;
    }
    const auto& s = j[key];
    if (s.contains("width") && s["width"].is_number()) {
        out.width = s["width"].get<float>();
    }
    if (s.contains("height") && s["height"].is_number()) {
        out.height = s["height"].get<float>();
    }
}

template <typename T>
void readNumber(const json& j, const char* key, T& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<T>();
    }
}

}  // namespace

std::vector<std::string> CanvasConfig::validate() const {
    std::vector<std::string> problems;

    if (graph.minNodeSize.width > graph.maxNodeSize.width ||
        graph.minNodeSize.height > graph.maxNodeSize.height) {
        problems.push_back("graph.minNodeSize exceeds graph.maxNodeSize");
    }
    if (!graph.sizeAllowed(graph.defaultNodeSize)) {
        problems.push_back("graph.defaultNodeSize is outside the node size limits");
    }
    if (graph.maxNodes == 0) {
        problems.push_back("graph.maxNodes must be positive");
    }
    if (history.capacity == 0) {
        problems.push_back("history.capacity must be positive");
    }
    if (persistence.maxDeferMs < persistence.debounceMs) {
        problems.push_back("persistence.maxDeferMs is shorter than persistence.debounceMs");
    }
    if (persistence.databasePath.empty()) {
        problems.push_back("persistence.databasePath is empty");
    }
    if (routing.gestureReleaseMs < routing.gestureHoldMs) {
        problems.push_back("routing.gestureReleaseMs is shorter than routing.gestureHoldMs");
    }
    if (viewport.minZoom <= 0.0f || viewport.minZoom > viewport.maxZoom) {
        problems.push_back("viewport zoom range is invalid");
    }
    if (viewport.defaultZoom < viewport.minZoom || viewport.defaultZoom > viewport.maxZoom) {
        problems.push_back("viewport.defaultZoom is outside the zoom range");
    }
    return problems;
}

std::string CanvasConfigSerializer::toJson(const CanvasConfig& config) {
    json j;

    j["graph"] = {
        {"minNodeSize", sizeToJson(config.graph.minNodeSize)},
        {"maxNodeSize", sizeToJson(config.graph.maxNodeSize)},
        {"defaultNodeSize", sizeToJson(config.graph.defaultNodeSize)},
        {"maxNodes", config.graph.maxNodes},
        {"maxEdges", config.graph.maxEdges}
    };
    j["history"] = {
        {"capacity", config.history.capacity},
        {"coalesceWindowMs", config.history.coalesceWindowMs}
    };
    j["persistence"] = {
        {"debounceMs", config.persistence.debounceMs},
        {"maxDeferMs", config.persistence.maxDeferMs},
        {"shutdownRetryLimit", config.persistence.shutdownRetryLimit},
        {"databasePath", config.persistence.databasePath}
    };
    j["routing"] = {
        {"gestureHoldMs", config.routing.gestureHoldMs},
        {"gestureReleaseMs", config.routing.gestureReleaseMs}
    };
    j["viewport"] = {
        {"minZoom", config.viewport.minZoom},
        {"maxZoom", config.viewport.maxZoom},
        {"defaultZoom", config.viewport.defaultZoom},
        {"wheelZoomStep", config.viewport.wheelZoomStep}
    };
    j["logging"] = {
        {"level", logLevelName(config.logging.level)},
        {"logDir", config.logging.logDir},
        {"logToFile", config.logging.logToFile}
    };

    return j.dump(2);
}

CanvasConfig CanvasConfigSerializer::fromJson(const std::string& jsonStr) {
    CanvasConfig config;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("graph") && j["graph"].is_object()) {
            const auto& g = j["graph"];
            readSize(g, "minNodeSize", config.graph.minNodeSize);
            readSize(g, "maxNodeSize", config.graph.maxNodeSize);
            readSize(g, "defaultNodeSize", config.graph.defaultNodeSize);
            readNumber(g, "maxNodes", config.graph.maxNodes);
            readNumber(g, "maxEdges", config.graph.maxEdges);
        }

        if (j.contains("history") && j["history"].is_object()) {
            const auto& h = j["history"];
            readNumber(h, "capacity", config.history.capacity);
            readNumber(h, "coalesceWindowMs", config.history.coalesceWindowMs);
        }

        if (j.contains("persistence") && j["persistence"].is_object()) {
            const auto& p = j["persistence"];
            readNumber(p, "debounceMs", config.persistence.debounceMs);
            readNumber(p, "maxDeferMs", config.persistence.maxDeferMs);
            readNumber(p, "shutdownRetryLimit", config.persistence.shutdownRetryLimit);
            if (p.contains("databasePath") && p["databasePath"].is_string()) {
                config.persistence.databasePath = p["databasePath"].get<std::string>();
            }
        }

        if (j.contains("routing") && j["routing"].is_object()) {
            const auto& r = j["routing"];
            readNumber(r, "gestureHoldMs", config.routing.gestureHoldMs);
            readNumber(r, "gestureReleaseMs", config.routing.gestureReleaseMs);
        }

        if (j.contains("viewport") && j["viewport"].is_object()) {
            const auto& v = j["viewport"];
            readNumber(v, "minZoom", config.viewport.minZoom);
            readNumber(v, "maxZoom", config.viewport.maxZoom);
            readNumber(v, "defaultZoom", config.viewport.defaultZoom);
            readNumber(v, "wheelZoomStep", config.viewport.wheelZoomStep);
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& l = j["logging"];
            if (l.contains("level") && l["level"].is_string()) {
                auto level = parseLogLevel(l["level"].get<std::string>());
                if (level) {
                    config.logging.level = *level;
                } else {
                    LOG_WARN("unknown log level '{}'", l["level"].get<std::string>());
                }
            }
            if (l.contains("logDir") && l["logDir"].is_string()) {
                config.logging.logDir = l["logDir"].get<std::string>();
            }
            if (l.contains("logToFile") && l["logToFile"].is_boolean()) {
                config.logging.logToFile = l["logToFile"].get<bool>();
            }
        }
    } catch (const json::exception& e) {
        LOG_WARN("malformed canvas config, using defaults: {}", e.what());
        return CanvasConfig{};
    }

    return config;
}

bool CanvasConfigSerializer::saveToFile(const CanvasConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(config);
    return file.good();
}

bool CanvasConfigSerializer::loadFromFile(const std::string& path, CanvasConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("cannot read config {}, using defaults", path);
        out = CanvasConfig{};
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = fromJson(buffer.str());
    return true;
}

}  // namespace canvascore
