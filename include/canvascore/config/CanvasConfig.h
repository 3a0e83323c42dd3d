#pragma once

#include "canvascore/common/ILoggerBackend.h"
#include "canvascore/graph/GraphStore.h"
#include "canvascore/history/MutationLog.h"
#include "canvascore/interaction/CanvasViewport.h"
#include "canvascore/interaction/EventRouter.h"
#include "canvascore/persistence/PersistenceCoordinator.h"

#include <string>
#include <vector>

namespace canvascore {

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::string logDir;       ///< Directory for canvascore.log (empty = console only)
    bool logToFile = false;
};

/// All tunables of a canvas session
struct CanvasConfig {
    GraphLimits graph;
    HistoryConfig history;
    PersistenceConfig persistence;
    RoutingConfig routing;
    ViewportConfig viewport;
    LoggingConfig logging;

    /// Human-readable list of inconsistent values (empty = valid)
    std::vector<std::string> validate() const;

    bool isValid() const { return validate().empty(); }
};

/// JSON serialization for CanvasConfig
///
/// Every section and key is optional; missing ones keep their defaults.
/// @code
/// {
///   "graph": {"maxNodes": 5000, "minNodeSize": {"width": 120, "height": 80}},
///   "history": {"capacity": 200, "coalesceWindowMs": 500},
///   "persistence": {"debounceMs": 300, "databasePath": "canvas.db"},
///   "routing": {"gestureHoldMs": 200, "gestureReleaseMs": 500},
///   "viewport": {"minZoom": 0.1, "maxZoom": 3.0},
///   "logging": {"level": "info"}
/// }
/// @endcode
class CanvasConfigSerializer {
public:
    static std::string toJson(const CanvasConfig& config);

    /// Malformed input yields the default configuration (logged as a warning)
    static CanvasConfig fromJson(const std::string& json);

    static bool saveToFile(const CanvasConfig& config, const std::string& path);

    /// @return false if the file could not be read (out is left at defaults)
    static bool loadFromFile(const std::string& path, CanvasConfig& out);
};

}  // namespace canvascore
