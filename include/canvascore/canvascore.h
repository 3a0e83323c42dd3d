#pragma once

/// @file canvascore.h
/// @brief Main header for the canvascore spatial canvas engine
///
/// canvascore holds the interactive core of a node canvas editor: the graph
/// of positioned nodes and edges, undo/redo, debounced durable storage, and
/// routing of scroll/zoom input between the canvas, node scroll regions and
/// modal dialogs. Rendering stays with the host.
///
/// Example usage:
/// @code
/// #include <canvascore/canvascore.h>
///
/// canvascore::CanvasConfig config;
/// config.persistence.databasePath = "board.db";
///
/// canvascore::CanvasController canvas(config);
/// canvas.open();
/// auto a = canvas.createNode({0, 0}, "note");
/// auto b = canvas.createNode({500, 0}, "note");
/// canvas.createEdge(a, b);
/// canvas.deleteNode(a);   // removes the edge too
/// canvas.undo();          // restores node and edge
/// canvas.close();         // waits for the writes
/// @endcode

#include <string>

// Core
#include "core/Types.h"
#include "core/Clock.h"

// Graph model and history
#include "graph/GraphTypes.h"
#include "graph/GraphStore.h"
#include "graph/MutationRecord.h"
#include "history/MutationLog.h"

// Storage
#include "persistence/IRecordStore.h"
#include "persistence/PersistenceCoordinator.h"
#include "persistence/SqliteRecordStore.h"
#include "persistence/GraphSerializer.h"

// Interaction
#include "interaction/SelectionState.h"
#include "interaction/SurfaceTree.h"
#include "interaction/CanvasViewport.h"
#include "interaction/EventRouter.h"

// Configuration and facade
#include "config/CanvasConfig.h"
#include "api/CanvasController.h"

namespace canvascore {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace canvascore
