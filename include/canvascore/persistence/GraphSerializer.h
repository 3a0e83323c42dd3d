#pragma once

#include "IRecordStore.h"

#include <string>

namespace canvascore {

struct GraphSnapshot;

/// JSON backup of a whole graph.
/// Timestamps are written and read verbatim. Dangling edges are not filtered
/// here; GraphStore::load() prunes them on import just as it does for storage.
class GraphSerializer {
public:
    static constexpr int FORMAT_VERSION = 1;

    /// Serialize a snapshot to a JSON string
    static std::string toJson(const GraphSnapshot& snapshot);

    /// Parse a backup document
    /// @param out Receives the nodes and edges (cleared first)
    /// @return true if parsing succeeded
    static bool fromJson(LoadedRecords& out, const std::string& json);

    static bool saveToFile(const GraphSnapshot& snapshot, const std::string& path);
    static bool loadFromFile(LoadedRecords& out, const std::string& path);
};

}  // namespace canvascore
