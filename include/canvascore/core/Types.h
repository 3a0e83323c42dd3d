#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

namespace canvascore {

using NodeId = uint64_t;
using EdgeId = uint64_t;

constexpr NodeId INVALID_NODE = UINT64_MAX;
constexpr EdgeId INVALID_EDGE = UINT64_MAX;

/// Wall-clock milliseconds since the Unix epoch. Stored verbatim.
using Timestamp = int64_t;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    /// Clamp each dimension into [minSize, maxSize]
    Size clamped(const Size& minSize, const Size& maxSize) const {
        return {std::clamp(width, minSize.width, maxSize.width),
                std::clamp(height, minSize.height, maxSize.height)};
    }

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    constexpr Rect translated(const Point& offset) const {
        return {x + offset.x, y + offset.y, width, height};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// Which collection an entity lives in
enum class EntityKind : uint8_t {
    Node,
    Edge
};

/// Storage key: collection plus id
struct EntityRef {
    EntityKind kind = EntityKind::Node;
    uint64_t id = 0;

    static constexpr EntityRef node(NodeId id) { return {EntityKind::Node, id}; }
    static constexpr EntityRef edge(EdgeId id) { return {EntityKind::Edge, id}; }

    constexpr bool operator==(const EntityRef& o) const { return kind == o.kind && id == o.id; }
    constexpr bool operator!=(const EntityRef& o) const { return !(*this == o); }

    std::string toString() const {
        return (kind == EntityKind::Node ? "node:" : "edge:") + std::to_string(id);
    }
};

}  // namespace canvascore
