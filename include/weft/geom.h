#pragma once

#include <algorithm>
#include <cstdint>

namespace weft {

namespace f32 {

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    Point operator+(Point o) const { return {x + o.x, y + o.y}; }
    Point operator-(Point o) const { return {x - o.x, y - o.y}; }
    Point operator*(float s) const { return {x * s, y * s}; }
    bool operator==(const Point&) const = default;
};

struct Rect {
    Point min;
    Point max;

    float dx() const { return max.x - min.x; }
    float dy() const { return max.y - min.y; }
    Point size() const { return {dx(), dy()}; }
    bool empty() const { return min.x >= max.x || min.y >= max.y; }

    bool contains(Point p) const {
        return p.x >= min.x && p.x < max.x && p.y >= min.y && p.y < max.y;
    }

    Rect add(Point p) const { return {min + p, max + p}; }

    Rect intersect(const Rect& o) const {
        Rect r{{std::max(min.x, o.min.x), std::max(min.y, o.min.y)},
               {std::min(max.x, o.max.x), std::min(max.y, o.max.y)}};
        if (r.empty()) return {};
        return r;
    }

    Rect unite(const Rect& o) const {
        if (empty()) return o;
        if (o.empty()) return *this;
        return {{std::min(min.x, o.min.x), std::min(min.y, o.min.y)},
                {std::max(max.x, o.max.x), std::max(max.y, o.max.y)}};
    }

    bool operator==(const Rect&) const = default;
};

} // namespace f32

struct IPoint {
    int32_t x = 0;
    int32_t y = 0;

    IPoint operator+(IPoint o) const { return {x + o.x, y + o.y}; }
    IPoint operator-(IPoint o) const { return {x - o.x, y - o.y}; }
    bool operator==(const IPoint&) const = default;
};

struct IRect {
    IPoint min;
    IPoint max;

    int32_t dx() const { return max.x - min.x; }
    int32_t dy() const { return max.y - min.y; }
    bool empty() const { return min.x >= max.x || min.y >= max.y; }
    bool operator==(const IRect&) const = default;

    f32::Rect toF32() const {
        return {{float(min.x), float(min.y)}, {float(max.x), float(max.y)}};
    }
};

//=============================================================================
// Transform - 2D offset transform carried by TransformOp
//=============================================================================
class Transform {
public:
    Transform() = default;
    static Transform offset(f32::Point o) {
        Transform t;
        t._offset = o;
        return t;
    }

    f32::Point apply(f32::Point p) const { return p + _offset; }
    f32::Rect apply(const f32::Rect& r) const { return r.add(_offset); }

    // this after other: apply other first, then this
    Transform mul(const Transform& other) const { return offset(_offset + other._offset); }
    Transform invert() const { return offset({-_offset.x, -_offset.y}); }

    f32::Point translation() const { return _offset; }

    bool operator==(const Transform&) const = default;

private:
    f32::Point _offset;
};

} // namespace weft
