#pragma once

#include <weft/geom.h>
#include <algorithm>
#include <cstdint>

namespace weft {
namespace layout {

struct Constraint {
    int32_t min = 0;
    int32_t max = 0;

    int32_t constrain(int32_t v) const { return std::clamp(v, min, std::max(min, max)); }
};

struct Constraints {
    Constraint width;
    Constraint height;

    IPoint constrain(IPoint p) const { return {width.constrain(p.x), height.constrain(p.y)}; }

    static Constraints exact(IPoint size) {
        return {{size.x, size.x}, {size.y, size.y}};
    }

    Constraints loose() const { return {{0, width.max}, {0, height.max}}; }
};

struct Dimensions {
    IPoint size;
    int32_t baseline = 0;
};

enum class Direction : uint8_t { NW, N, NE, E, SE, S, SW, W, Center };

} // namespace layout
} // namespace weft
