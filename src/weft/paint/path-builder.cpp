#include <weft/paint/path-builder.h>
#include <weft/ops/byte-order.h>
#include <weft/paint/paint-ops.h>
#include <ytrace/ytrace.hpp>

namespace weft {
namespace paint {

namespace {

f32::Rect canon(f32::Point a, f32::Point b) {
    return {{std::min(a.x, b.x), std::min(a.y, b.y)}, {std::max(a.x, b.x), std::max(a.y, b.y)}};
}

} // namespace

PathVertex PathVertex::decode(const uint8_t* p) {
    PathVertex v;
    v.cornerX = static_cast<int16_t>(static_cast<uint16_t>(p[0] | p[1] << 8));
    v.cornerY = static_cast<int16_t>(static_cast<uint16_t>(p[2] | p[3] << 8));
    v.maxY = bo::getF32(p + 4);
    v.from = {bo::getF32(p + 8), bo::getF32(p + 12)};
    v.ctrl = {bo::getF32(p + 16), bo::getF32(p + 20)};
    v.to = {bo::getF32(p + 24), bo::getF32(p + 28)};
    return v;
}

Result<void> PathBuilder::move(f32::Point to) {
    if (auto res = endContour(); !res) return res;
    to = to + _pen;
    _maxY = to.y;
    _pen = to;
    return Ok();
}

Result<void> PathBuilder::line(f32::Point to) {
    to = to + _pen;
    // Lines are degenerate quadratic curves.
    return quadTo((to + _pen) * 0.5f, to);
}

Result<void> PathBuilder::quad(f32::Point ctrl, f32::Point to) {
    return quadTo(ctrl + _pen, to + _pen);
}

Result<void> PathBuilder::cube(f32::Point ctrl0, f32::Point ctrl1, f32::Point to) {
    ctrl0 = ctrl0 + _pen;
    ctrl1 = ctrl1 + _pen;
    to = to + _pen;
    // Tolerance proportional to the longest side of the hull.
    float minX = std::min({_pen.x, ctrl0.x, ctrl1.x, to.x});
    float maxX = std::max({_pen.x, ctrl0.x, ctrl1.x, to.x});
    float minY = std::min({_pen.y, ctrl0.y, ctrl1.y, to.y});
    float maxY = std::max({_pen.y, ctrl0.y, ctrl1.y, to.y});
    float l = std::max(maxX - minX, maxY - minY);
    auto res = approxCubeTo(0, l * 0.001f, ctrl0, ctrl1, to);
    if (!res) return Err<void>("cube", res);
    return Ok();
}

Result<void> PathBuilder::end() {
    if (auto res = endContour(); !res) return res;
    ClipOp clip{_bounds};
    return clip.add(_ops);
}

Result<void> PathBuilder::endContour() {
    if (_firstVert == _nverts) return Ok();
    auto aux = _ops.aux();
    if (aux.size() < _nverts * PathVertex::Stride) {
        yerror("PathBuilder: aux chunk closed before the contour ended");
        return Err<void>("path vertices interrupted by a non-aux write");
    }
    // Vertices are the tail of the chunk.
    size_t base = aux.size() - _nverts * PathVertex::Stride;
    for (size_t i = _firstVert; i < _nverts; ++i) {
        bo::putF32(aux.data() + base + PathVertex::Stride * i + PathVertex::MaxYOffset, _maxY);
    }
    _firstVert = _nverts;
    return Ok();
}

Result<void> PathBuilder::quadTo(f32::Point ctrl, f32::Point to) {
    // Zero width curves don't contribute to stenciling.
    if (_pen.x == to.x && _pen.x == ctrl.x) {
        _pen = to;
        return Ok();
    }

    auto bounds = canon(_pen, to);

    // Split into x monotone halves where the x derivative is zero in ]0;1[.
    auto v0 = ctrl - _pen;
    auto v1 = to - ctrl;
    float d = v0.x - v1.x;
    auto pen = _pen;
    if ((v0.x > 0 && d > v0.x) || (v0.x < 0 && d < v0.x)) {
        float t = v0.x / d;
        auto ctrl0 = pen * (1 - t) + ctrl * t;
        auto ctrl1 = ctrl * (1 - t) + to * t;
        auto mid = ctrl0 * (1 - t) + ctrl1 * t;
        if (auto res = simpleQuadTo(ctrl0, mid); !res) return res;
        if (auto res = simpleQuadTo(ctrl1, to); !res) return res;
        bounds.max.x = std::max(bounds.max.x, mid.x);
        bounds.min.x = std::min(bounds.min.x, mid.x);
    } else {
        if (auto res = simpleQuadTo(ctrl, to); !res) return res;
    }

    // y extremum
    d = v0.y - v1.y;
    if ((v0.y > 0 && d > v0.y) || (v0.y < 0 && d < v0.y)) {
        float t = v0.y / d;
        float y = (1 - t) * (1 - t) * pen.y + 2 * (1 - t) * t * ctrl.y + t * t * to.y;
        bounds.max.y = std::max(bounds.max.y, y);
        bounds.min.y = std::min(bounds.min.y, y);
    }
    expand(bounds);
    return Ok();
}

Result<int> PathBuilder::approxCubeTo(int splits, float maxDist, f32::Point ctrl0,
                                      f32::Point ctrl1, f32::Point to) {
    // Quadratic through the midpoint of the two end-anchored approximations:
    // C = (3ctrl0 - pen + 3ctrl1 - to) / 4
    auto c = (ctrl0 * 3 - _pen + ctrl1 * 3 - to) * 0.25f;
    constexpr int MaxSplits = 32;
    if (splits >= MaxSplits) {
        if (auto res = quadTo(c, to); !res) return Err<int>("cube", res);
        return Ok(splits);
    }
    // Squared distance between the cubic and its approximation.
    auto v = to - ctrl1 * 3 + ctrl0 * 3 - _pen;
    float d2 = (v.x * v.x + v.y * v.y) * 3 / (36 * 36);
    if (d2 <= maxDist * maxDist) {
        if (auto res = quadTo(c, to); !res) return Err<int>("cube", res);
        return Ok(splits);
    }
    // De Casteljau split at t = 0.5
    auto c0 = _pen + (ctrl0 - _pen) * 0.5f;
    auto c1 = ctrl0 + (ctrl1 - ctrl0) * 0.5f;
    auto c2 = ctrl1 + (to - ctrl1) * 0.5f;
    auto c01 = c0 + (c1 - c0) * 0.5f;
    auto c12 = c1 + (c2 - c1) * 0.5f;
    auto c0112 = c01 + (c12 - c01) * 0.5f;
    splits++;
    auto first = approxCubeTo(splits, maxDist, c0, c01, c0112);
    if (!first) return first;
    return approxCubeTo(*first, maxDist, c12, c2, to);
}

Result<void> PathBuilder::simpleQuadTo(f32::Point ctrl, f32::Point to) {
    _maxY = std::max({_maxY, _pen.y, ctrl.y, to.y});
    // NW, NE, SW, SE
    if (auto res = vertex(-1, 1, ctrl, to); !res) return res;
    if (auto res = vertex(1, 1, ctrl, to); !res) return res;
    if (auto res = vertex(-1, -1, ctrl, to); !res) return res;
    if (auto res = vertex(1, -1, ctrl, to); !res) return res;
    _pen = to;
    return Ok();
}

Result<void> PathBuilder::vertex(int16_t cornerX, int16_t cornerY, f32::Point ctrl,
                                 f32::Point to) {
    uint8_t data[1 + PathVertex::Stride] = {};
    data[0] = static_cast<uint8_t>(OpType::Aux);
    uint8_t* p = data + 1;
    p[0] = static_cast<uint8_t>(static_cast<uint16_t>(cornerX));
    p[1] = static_cast<uint8_t>(static_cast<uint16_t>(cornerX) >> 8);
    p[2] = static_cast<uint8_t>(static_cast<uint16_t>(cornerY));
    p[3] = static_cast<uint8_t>(static_cast<uint16_t>(cornerY) >> 8);
    // maxY is filled in at the end of the contour
    bo::putF32(p + 8, _pen.x);
    bo::putF32(p + 12, _pen.y);
    bo::putF32(p + 16, ctrl.x);
    bo::putF32(p + 20, ctrl.y);
    bo::putF32(p + 24, to.x);
    bo::putF32(p + 28, to.y);
    if (auto res = _ops.write(data); !res) return res;
    _nverts++;
    return Ok();
}

void PathBuilder::expand(const f32::Rect& b) {
    if (!_hasBounds) {
        _hasBounds = true;
        _bounds = b;
        return;
    }
    _bounds = {{std::min(_bounds.min.x, b.min.x), std::min(_bounds.min.y, b.min.y)},
               {std::max(_bounds.max.x, b.max.x), std::max(_bounds.max.y, b.max.y)}};
}

} // namespace paint
} // namespace weft
