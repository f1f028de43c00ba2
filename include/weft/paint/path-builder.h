#pragma once

#include <weft/geom.h>
#include <weft/ops/ops.h>
#include <cstdint>

namespace weft {
namespace paint {

// One corner of the bounding quad of a quadratic curve segment, as stored
// in the aux payload preceding a path ClipOp.
//
//   offset  field
//   0       cornerX i16, cornerY i16   (-1 or 1)
//   4       maxY f32                   (contour maximum, patched at contour end)
//   8       from x,y f32
//   16      ctrl x,y f32
//   24      to x,y f32
struct PathVertex {
    int16_t cornerX = 0;
    int16_t cornerY = 0;
    float maxY = 0.0f;
    f32::Point from;
    f32::Point ctrl;
    f32::Point to;

    static constexpr size_t Stride = 32;
    static constexpr size_t MaxYOffset = 4;

    static PathVertex decode(const uint8_t* p);
};

//=============================================================================
// PathBuilder - records a clip path outline through the aux channel
//
// Coordinates passed to move/line/quad/cube are relative to the pen.
// end() closes the outline with a ClipOp covering its bounds. Nothing but
// path vertices may be written to the buffer between the first segment and
// end(), since any other write closes the aux chunk.
//=============================================================================
class PathBuilder {
public:
    explicit PathBuilder(Ops& ops) : _ops(ops) {}

    Result<void> move(f32::Point to);
    Result<void> line(f32::Point to);
    Result<void> quad(f32::Point ctrl, f32::Point to);
    Result<void> cube(f32::Point ctrl0, f32::Point ctrl1, f32::Point to);
    Result<void> end();

    f32::Rect bounds() const { return _bounds; }
    size_t vertexCount() const { return _nverts; }

private:
    Result<void> endContour();
    Result<void> quadTo(f32::Point ctrl, f32::Point to);
    Result<void> simpleQuadTo(f32::Point ctrl, f32::Point to);
    Result<int> approxCubeTo(int splits, float maxDist, f32::Point ctrl0, f32::Point ctrl1,
                             f32::Point to);
    Result<void> vertex(int16_t cornerX, int16_t cornerY, f32::Point ctrl, f32::Point to);
    void expand(const f32::Rect& b);

    Ops& _ops;
    size_t _firstVert = 0;
    size_t _nverts = 0;
    float _maxY = 0.0f;
    f32::Point _pen;
    f32::Rect _bounds;
    bool _hasBounds = false;
};

} // namespace paint
} // namespace weft
