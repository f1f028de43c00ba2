#pragma once

#include <weft/input/event.h>
#include <weft/ops/reader.h>

namespace weft {
namespace input {

enum class AreaKind : uint8_t { Rect, Ellipse };

// Hit area for the pointer handlers that follow it in the same scope.
struct AreaOp {
    AreaKind kind = AreaKind::Rect;
    IRect rect;

    static AreaOp makeRect(IRect r) { return {AreaKind::Rect, r}; }
    static AreaOp makeEllipse(IRect r) { return {AreaKind::Ellipse, r}; }

    bool hit(f32::Point p) const;

    Result<void> add(Ops& ops) const;
    static Result<AreaOp> decode(const EncodedOp& op);
};

// Declares tag as a pointer handler for the current area. With grab set the
// handler takes exclusive ownership of pointers pressed inside it.
struct PointerHandlerOp {
    Tag::Ptr tag;
    bool grab = false;

    Result<void> add(Ops& ops) const;
    static Result<PointerHandlerOp> decode(const EncodedOp& op);
};

} // namespace input
} // namespace weft
