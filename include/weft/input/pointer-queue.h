#pragma once

#include <weft/input/pointer.h>
#include <unordered_map>
#include <vector>

namespace weft {
namespace input {

//=============================================================================
// PointerQueue - pointer hit testing and event routing
//
// The frame pass turns the stream into a hit tree. Every Area, PointerHandler
// and Layer op appends a node linked to the node that enclosed it; areas are
// chained so a handler is only hit inside all of its enclosing areas.
//=============================================================================
class PointerQueue {
public:
    Result<void> frame(const Ops::ConstPtr& ops, HandlerEvents& events);
    void push(const PointerEvent& event, HandlerEvents& events);

    // Handlers hit at pos, topmost first
    std::vector<base::ObjectId> hit(f32::Point pos) const;

private:
    struct AreaNode {
        Transform transform;
        int next = -1;
        AreaOp area;
    };

    struct HitNode {
        int next = -1;
        int area = -1;
        bool layer = false;
        base::ObjectId key = base::NoObjectId;
    };

    struct Handler {
        Tag::Ptr tag;
        int area = -1;
        bool active = false;
        bool wantsGrab = false;
        Transform transform;
    };

    struct PointerInfo {
        PointerId id = 0;
        bool pressed = false;
        std::vector<base::ObjectId> handlers;
    };

    bool hitArea(int area, f32::Point p) const;
    void dropHandler(base::ObjectId key, HandlerEvents& events);

    Reader _reader;
    std::vector<AreaNode> _areas;
    std::vector<HitNode> _hitTree;
    std::unordered_map<base::ObjectId, Handler> _handlers;
    std::vector<PointerInfo> _pointers;
};

} // namespace input
} // namespace weft
