#include <weft/input/pointer-queue.h>
#include <weft/ui-ops.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace weft {
namespace input {

Result<void> PointerQueue::frame(const Ops::ConstPtr& ops, HandlerEvents& events) {
    for (auto& [key, h] : _handlers) {
        h.active = false;
    }
    _areas.clear();
    _hitTree.clear();
    if (auto res = _reader.reset(ops); !res) {
        return Err<void>("pointer queue reset failed", res);
    }

    struct Scope {
        Transform transform;
        int area;
        int node;
    };
    Transform transform;
    int area = -1;
    int node = -1;
    std::vector<Scope> stack;

    for (;;) {
        auto next = _reader.decode();
        if (!next) {
            return Err<void>("pointer queue decode failed", next);
        }
        if (!*next) break;
        const EncodedOp& op = **next;

        switch (op.type()) {
            case OpType::Push:
                stack.push_back({transform, area, node});
                break;
            case OpType::Pop:
                if (stack.empty()) {
                    yerror("PointerQueue: pop without push at {}", op.key.pc);
                    return Err<void>("unbalanced pop");
                }
                transform = stack.back().transform;
                area = stack.back().area;
                node = stack.back().node;
                stack.pop_back();
                break;
            case OpType::Transform: {
                auto t = TransformOp::decode(op);
                if (!t) return Err<void>("pointer queue", t);
                transform = transform.mul(t->transform);
                break;
            }
            case OpType::Layer:
                _hitTree.push_back(HitNode{node, area, true, base::NoObjectId});
                node = static_cast<int>(_hitTree.size()) - 1;
                break;
            case OpType::Area: {
                auto a = AreaOp::decode(op);
                if (!a) return Err<void>("pointer queue", a);
                _areas.push_back(AreaNode{transform, area, *a});
                area = static_cast<int>(_areas.size()) - 1;
                _hitTree.push_back(HitNode{node, area, false, base::NoObjectId});
                node = static_cast<int>(_hitTree.size()) - 1;
                break;
            }
            case OpType::PointerHandler: {
                auto p = PointerHandlerOp::decode(op);
                if (!p) return Err<void>("pointer queue", p);
                auto key = p->tag->id();
                _hitTree.push_back(HitNode{node, area, false, key});
                node = static_cast<int>(_hitTree.size()) - 1;
                auto [it, inserted] = _handlers.try_emplace(key);
                if (inserted) {
                    it->second.tag = p->tag;
                    events.set(key, {PointerEvent{}});
                }
                auto& h = it->second;
                h.active = true;
                h.area = area;
                h.transform = transform;
                h.wantsGrab = h.wantsGrab || p->grab;
                break;
            }
            default:
                break;
        }
    }
    if (!stack.empty()) {
        yerror("PointerQueue: {} scopes still pushed at end of stream", stack.size());
        return Err<void>("unbalanced push at end of stream");
    }

    std::vector<base::ObjectId> stale;
    for (const auto& [key, h] : _handlers) {
        if (!h.active) stale.push_back(key);
    }
    for (auto key : stale) {
        dropHandler(key, events);
        _handlers.erase(key);
    }
    return Ok();
}

bool PointerQueue::hitArea(int area, f32::Point p) const {
    while (area != -1) {
        const auto& a = _areas[area];
        if (!a.area.hit(a.transform.invert().apply(p))) {
            return false;
        }
        area = a.next;
    }
    return true;
}

std::vector<base::ObjectId> PointerQueue::hit(f32::Point pos) const {
    std::vector<base::ObjectId> handlers;
    int idx = static_cast<int>(_hitTree.size()) - 1;
    while (idx >= 0) {
        const auto& n = _hitTree[idx];
        if (!hitArea(n.area, pos)) {
            idx--;
            continue;
        }
        if (n.key != base::NoObjectId && _handlers.count(n.key)) {
            handlers.push_back(n.key);
        }
        if (n.layer) {
            // Everything declared before a hit layer is occluded.
            break;
        }
        idx = n.next;
    }
    return handlers;
}

void PointerQueue::dropHandler(base::ObjectId key, HandlerEvents& events) {
    events.add(key, PointerEvent{});
    if (auto it = _handlers.find(key); it != _handlers.end()) {
        it->second.wantsGrab = false;
    }
    for (auto& p : _pointers) {
        std::erase(p.handlers, key);
    }
}

void PointerQueue::push(const PointerEvent& event, HandlerEvents& events) {
    if (event.type == PointerType::Cancel) {
        _pointers.clear();
        std::vector<base::ObjectId> keys;
        for (const auto& [key, h] : _handlers) keys.push_back(key);
        for (auto key : keys) dropHandler(key, events);
        return;
    }

    auto pit = std::find_if(_pointers.begin(), _pointers.end(),
                            [&](const PointerInfo& p) { return p.id == event.pointerId; });
    if (pit == _pointers.end()) {
        _pointers.push_back(PointerInfo{event.pointerId, false, {}});
        pit = _pointers.end() - 1;
    }
    size_t pidx = static_cast<size_t>(pit - _pointers.begin());

    if (!_pointers[pidx].pressed &&
        (event.type == PointerType::Move || event.type == PointerType::Press)) {
        _pointers[pidx].handlers = hit(event.position);
        if (event.type == PointerType::Press) {
            _pointers[pidx].pressed = true;
        }
    }
    if (_pointers[pidx].pressed) {
        // The first grabbing handler takes the pointer from the others.
        std::vector<base::ObjectId> losers;
        const auto& hs = _pointers[pidx].handlers;
        for (size_t i = 0; i < hs.size(); ++i) {
            if (_handlers[hs[i]].wantsGrab) {
                losers.insert(losers.end(), hs.begin(), hs.begin() + i);
                losers.insert(losers.end(), hs.begin() + i + 1, hs.end());
                break;
            }
        }
        for (auto key : losers) {
            dropHandler(key, events);
        }
    }

    PointerInfo p = _pointers[pidx];
    if (event.type == PointerType::Release) {
        _pointers.erase(_pointers.begin() + pidx);
    }
    for (size_t i = 0; i < p.handlers.size(); ++i) {
        auto key = p.handlers[i];
        auto& h = _handlers[key];
        PointerEvent e = event;
        if (p.pressed && p.handlers.size() == 1) {
            e.priority = Priority::Grabbed;
        } else if (i == 0) {
            e.priority = Priority::Foremost;
        }
        e.hit = hitArea(h.area, event.position);
        e.position = h.transform.invert().apply(event.position);
        events.add(key, e);
        if (e.type == PointerType::Release) {
            // Release the grab once no pressed pointer is held exclusively.
            int grabs = 0;
            for (const auto& other : _pointers) {
                if (other.pressed && other.handlers.size() == 1 && other.handlers[0] == key) {
                    grabs++;
                }
            }
            if (grabs == 0) {
                h.wantsGrab = false;
            }
        }
    }
}

} // namespace input
} // namespace weft
