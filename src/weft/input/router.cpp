#include <weft/input/router.h>
#include <weft/ui-ops.h>
#include <ytrace/ytrace.hpp>

namespace weft {
namespace input {

Result<void> Router::frame(const Ops::ConstPtr& ops) {
    _handlers.clear();
    _wakeup = false;
    _wakeupTime = TimePoint{};

    if (auto res = collect(ops); !res) return res;
    if (auto res = _pointers.frame(ops, _handlers); !res) {
        return Err<void>("pointer frame failed", res);
    }
    if (auto res = _keys.frame(ops, _handlers); !res) {
        return Err<void>("key frame failed", res);
    }
    if (_handlers.updated()) {
        _wakeup = true;
        _wakeupTime = TimePoint{};
    }
    return Ok();
}

Result<void> Router::collect(const Ops::ConstPtr& ops) {
    if (auto res = _reader.reset(ops); !res) {
        return Err<void>("router reset failed", res);
    }
    for (;;) {
        auto next = _reader.decode();
        if (!next) {
            return Err<void>("router decode failed", next);
        }
        if (!*next) break;
        if ((*next)->type() != OpType::Invalidate) continue;
        auto inv = InvalidateOp::decode(**next);
        if (!inv) return Err<void>("router", inv);
        if (!_wakeup || inv->at < _wakeupTime) {
            _wakeup = true;
            _wakeupTime = inv->at;
        }
    }
    return Ok();
}

bool Router::add(const Event& event) {
    if (const auto* p = std::get_if<PointerEvent>(&event)) {
        _pointers.push(*p, _handlers);
    } else {
        _keys.push(event, _handlers);
    }
    return _handlers.updated();
}

std::vector<Event> Router::events(const Tag::Ptr& tag) {
    if (!tag) return {};
    return _handlers.take(tag->id());
}

std::optional<Router::TimePoint> Router::wakeupTime() const {
    if (!_wakeup) return std::nullopt;
    return _wakeupTime;
}

} // namespace input
} // namespace weft
