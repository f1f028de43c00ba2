#include <weft/input/key-queue.h>
#include <ytrace/ytrace.hpp>

namespace weft {
namespace input {

Result<void> KeyQueue::frame(const Ops::ConstPtr& ops, HandlerEvents& events) {
    for (auto& [id, h] : _handlers) {
        h.active = false;
    }
    if (auto res = _reader.reset(ops); !res) {
        return Err<void>("key queue reset failed", res);
    }

    Tag::Ptr focus;
    Priority pri = Priority::None;
    bool hide = false;
    uint32_t depth = 0;

    for (;;) {
        auto next = _reader.decode();
        if (!next) {
            return Err<void>("key queue decode failed", next);
        }
        if (!*next) break;
        const EncodedOp& op = **next;

        switch (op.type()) {
            case OpType::KeyHandler: {
                auto handler = KeyHandlerOp::decode(op);
                if (!handler) return Err<void>("key queue", handler);
                Priority newPri = Priority::Default;
                if (handler->focus) {
                    newPri = Priority::NewFocus;
                } else if (_focus && handler->tag->id() == _focus->id()) {
                    newPri = Priority::CurrentFocus;
                }
                if (newPri >= pri) {
                    focus = handler->tag;
                    pri = newPri;
                }
                auto [it, inserted] = _handlers.try_emplace(handler->tag->id());
                if (inserted) {
                    it->second.tag = handler->tag;
                    // Reset the handler on its first appearance.
                    events.set(handler->tag->id(), {FocusEvent{false}});
                }
                it->second.active = true;
                break;
            }
            case OpType::HideInput:
                hide = true;
                break;
            case OpType::Push:
                ++depth;
                break;
            case OpType::Pop:
                if (depth == 0) {
                    yerror("KeyQueue: pop without push at {}", op.key.pc);
                    return Err<void>("unbalanced pop");
                }
                --depth;
                break;
            default:
                break;
        }
    }
    if (depth != 0) {
        yerror("KeyQueue: {} scopes still pushed at end of stream", depth);
        return Err<void>("unbalanced push at end of stream");
    }

    for (auto it = _handlers.begin(); it != _handlers.end();) {
        if (!it->second.active) {
            if (_focus && _focus->id() == it->first) {
                _focus.reset();
            }
            it = _handlers.erase(it);
        } else {
            ++it;
        }
    }

    bool changed = focus && focus != _focus;
    if (focus != _focus) {
        if (_focus) {
            events.add(_focus->id(), FocusEvent{false});
        }
        _focus = focus;
        if (_focus) {
            events.add(_focus->id(), FocusEvent{true});
        }
    }

    if (pri == Priority::NewFocus) {
        _state = TextInputState::Open;
    } else if (hide) {
        _state = TextInputState::Close;
    } else if (changed) {
        _state = TextInputState::Focus;
    } else {
        _state = TextInputState::Keep;
    }
    ydebug("KeyQueue: focus={} state={}", _focus ? _focus->id() : 0,
           textInputStateName(_state));
    return Ok();
}

void KeyQueue::push(const Event& event, HandlerEvents& events) {
    if (!_focus) return;
    events.add(_focus->id(), event);
}

} // namespace input
} // namespace weft
