#include <weft/paint/painter.h>
#include <weft/ui-ops.h>
#include <ytrace/ytrace.hpp>

namespace weft {
namespace paint {

Result<void> Painter::collect(const Ops::ConstPtr& ops) {
    _list.clear();
    if (auto res = _reader.reset(ops); !res) {
        return Err<void>("painter reset failed", res);
    }

    const f32::Rect viewRect{{0, 0}, {float(_viewport.x), float(_viewport.y)}};
    State state;
    state.clip = viewRect;
    std::vector<State> stack;

    std::optional<EncodedOp> aux;
    for (;;) {
        auto next = _reader.decode();
        if (!next) {
            return Err<void>("painter decode failed", next);
        }
        if (!*next) break;
        const EncodedOp& op = **next;

        if (op.type() == OpType::Aux) {
            aux = op;
            continue;
        }
        std::optional<EncodedOp> pendingAux;
        pendingAux.swap(aux);

        switch (op.type()) {
            case OpType::Transform: {
                auto t = TransformOp::decode(op);
                if (!t) return Err<void>("painter", t);
                state.transform = state.transform.mul(t->transform);
                break;
            }
            case OpType::Clip: {
                auto c = ClipOp::decode(op);
                if (!c) return Err<void>("painter", c);
                auto bounds = state.transform.apply(c->bounds);
                state.clip = state.clip.intersect(bounds);
                if (pendingAux) {
                    auto payload = AuxOp::decode(*pendingAux);
                    if (!payload) return Err<void>("painter", payload);
                    _list.paths.push_back(ClipPath{state.path, pendingAux->key,
                                                   state.transform.translation(), bounds,
                                                   payload->payload});
                    state.path = static_cast<int>(_list.paths.size()) - 1;
                    state.rectClip = false;
                }
                break;
            }
            case OpType::Color: {
                auto c = ColorOp::decode(op);
                if (!c) return Err<void>("painter", c);
                state.material = Material{};
                state.material.color = c->color;
                break;
            }
            case OpType::Image: {
                auto i = ImageOp::decode(op);
                if (!i) return Err<void>("painter", i);
                state.material = Material{};
                if (i->image->uniform()) {
                    const auto& px = i->image->pixels();
                    state.material.color = Color{px[0], px[1], px[2], px[3]};
                } else {
                    state.material.kind = Material::Kind::Texture;
                    state.material.image = i->image;
                    state.material.handle = i->handle;
                    state.material.uvRect = i->rect;
                }
                break;
            }
            case OpType::Paint: {
                auto p = PaintOp::decode(op);
                if (!p) return Err<void>("painter", p);
                if (auto res = paint(state, *p); !res) return res;
                break;
            }
            case OpType::Push:
                stack.push_back(state);
                break;
            case OpType::Pop:
                if (stack.empty()) {
                    yerror("Painter: pop without push at {}", op.key.pc);
                    return Err<void>("unbalanced pop");
                }
                state = stack.back();
                stack.pop_back();
                break;
            default:
                break;
        }
    }

    if (!stack.empty()) {
        yerror("Painter: {} scopes still pushed at end of stream", stack.size());
        return Err<void>("unbalanced push at end of stream");
    }
    ydebug("Painter: {} commands, {} clip paths", _list.commands.size(), _list.paths.size());
    return Ok();
}

Result<void> Painter::paint(const State& state, const PaintOp& op) {
    auto rect = state.transform.apply(op.rect);
    auto clipped = rect.intersect(state.clip);
    if (clipped.empty()) {
        return Ok();
    }

    const f32::Rect viewRect{{0, 0}, {float(_viewport.x), float(_viewport.y)}};
    if (state.rectClip && state.material.opaque() && clipped == viewRect) {
        // Opaque full-viewport fill hides everything before it.
        _list.commands.clear();
        _list.clearColor = state.material.color;
        return Ok();
    }

    _list.commands.push_back(DrawCommand{rect, clipped, state.material, state.path});
    return Ok();
}

} // namespace paint
} // namespace weft
