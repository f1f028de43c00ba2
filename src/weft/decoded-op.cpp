#include <weft/decoded-op.h>
#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace weft {

namespace {

template<typename T>
Result<DecodedOp> wrap(Result<T> res) {
    if (!res) {
        return Err<DecodedOp>("decode failed", res);
    }
    return Ok(DecodedOp(std::move(*res)));
}

std::string rectString(const f32::Rect& r) {
    return fmt::format("({},{})-({},{})", r.min.x, r.min.y, r.max.x, r.max.y);
}

} // namespace

Result<DecodedOp> decodeOp(const EncodedOp& op) {
    switch (op.type()) {
        case OpType::Transform: return wrap(TransformOp::decode(op));
        case OpType::Layer: return wrap(LayerOp::decode(op));
        case OpType::Invalidate: return wrap(InvalidateOp::decode(op));
        case OpType::Image: return wrap(paint::ImageOp::decode(op));
        case OpType::Color: return wrap(paint::ColorOp::decode(op));
        case OpType::Paint: return wrap(paint::PaintOp::decode(op));
        case OpType::Clip: return wrap(paint::ClipOp::decode(op));
        case OpType::Area: return wrap(input::AreaOp::decode(op));
        case OpType::PointerHandler: return wrap(input::PointerHandlerOp::decode(op));
        case OpType::KeyHandler: return wrap(input::KeyHandlerOp::decode(op));
        case OpType::HideInput: return wrap(input::HideInputOp::decode(op));
        case OpType::Push: return Ok(DecodedOp(PushOp{}));
        case OpType::Pop: return Ok(DecodedOp(PopOp{}));
        case OpType::Aux: return wrap(AuxOp::decode(op));
        case OpType::MacroDef:
        case OpType::Macro:
            break;
    }
    return Err<DecodedOp>(std::string("unexpected op ") + opTypeName(op.type()));
}

std::string describe(const DecodedOp& op) {
    return std::visit(
        [](const auto& o) -> std::string {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, TransformOp>) {
                auto t = o.transform.translation();
                return fmt::format("Transform offset=({},{})", t.x, t.y);
            } else if constexpr (std::is_same_v<T, LayerOp>) {
                return "Layer";
            } else if constexpr (std::is_same_v<T, InvalidateOp>) {
                auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                    o.at.time_since_epoch());
                return fmt::format("Invalidate at={}ns", ns.count());
            } else if constexpr (std::is_same_v<T, paint::ImageOp>) {
                return fmt::format("Image id={} rect=({},{})-({},{})", o.image->id(),
                                   o.rect.min.x, o.rect.min.y, o.rect.max.x, o.rect.max.y);
            } else if constexpr (std::is_same_v<T, paint::ColorOp>) {
                return fmt::format("Color rgba=({},{},{},{})", o.color.r, o.color.g, o.color.b,
                                   o.color.a);
            } else if constexpr (std::is_same_v<T, paint::PaintOp>) {
                return "Paint rect=" + rectString(o.rect);
            } else if constexpr (std::is_same_v<T, paint::ClipOp>) {
                return "Clip bounds=" + rectString(o.bounds);
            } else if constexpr (std::is_same_v<T, input::AreaOp>) {
                return fmt::format("Area {} ({},{})-({},{})",
                                   o.kind == input::AreaKind::Rect ? "rect" : "ellipse",
                                   o.rect.min.x, o.rect.min.y, o.rect.max.x, o.rect.max.y);
            } else if constexpr (std::is_same_v<T, input::PointerHandlerOp>) {
                return fmt::format("PointerHandler tag={} grab={}", o.tag->id(), o.grab);
            } else if constexpr (std::is_same_v<T, input::KeyHandlerOp>) {
                return fmt::format("KeyHandler tag={} focus={}", o.tag->id(), o.focus);
            } else if constexpr (std::is_same_v<T, input::HideInputOp>) {
                return "HideInput";
            } else if constexpr (std::is_same_v<T, PushOp>) {
                return "Push";
            } else if constexpr (std::is_same_v<T, PopOp>) {
                return "Pop";
            } else {
                return fmt::format("Aux len={}", o.payload.size());
            }
        },
        op);
}

} // namespace weft
