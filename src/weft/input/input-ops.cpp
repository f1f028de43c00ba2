#include <weft/input/key.h>
#include <weft/input/pointer.h>
#include <weft/ops/byte-order.h>
#include <weft/ui-ops.h>

namespace weft {
namespace input {

namespace {

Result<Tag::Ptr> decodeTag(const EncodedOp& op) {
    auto* obj = std::get_if<base::Object::Ptr>(&op.refs[0]);
    if (!obj) {
        return Err<Tag::Ptr>("handler ref is not an object");
    }
    auto tag = std::dynamic_pointer_cast<Tag>(*obj);
    if (!tag) {
        return Err<Tag::Ptr>("handler ref is not a tag");
    }
    return Ok(std::move(tag));
}

} // namespace

//=============================================================================
// AreaOp
//=============================================================================

bool AreaOp::hit(f32::Point p) const {
    auto r = rect.toF32();
    if (kind == AreaKind::Rect) {
        return r.contains(p);
    }
    float rx = r.dx() / 2.0f;
    float ry = r.dy() / 2.0f;
    if (rx <= 0.0f || ry <= 0.0f) return false;
    float cx = r.min.x + rx;
    float cy = r.min.y + ry;
    float nx = (p.x - cx) / rx;
    float ny = (p.y - cy) / ry;
    return nx * nx + ny * ny <= 1.0f;
}

Result<void> AreaOp::add(Ops& ops) const {
    uint8_t data[AreaSize];
    data[0] = static_cast<uint8_t>(OpType::Area);
    data[1] = static_cast<uint8_t>(kind);
    bo::putI32(data + 2, rect.min.x);
    bo::putI32(data + 6, rect.min.y);
    bo::putI32(data + 10, rect.max.x);
    bo::putI32(data + 14, rect.max.y);
    return ops.write(data);
}

Result<AreaOp> AreaOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Area); !res) {
        return Err<AreaOp>("decode", res);
    }
    const uint8_t* p = op.data.data();
    if (p[1] > static_cast<uint8_t>(AreaKind::Ellipse)) {
        return Err<AreaOp>("invalid area kind " + std::to_string(p[1]));
    }
    AreaOp area;
    area.kind = static_cast<AreaKind>(p[1]);
    area.rect = {{bo::getI32(p + 2), bo::getI32(p + 6)}, {bo::getI32(p + 10), bo::getI32(p + 14)}};
    return Ok(area);
}

//=============================================================================
// PointerHandlerOp
//=============================================================================

Result<void> PointerHandlerOp::add(Ops& ops) const {
    if (!tag) {
        return Err<void>("PointerHandlerOp without tag");
    }
    const uint8_t data[PointerHandlerSize] = {static_cast<uint8_t>(OpType::PointerHandler),
                                              static_cast<uint8_t>(grab ? 1 : 0)};
    return ops.write(data, {Ref(base::Object::Ptr(tag))});
}

Result<PointerHandlerOp> PointerHandlerOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::PointerHandler); !res) {
        return Err<PointerHandlerOp>("decode", res);
    }
    auto tag = decodeTag(op);
    if (!tag) {
        return Err<PointerHandlerOp>("decode", tag);
    }
    return Ok(PointerHandlerOp{std::move(*tag), op.data[1] != 0});
}

//=============================================================================
// KeyHandlerOp / HideInputOp
//=============================================================================

const char* textInputStateName(TextInputState s) {
    switch (s) {
        case TextInputState::Keep: return "Keep";
        case TextInputState::Close: return "Close";
        case TextInputState::Open: return "Open";
        case TextInputState::Focus: return "Focus";
    }
    return "Unknown";
}

Result<void> KeyHandlerOp::add(Ops& ops) const {
    if (!tag) {
        return Err<void>("KeyHandlerOp without tag");
    }
    const uint8_t data[KeyHandlerSize] = {static_cast<uint8_t>(OpType::KeyHandler),
                                          static_cast<uint8_t>(focus ? 1 : 0)};
    return ops.write(data, {Ref(base::Object::Ptr(tag))});
}

Result<KeyHandlerOp> KeyHandlerOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::KeyHandler); !res) {
        return Err<KeyHandlerOp>("decode", res);
    }
    auto tag = decodeTag(op);
    if (!tag) {
        return Err<KeyHandlerOp>("decode", tag);
    }
    return Ok(KeyHandlerOp{std::move(*tag), op.data[1] != 0});
}

Result<void> HideInputOp::add(Ops& ops) const {
    const uint8_t data[HideInputSize] = {static_cast<uint8_t>(OpType::HideInput)};
    return ops.write(data);
}

Result<HideInputOp> HideInputOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::HideInput); !res) {
        return Err<HideInputOp>("decode", res);
    }
    return Ok(HideInputOp{});
}

} // namespace input
} // namespace weft
