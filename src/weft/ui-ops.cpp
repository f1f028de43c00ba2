#include <weft/ui-ops.h>
#include <weft/ops/byte-order.h>

namespace weft {

Result<void> expectType(const EncodedOp& op, OpType type) {
    if (op.data.empty() || op.type() != type) {
        return Err<void>(std::string("invalid op, expected ") + opTypeName(type));
    }
    return Ok();
}

//=============================================================================
// TransformOp
//=============================================================================

Result<void> TransformOp::add(Ops& ops) const {
    uint8_t data[TransformSize];
    data[0] = static_cast<uint8_t>(OpType::Transform);
    auto off = transform.translation();
    bo::putF32(data + 1, off.x);
    bo::putF32(data + 5, off.y);
    return ops.write(data);
}

Result<TransformOp> TransformOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Transform); !res) {
        return Err<TransformOp>("decode", res);
    }
    f32::Point off{bo::getF32(op.data.data() + 1), bo::getF32(op.data.data() + 5)};
    return Ok(TransformOp{Transform::offset(off)});
}

//=============================================================================
// LayerOp
//=============================================================================

Result<void> LayerOp::add(Ops& ops) const {
    const uint8_t data[LayerSize] = {static_cast<uint8_t>(OpType::Layer)};
    return ops.write(data);
}

Result<LayerOp> LayerOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Layer); !res) {
        return Err<LayerOp>("decode", res);
    }
    return Ok(LayerOp{});
}

//=============================================================================
// InvalidateOp
//=============================================================================

Result<void> InvalidateOp::add(Ops& ops) const {
    uint8_t data[InvalidateSize];
    data[0] = static_cast<uint8_t>(OpType::Invalidate);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(at.time_since_epoch());
    bo::putU64(data + 1, nanos.count() > 0 ? static_cast<uint64_t>(nanos.count()) : 0);
    return ops.write(data);
}

Result<InvalidateOp> InvalidateOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Invalidate); !res) {
        return Err<InvalidateOp>("decode", res);
    }
    InvalidateOp inv;
    auto nanos = std::chrono::nanoseconds(bo::getU64(op.data.data() + 1));
    inv.at = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(nanos));
    return Ok(inv);
}

//=============================================================================
// AuxOp
//=============================================================================

Result<AuxOp> AuxOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Aux); !res) {
        return Err<AuxOp>("decode", res);
    }
    return Ok(AuxOp{op.data.subspan(AuxSize)});
}

} // namespace weft
