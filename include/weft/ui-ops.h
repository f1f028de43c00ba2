#pragma once

#include <weft/geom.h>
#include <weft/ops/reader.h>
#include <chrono>

namespace weft {

// Offsets everything after it until the enclosing scope pop.
struct TransformOp {
    Transform transform;

    Result<void> add(Ops& ops) const;
    static Result<TransformOp> decode(const EncodedOp& op);
};

// Marks a layer boundary: an area hit after it occludes everything before it.
struct LayerOp {
    Result<void> add(Ops& ops) const;
    static Result<LayerOp> decode(const EncodedOp& op);
};

// Requests a redraw. A default (epoch) time means immediately.
struct InvalidateOp {
    std::chrono::system_clock::time_point at{};

    Result<void> add(Ops& ops) const;
    static Result<InvalidateOp> decode(const EncodedOp& op);
};

// One coalesced aux chunk as seen by consumers.
struct AuxOp {
    std::span<const uint8_t> payload;

    static Result<AuxOp> decode(const EncodedOp& op);
};

// Decoded scope markers; written through StackOp.
struct PushOp {};
struct PopOp {};

// Checks the tag of a decoded op before interpreting its payload.
Result<void> expectType(const EncodedOp& op, OpType type);

} // namespace weft
