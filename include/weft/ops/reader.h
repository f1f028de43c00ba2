#pragma once

#include <weft/ops/ops.h>
#include <optional>
#include <string>
#include <vector>

namespace weft {

// Stable identity of a decoded op within one buffer version. Ops replayed
// from a macro carry the key of their position in the source buffer, so
// every invocation of the same macro yields the same keys.
struct OpKey {
    base::ObjectId ops = base::NoObjectId;
    uint32_t pc = 0;
    uint32_t version = 0;

    bool operator==(const OpKey&) const = default;
};

struct EncodedOp {
    OpKey key;
    std::span<const uint8_t> data;
    std::span<const Ref> refs;

    OpType type() const { return static_cast<OpType>(data[0]); }
};

//=============================================================================
// Reader - linear decoder over a buffer with macro invocations inlined
//
// Macro nesting is an explicit stack of return frames, never recursion.
// Definitions reached in the linear flow are skipped; their content only
// appears where a Macro op invokes them.
//=============================================================================
class Reader {
public:
    // Fails if ops still has open recordings.
    Result<void> reset(Ops::ConstPtr ops);

    // Next op, nullopt at end of stream. After an error the reader stays
    // failed until the next reset().
    Result<std::optional<EncodedOp>> decode();

private:
    struct Frame {
        Ops::ConstPtr ops;
        Pc retPc;
        Pc endPc;
    };

    Result<std::optional<EncodedOp>> fail(std::string message);

    Ops::ConstPtr _ops;
    Pc _pc;
    std::vector<Frame> _stack;
    std::string _failure;
};

} // namespace weft
