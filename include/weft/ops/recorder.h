#pragma once

#include <weft/ops/ops.h>

namespace weft {

//=============================================================================
// MacroRecorder - reusable record/stop pair over one buffer
//
//   MacroRecorder rec;
//   rec.record(ops);
//   ... write child ops ...
//   auto macro = rec.stop();   // Result<MacroOp>
//=============================================================================
class MacroRecorder {
public:
    Result<void> record(Ops& ops);
    Result<MacroOp> stop();

    bool recording() const { return _ops != nullptr; }

private:
    Ops* _ops = nullptr;
    MacroId _id = 0;
};

//=============================================================================
// StackOp - scope push/pop guard
//
// push() saves transform, clip and material state for consumers; pop()
// restores it. Pairs are LIFO and must not cross a macro boundary.
//=============================================================================
class StackOp {
public:
    Result<void> push(Ops& ops);
    Result<void> pop();

    bool active() const { return _ops != nullptr; }

private:
    Ops* _ops = nullptr;
    uint32_t _depth = 0;
    MacroId _macro = 0;
    uint32_t _version = 0;
};

} // namespace weft
