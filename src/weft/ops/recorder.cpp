#include <weft/ops/recorder.h>
#include <ytrace/ytrace.hpp>

namespace weft {

//=============================================================================
// MacroRecorder
//=============================================================================

Result<void> MacroRecorder::record(Ops& ops) {
    if (_ops) {
        yerror("MacroRecorder::record: already recording");
        return Err<void>("macro already recording");
    }
    auto id = ops.record();
    if (!id) {
        return Err<void>("record failed", id);
    }
    _ops = &ops;
    _id = *id;
    return Ok();
}

Result<MacroOp> MacroRecorder::stop() {
    if (!_ops) {
        yerror("MacroRecorder::stop: not recording");
        return Err<MacroOp>("macro not recording");
    }
    auto macro = _ops->stop(_id);
    if (!macro) {
        return Err<MacroOp>("stop failed", macro);
    }
    _ops = nullptr;
    _id = 0;
    return macro;
}

//=============================================================================
// StackOp
//=============================================================================

Result<void> StackOp::push(Ops& ops) {
    if (_ops) {
        yerror("StackOp::push: already pushed");
        return Err<void>("stack op already active");
    }
    const uint8_t op[PushSize] = {static_cast<uint8_t>(OpType::Push)};
    if (auto res = ops.write(op); !res) {
        return Err<void>("push failed", res);
    }
    _ops = &ops;
    _depth = ++ops._scopeDepth;
    _macro = ops._macroStack.empty() ? 0 : ops._macroStack.back().id;
    _version = ops.version();
    return Ok();
}

Result<void> StackOp::pop() {
    if (!_ops) {
        yerror("StackOp::pop: pop without push");
        return Err<void>("pop without push");
    }
    if (_ops->version() != _version) {
        yerror("StackOp::pop: buffer was reset since push");
        return Err<void>("pop after reset");
    }
    if (_ops->_scopeDepth != _depth) {
        yerror("StackOp::pop: unbalanced pop (depth {} != {})", _ops->_scopeDepth, _depth);
        return Err<void>("unbalanced pop");
    }
    MacroId macro = _ops->_macroStack.empty() ? 0 : _ops->_macroStack.back().id;
    if (macro != _macro) {
        yerror("StackOp::pop: pop crosses a macro boundary");
        return Err<void>("pop crosses macro boundary");
    }
    const uint8_t op[PopSize] = {static_cast<uint8_t>(OpType::Pop)};
    if (auto res = _ops->write(op); !res) {
        return Err<void>("pop failed", res);
    }
    --_ops->_scopeDepth;
    _ops = nullptr;
    return Ok();
}

} // namespace weft
