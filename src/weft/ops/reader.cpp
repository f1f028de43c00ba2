#include <weft/ops/reader.h>
#include <weft/ops/byte-order.h>
#include <ytrace/ytrace.hpp>

namespace weft {

namespace {
// Guards against corrupted invocation chains.
constexpr size_t MaxMacroDepth = 256;
} // namespace

Result<void> Reader::reset(Ops::ConstPtr ops) {
    if (!ops) {
        return Err<void>("reader reset with null buffer");
    }
    if (ops->openRecordings() != 0) {
        yerror("Reader::reset: buffer has {} unfinished recordings", ops->openRecordings());
        return Err<void>("buffer has unfinished recordings");
    }
    _ops = std::move(ops);
    _pc = Pc{};
    _stack.clear();
    _failure.clear();
    return Ok();
}

Result<std::optional<EncodedOp>> Reader::fail(std::string message) {
    yerror("Reader: {} at pc {}/{}", message, _pc.data, _pc.refs);
    _failure = std::move(message);
    _stack.clear();
    return Err<std::optional<EncodedOp>>(_failure);
}

Result<std::optional<EncodedOp>> Reader::decode() {
    if (!_failure.empty()) {
        return Err<std::optional<EncodedOp>>(_failure);
    }
    if (!_ops) {
        return Err<std::optional<EncodedOp>>("reader not attached to a buffer");
    }

    for (;;) {
        if (!_stack.empty() && _pc == _stack.back().endPc) {
            _ops = std::move(_stack.back().ops);
            _pc = _stack.back().retPc;
            _stack.pop_back();
            continue;
        }

        auto data = _ops->data();
        auto refs = _ops->refs();

        if (!_stack.empty()) {
            // the cursor must land exactly on the end pc; equality was
            // handled above
            const auto& end = _stack.back().endPc;
            if (_pc.data >= end.data || _pc.refs > end.refs) {
                return fail("op straddles macro end");
            }
        }
        if (_pc.data >= data.size()) {
            if (!_stack.empty()) {
                return fail("macro runs past end of buffer");
            }
            return Ok(std::optional<EncodedOp>());
        }

        auto props = opProps(data[_pc.data]);
        if (!props) {
            return fail("invalid op tag " + std::to_string(data[_pc.data]));
        }
        auto type = static_cast<OpType>(data[_pc.data]);
        size_t size = props->size;
        if (type == OpType::Aux) {
            if (_pc.data + AuxSize > data.size()) {
                return fail("truncated aux header");
            }
            size += bo::getU32(data.data() + _pc.data + 1);
        }
        if (_pc.data + size > data.size()) {
            return fail(std::string("truncated ") + opTypeName(type));
        }
        if (static_cast<size_t>(_pc.refs) + props->numRefs > refs.size()) {
            return fail(std::string("missing refs for ") + opTypeName(type));
        }

        auto opData = data.subspan(_pc.data, size);
        auto opRefs = refs.subspan(_pc.refs, props->numRefs);
        Pc next{static_cast<uint32_t>(_pc.data + size), _pc.refs + props->numRefs};

        if (type == OpType::MacroDef) {
            // Definition reached linearly: skip it, it only runs when invoked.
            Pc end{bo::getU32(opData.data() + 1), bo::getU32(opData.data() + 5)};
            if (end.data < next.data || end.data > data.size() || end.refs < _pc.refs ||
                end.refs > refs.size()) {
                return fail("invalid macro definition bounds");
            }
            _pc = end;
            continue;
        }

        if (type == OpType::Macro) {
            auto* weak = std::get_if<std::weak_ptr<const Ops>>(&opRefs[0]);
            if (!weak) {
                return fail("macro reference is not a buffer");
            }
            auto source = weak->lock();
            if (!source) {
                return fail("macro source buffer destroyed");
            }
            uint32_t version = bo::getU32(opData.data() + 9);
            if (source->version() != version) {
                return fail("invalid macro reference: version " + std::to_string(version) +
                            " != " + std::to_string(source->version()));
            }
            Pc start{bo::getU32(opData.data() + 1), bo::getU32(opData.data() + 5)};
            auto sdata = source->data();
            if (start.data + MacroDefSize > sdata.size() ||
                sdata[start.data] != static_cast<uint8_t>(OpType::MacroDef)) {
                return fail("invalid macro reference: target is not a macro definition");
            }
            Pc end{bo::getU32(sdata.data() + start.data + 1),
                   bo::getU32(sdata.data() + start.data + 5)};
            if (end.data < start.data + MacroDefSize || end.data > sdata.size() ||
                end.refs < start.refs || end.refs > source->refs().size()) {
                return fail("invalid macro definition bounds");
            }
            if (_stack.size() >= MaxMacroDepth) {
                return fail("macro nesting too deep");
            }
            _stack.push_back(Frame{std::move(_ops), next, end});
            _ops = std::move(source);
            _pc = Pc{start.data + static_cast<uint32_t>(MacroDefSize), start.refs};
            continue;
        }

        EncodedOp op{OpKey{_ops->id(), _pc.data, _ops->version()}, opData, opRefs};
        _pc = next;
        return Ok(std::optional<EncodedOp>(op));
    }
}

} // namespace weft
