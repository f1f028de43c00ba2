#include <weft/ops/ops.h>
#include <weft/ops/byte-order.h>
#include <ytrace/ytrace.hpp>

namespace weft {

//=============================================================================
// Ops
//=============================================================================

Result<Ops::Ptr> Ops::createImpl() {
    return Ok(Ptr(new Ops()));
}

Result<Ops::Ptr> Ops::createImpl(size_t reserveBytes, size_t reserveRefs) {
    auto ops = Ptr(new Ops());
    ops->_data.reserve(reserveBytes);
    ops->_refs.reserve(reserveRefs);
    return Ok(std::move(ops));
}

Pc Ops::pc() const {
    return Pc{static_cast<uint32_t>(_data.size()), static_cast<uint32_t>(_refs.size())};
}

Result<void> Ops::validateRefs(OpType type, std::initializer_list<Ref> refs) const {
    auto props = opProps(type);
    if (refs.size() != props.numRefs) {
        yerror("Ops::write: {} takes {} refs, got {}", opTypeName(type), props.numRefs,
               refs.size());
        return Err<void>(std::string("invalid ref count for ") + opTypeName(type));
    }
    for (const auto& ref : refs) {
        bool live = std::visit(
            [](const auto& r) {
                using R = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<R, base::Object::Ptr>) {
                    return r != nullptr;
                } else {
                    return !r.expired();
                }
            },
            ref);
        if (!live) {
            yerror("Ops::write: null reference for {}", opTypeName(type));
            return Err<void>(std::string("null reference for ") + opTypeName(type));
        }
    }
    // Only a macro invocation may reference a buffer.
    for (const auto& ref : refs) {
        bool isBuffer = std::holds_alternative<std::weak_ptr<const Ops>>(ref);
        if (isBuffer != (type == OpType::Macro)) {
            yerror("Ops::write: reference kind does not match {}", opTypeName(type));
            return Err<void>(std::string("invalid reference kind for ") + opTypeName(type));
        }
    }
    return Ok();
}

Result<void> Ops::write(std::span<const uint8_t> op, std::initializer_list<Ref> refs) {
    if (op.empty()) {
        return Err<void>("empty op");
    }
    auto props = opProps(op[0]);
    if (!props) {
        yerror("Ops::write: invalid op tag {}", op[0]);
        return Err<void>("invalid op tag " + std::to_string(op[0]));
    }
    auto type = static_cast<OpType>(op[0]);
    if (type == OpType::MacroDef) {
        yerror("Ops::write: MacroDef headers are only written by record()");
        return Err<void>("MacroDef written outside record()");
    }
    if (auto res = validateRefs(type, refs); !res) {
        return res;
    }

    if (type == OpType::Aux) {
        auto payload = op.subspan(1);
        if (payload.size() > UINT32_MAX - _auxLen) {
            return Err<void>("aux chunk too large");
        }
        if (!_inAux) {
            _inAux = true;
            _auxOff = _data.size();
            _auxLen = 0;
            uint8_t header[AuxSize] = {static_cast<uint8_t>(OpType::Aux), 0, 0, 0, 0};
            _data.insert(_data.end(), header, header + AuxSize);
        }
        _data.insert(_data.end(), payload.begin(), payload.end());
        _auxLen += static_cast<uint32_t>(payload.size());
        bo::putU32(_data.data() + _auxOff + 1, _auxLen);
        return Ok();
    }

    if (op.size() != props->size) {
        yerror("Ops::write: {} is {} bytes, got {}", opTypeName(type), props->size, op.size());
        return Err<void>(std::string("invalid length for ") + opTypeName(type));
    }
    append(op, refs);
    return Ok();
}

void Ops::append(std::span<const uint8_t> op, std::initializer_list<Ref> refs) {
    closeAux();
    _data.insert(_data.end(), op.begin(), op.end());
    _refs.insert(_refs.end(), refs.begin(), refs.end());
}

void Ops::closeAux() {
    if (!_inAux) return;
    bo::putU32(_data.data() + _auxOff + 1, _auxLen);
    _inAux = false;
    _auxOff = 0;
    _auxLen = 0;
}

std::span<uint8_t> Ops::aux() {
    if (!_inAux) return {};
    return std::span<uint8_t>(_data.data() + _auxOff + AuxSize, _auxLen);
}

Result<MacroId> Ops::record() {
    closeAux();
    MacroId id = _nextMacroId++;
    Pc start = pc();
    _macroStack.push_back({id, start, _scopeDepth});

    // Placeholder header; it already points past itself so the stream stays
    // decodable while the recording is open.
    uint8_t header[MacroDefSize];
    header[0] = static_cast<uint8_t>(OpType::MacroDef);
    bo::putU32(header + 1, start.data + static_cast<uint32_t>(MacroDefSize));
    bo::putU32(header + 5, start.refs);
    _data.insert(_data.end(), header, header + MacroDefSize);
    return Ok(id);
}

Result<MacroOp> Ops::stop(MacroId id) {
    if (_macroStack.empty()) {
        yerror("Ops::stop: no recording in progress");
        return Err<MacroOp>("stop without record");
    }
    if (_macroStack.back().id != id) {
        yerror("Ops::stop: recording {} is not the innermost open recording ({})", id,
               _macroStack.back().id);
        return Err<MacroOp>("unbalanced macro stop");
    }
    if (_scopeDepth != _macroStack.back().scopeDepth) {
        yerror("Ops::stop: recording {} still has {} open scope(s)", id,
               _scopeDepth - _macroStack.back().scopeDepth);
        return Err<MacroOp>("stop with an open scope");
    }
    closeAux();
    Pc start = _macroStack.back().start;
    _macroStack.pop_back();

    Pc end = pc();
    bo::putU32(_data.data() + start.data + 1, end.data);
    bo::putU32(_data.data() + start.data + 5, end.refs);

    std::shared_ptr<const Ops> self = sharedAs<Ops>();
    return Ok(MacroOp(self, start, _version));
}

void Ops::reset() {
    _data.clear();
    _refs.clear();
    _macroStack.clear();
    _scopeDepth = 0;
    _inAux = false;
    _auxOff = 0;
    _auxLen = 0;
    ++_version;
}

//=============================================================================
// MacroOp
//=============================================================================

Result<void> MacroOp::add(Ops& target) const {
    if (!_valid) return Ok();
    auto source = _ops.lock();
    if (!source) {
        yerror("MacroOp::add: source buffer is gone");
        return Err<void>("macro source buffer destroyed");
    }
    if (source->version() != _version) {
        yerror("MacroOp::add: stale macro (version {} != {})", _version, source->version());
        return Err<void>("stale macro handle");
    }
    uint8_t op[MacroSize];
    op[0] = static_cast<uint8_t>(OpType::Macro);
    bo::putU32(op + 1, _pc.data);
    bo::putU32(op + 5, _pc.refs);
    bo::putU32(op + 9, _version);
    return target.write(op, {Ref(_ops)});
}

} // namespace weft
