#include <weft/layout/stack.h>
#include <weft/ui-ops.h>
#include <ytrace/ytrace.hpp>

namespace weft {
namespace layout {

void Stack::init(Ops& ops, const Constraints& cs) {
    _ops = &ops;
    _cs = cs;
    _maxSize = {};
    _baseline = 0;
}

Result<void> Stack::begin() {
    if (!_ops) {
        yerror("Stack: child added before init");
        return Err<void>("stack not initialized");
    }
    if (_recorder.recording()) {
        yerror("Stack: child added before the previous one ended");
        return Err<void>("stack child still open");
    }
    return _recorder.record(*_ops);
}

Result<Constraints> Stack::rigid() {
    if (auto res = begin(); !res) return Err<Constraints>("rigid", res);
    return Ok(_cs);
}

Result<Constraints> Stack::expand() {
    if (auto res = begin(); !res) return Err<Constraints>("expand", res);
    return Ok(Constraints::exact(_maxSize));
}

Result<StackChild> Stack::end(const Dimensions& dims) {
    auto macro = _recorder.stop();
    if (!macro) {
        return Err<StackChild>("stack end", macro);
    }
    _maxSize.x = std::max(_maxSize.x, dims.size.x);
    _maxSize.y = std::max(_maxSize.y, dims.size.y);
    if (_baseline == 0 && dims.baseline != dims.size.y) {
        _baseline = dims.baseline;
    }
    return Ok(StackChild{*macro, dims});
}

Result<Dimensions> Stack::layout(std::initializer_list<StackChild> children) {
    if (!_ops) {
        return Err<Dimensions>("stack not initialized");
    }
    for (const auto& ch : children) {
        auto sz = ch.dims.size;
        IPoint p;
        switch (alignment) {
            case Direction::N:
            case Direction::S:
            case Direction::Center:
                p.x = (_maxSize.x - sz.x) / 2;
                break;
            case Direction::NE:
            case Direction::SE:
            case Direction::E:
                p.x = _maxSize.x - sz.x;
                break;
            default:
                break;
        }
        switch (alignment) {
            case Direction::W:
            case Direction::Center:
            case Direction::E:
                p.y = (_maxSize.y - sz.y) / 2;
                break;
            case Direction::SW:
            case Direction::S:
            case Direction::SE:
                p.y = _maxSize.y - sz.y;
                break;
            default:
                break;
        }

        StackOp stack;
        if (auto res = stack.push(*_ops); !res) return Err<Dimensions>("stack layout", res);
        TransformOp offset{Transform::offset({float(p.x), float(p.y)})};
        if (auto res = offset.add(*_ops); !res) return Err<Dimensions>("stack layout", res);
        if (auto res = ch.macro.add(*_ops); !res) return Err<Dimensions>("stack layout", res);
        if (auto res = stack.pop(); !res) return Err<Dimensions>("stack layout", res);
    }
    int32_t b = _baseline == 0 ? _maxSize.y : _baseline;
    return Ok(Dimensions{_maxSize, b});
}

} // namespace layout
} // namespace weft
