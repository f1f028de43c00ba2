#include <weft/surface.h>
#include <ytrace/ytrace.hpp>

namespace weft {

Result<Surface::Ptr> Surface::createImpl(const Config::Ptr& config) {
    if (!config) {
        return Err<Ptr>("Surface requires a config");
    }
    IPoint size{config->get<int32_t>(Config::KEY_SURFACE_WIDTH, 800),
                config->get<int32_t>(Config::KEY_SURFACE_HEIGHT, 600)};
    if (size.x <= 0 || size.y <= 0) {
        return Err<Ptr>("invalid surface size " + std::to_string(size.x) + "x" +
                        std::to_string(size.y));
    }
    auto reserveBytes = config->get<size_t>(Config::KEY_OPS_RESERVE_BYTES, 4096);
    auto reserveRefs = config->get<size_t>(Config::KEY_OPS_RESERVE_REFS, 64);
    auto ops = Ops::create(reserveBytes, reserveRefs);
    if (!ops) {
        return Err<Ptr>("Failed to create op buffer", ops);
    }
    yinfo("Surface: {}x{}", size.x, size.y);
    return Ok(Ptr(new Surface(std::move(*ops), size)));
}

void Surface::resize(IPoint size) {
    _size = size;
    _painter.setViewport(size);
}

Result<Surface::FrameResult> Surface::frame(const LayoutFn& layoutFn) {
    _ops->reset();
    if (layoutFn) {
        if (auto res = layoutFn(*_ops, layout::Constraints::exact(_size)); !res) {
            return Err<FrameResult>("layout failed", res);
        }
    }
    if (auto res = _painter.collect(_ops); !res) {
        return Err<FrameResult>("paint failed", res);
    }
    if (auto res = _router.frame(_ops); !res) {
        return Err<FrameResult>("input failed", res);
    }
    ++_frames;
    ydebug("Surface: frame {} recorded {} bytes, {} refs", _frames, _ops->data().size(),
           _ops->refs().size());
    return Ok(FrameResult{&_painter.drawList(), _router.textInputState(), _router.wakeupTime()});
}

} // namespace weft
