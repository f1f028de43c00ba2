#pragma once

#include <weft/base/factory.h>
#include <weft/base/object.h>
#include <weft/config.h>
#include <weft/input/router.h>
#include <weft/layout/layout.h>
#include <weft/paint/painter.h>
#include <functional>

namespace weft {

//=============================================================================
// Surface - one window's worth of frame state
//
// Owns the op buffer that is reset and re-recorded every frame, and runs the
// consumers over it once the layout pass is done.
//=============================================================================
class Surface : public base::Object, public base::ObjectFactory<Surface> {
public:
    using Ptr = std::shared_ptr<Surface>;
    using LayoutFn = std::function<Result<void>(Ops&, const layout::Constraints&)>;

    struct FrameResult {
        const paint::DrawList* drawList = nullptr;
        input::TextInputState textInput = input::TextInputState::Keep;
        std::optional<input::Router::TimePoint> wakeup;
    };

    static Result<Ptr> createImpl(const Config::Ptr& config);

    const char* typeName() const override { return "Surface"; }

    // Resets the buffer, runs layout, then paints and resolves input.
    Result<FrameResult> frame(const LayoutFn& layoutFn);

    // Feeds a platform event in; true when a handler received events.
    bool addEvent(const input::Event& event) { return _router.add(event); }
    std::vector<input::Event> events(const input::Tag::Ptr& tag) { return _router.events(tag); }

    void resize(IPoint size);
    IPoint size() const { return _size; }
    Ops::ConstPtr ops() const { return _ops; }
    uint64_t frameCount() const { return _frames; }

private:
    Surface(Ops::Ptr ops, IPoint size) : _ops(std::move(ops)), _size(size), _painter(size) {}

    Ops::Ptr _ops;
    IPoint _size;
    paint::Painter _painter;
    input::Router _router;
    uint64_t _frames = 0;
};

} // namespace weft
