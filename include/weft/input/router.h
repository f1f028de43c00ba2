#pragma once

#include <weft/input/key-queue.h>
#include <weft/input/pointer-queue.h>
#include <chrono>
#include <optional>

namespace weft {
namespace input {

//=============================================================================
// Router - routes platform input to the handlers declared in a frame
//
// frame() resolves the handler set of a new frame and summarises its redraw
// requests. Between frames, add() feeds events in and events() hands them
// out per handler.
//=============================================================================
class Router {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    Result<void> frame(const Ops::ConstPtr& ops);

    // Returns true when some handler received events.
    bool add(const Event& event);

    std::vector<Event> events(const Tag::Ptr& tag);

    TextInputState textInputState() const { return _keys.inputState(); }

    // Earliest requested redraw; epoch means immediately, nullopt means none.
    std::optional<TimePoint> wakeupTime() const;

    const PointerQueue& pointers() const { return _pointers; }
    const KeyQueue& keys() const { return _keys; }

private:
    Result<void> collect(const Ops::ConstPtr& ops);

    PointerQueue _pointers;
    KeyQueue _keys;
    HandlerEvents _handlers;
    Reader _reader;

    bool _wakeup = false;
    TimePoint _wakeupTime{};
};

} // namespace input
} // namespace weft
