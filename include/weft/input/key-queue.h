#pragma once

#include <weft/input/key.h>
#include <unordered_map>

namespace weft {
namespace input {

//=============================================================================
// KeyQueue - key focus resolution
//
// Each frame one linear pass over the stream decides which handler holds the
// keyboard focus and what the platform text input should do:
//
//   focus requested this frame   > handler already focused > other handlers
//
// Ties go to the handler declared later. Handlers not declared in a frame
// are evicted after it.
//=============================================================================
class KeyQueue {
public:
    Result<void> frame(const Ops::ConstPtr& ops, HandlerEvents& events);

    // Delivers key and edit events to the focused handler, if any.
    void push(const Event& event, HandlerEvents& events);

    TextInputState inputState() const { return _state; }
    Tag::Ptr focus() const { return _focus; }

private:
    enum class Priority : uint8_t { None, Default, CurrentFocus, NewFocus };

    struct Handler {
        Tag::Ptr tag;
        bool active = false;
    };

    Reader _reader;
    Tag::Ptr _focus;
    std::unordered_map<base::ObjectId, Handler> _handlers;
    TextInputState _state = TextInputState::Keep;
};

} // namespace input
} // namespace weft
