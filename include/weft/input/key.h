#pragma once

#include <weft/input/event.h>
#include <weft/ops/reader.h>

namespace weft {
namespace input {

// What the platform text-input (soft keyboard, IME) should do after a frame.
enum class TextInputState : uint8_t {
    Keep,   // no change
    Close,  // hide the input session
    Open,   // a handler asked for focus this frame: open a session
    Focus,  // focus moved to another handler: refocus the session
};

const char* textInputStateName(TextInputState s);

// Declares tag as a key handler. With focus set the handler requests focus.
struct KeyHandlerOp {
    Tag::Ptr tag;
    bool focus = false;

    Result<void> add(Ops& ops) const;
    static Result<KeyHandlerOp> decode(const EncodedOp& op);
};

// Requests that the text input session is closed.
struct HideInputOp {
    Result<void> add(Ops& ops) const;
    static Result<HideInputOp> decode(const EncodedOp& op);
};

} // namespace input
} // namespace weft
