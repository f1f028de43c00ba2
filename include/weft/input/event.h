#pragma once

#include <weft/base/factory.h>
#include <weft/base/object.h>
#include <weft/geom.h>
#include <chrono>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace weft {
namespace input {

//=============================================================================
// Tag - identity of an event handler declared in the stream
//=============================================================================
class Tag : public base::Object, public base::ObjectFactory<Tag> {
public:
    using Ptr = std::shared_ptr<Tag>;

    static Result<Ptr> createImpl(std::string name);
    static Result<Ptr> createImpl() { return createImpl(std::string()); }

    const char* typeName() const override { return "Tag"; }
    const std::string& name() const { return _name; }

private:
    explicit Tag(std::string name) : _name(std::move(name)) {}

    std::string _name;
};

//=============================================================================
// Events
//=============================================================================

enum class PointerType : uint8_t { Cancel, Press, Release, Move };
enum class PointerSource : uint8_t { Mouse, Touch };

// Delivery priority of a pointer event to one handler
enum class Priority : uint8_t {
    Shared,    // other handlers see the event too
    Foremost,  // the handler is the topmost one hit
    Grabbed,   // the handler holds an exclusive grab
};

using PointerId = uint32_t;

struct PointerEvent {
    PointerType type = PointerType::Cancel;
    PointerSource source = PointerSource::Mouse;
    PointerId pointerId = 0;
    Priority priority = Priority::Shared;
    std::chrono::milliseconds time{0};
    uint32_t buttons = 0;
    // In the receiving handler's coordinate space
    f32::Point position;
    bool hit = false;
};

struct KeyEvent {
    enum class State : uint8_t { Press, Release };

    std::string name;
    uint32_t modifiers = 0;
    State state = State::Press;
};

struct EditEvent {
    std::string text;
};

struct FocusEvent {
    bool focus = false;
};

using Event = std::variant<PointerEvent, KeyEvent, EditEvent, FocusEvent>;

//=============================================================================
// HandlerEvents - pending events per handler, keyed by handler identity
//=============================================================================
class HandlerEvents {
public:
    void add(base::ObjectId handler, Event event);

    // Replaces the queue of a handler seen for the first time.
    void set(base::ObjectId handler, std::vector<Event> events);

    // Removes and returns the events of handler
    std::vector<Event> take(base::ObjectId handler);

    // Whether events were added since the last call; resets the flag.
    bool updated() {
        bool u = _updated;
        _updated = false;
        return u;
    }
    bool empty() const { return _events.empty(); }
    void clear();

private:
    std::unordered_map<base::ObjectId, std::vector<Event>> _events;
    bool _updated = false;
};

} // namespace input
} // namespace weft
