#include <weft/input/event.h>

namespace weft {
namespace input {

Result<Tag::Ptr> Tag::createImpl(std::string name) {
    return Ok(Ptr(new Tag(std::move(name))));
}

void HandlerEvents::add(base::ObjectId handler, Event event) {
    _events[handler].push_back(std::move(event));
    _updated = true;
}

void HandlerEvents::set(base::ObjectId handler, std::vector<Event> events) {
    if (!events.empty()) _updated = true;
    _events[handler] = std::move(events);
}

std::vector<Event> HandlerEvents::take(base::ObjectId handler) {
    auto it = _events.find(handler);
    if (it == _events.end()) return {};
    auto events = std::move(it->second);
    _events.erase(it);
    return events;
}

void HandlerEvents::clear() {
    _events.clear();
    _updated = false;
}

} // namespace input
} // namespace weft
