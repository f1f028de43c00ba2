#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <type_traits>

namespace weft {
namespace base {

using ObjectId = uint64_t;

// Marks "no object" in id-keyed tables; allocateId() never reaches it
inline constexpr ObjectId NoObjectId = std::numeric_limits<ObjectId>::max();

//=============================================================================
// Object
//
// Anything an op stream can point at: buffers, images, handler tags and
// surfaces. The stream keeps the shared pointer in its ref table and the
// consumers compare entries by identity. Two objects never share an id, and
// ids are not recycled for the lifetime of the process, so an id seen in a
// previous frame cannot alias a new object.
//=============================================================================
class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    virtual ~Object() = default;

    ObjectId id() const { return _id; }

    virtual const char* typeName() const = 0;

    // Shared handle of the concrete type; empty when the object is not of
    // type T or is not owned by a shared_ptr yet.
    template<typename T>
    std::shared_ptr<T> sharedAs() {
        static_assert(std::is_base_of_v<Object, T>, "sharedAs target must be an Object");
        auto self = weak_from_this().lock();
        return std::dynamic_pointer_cast<T>(self);
    }

protected:
    Object() : _id(allocateId()) {}

private:
    static ObjectId allocateId() {
        static std::atomic<ObjectId> next{1};
        return next.fetch_add(1, std::memory_order_relaxed);
    }

    const ObjectId _id;
};

} // namespace base
} // namespace weft
