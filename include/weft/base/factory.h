#pragma once

#include <weft/result.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace weft {
namespace base {

//=============================================================================
// ObjectFactory
//
// Mixin giving T a checked T::create(args...). T supplies a static
// createImpl taking the same arguments; constructors stay private or
// protected so a weft object only ever exists behind a shared_ptr and
// sharedAs works from the first call.
//=============================================================================
template<typename T>
class ObjectFactory {
public:
    using Ptr = std::shared_ptr<T>;

    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        static_assert(canCreate<Args...>(),
                      "weft object needs static Result<Ptr> createImpl(Args...)");
        auto res = T::createImpl(std::forward<Args>(args)...);
        if (res && !*res) {
            return Err<Ptr>("createImpl returned a null object");
        }
        return res;
    }

protected:
    ObjectFactory() = default;

private:
    // T is still incomplete when the base is instantiated, so the lookup
    // goes through U to defer it to the call of canCreate().
    template<typename U, typename... Args>
    static auto probe(int) -> decltype(U::createImpl(std::declval<Args>()...), std::true_type{});
    template<typename U, typename... Args>
    static std::false_type probe(...);

    template<typename... Args>
    static constexpr bool canCreate() {
        return decltype(probe<T, Args...>(0))::value;
    }
};

} // namespace base
} // namespace weft
