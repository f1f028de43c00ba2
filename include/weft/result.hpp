#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace weft {

//=============================================================================
// Error - message with an optional chained cause
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    // Message of this error only
    const std::string& message() const { return _message; }

    const Error* cause() const { return _cause.get(); }

    // Message including the whole cause chain: "outer: inner: root"
    std::string to_string() const {
        if (!_cause) return _message;
        return _message + ": " + _cause->to_string();
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().to_string();
}

} // namespace weft

// Propagate an error from an expression returning Result<...> inside a
// function returning any Result<...>.
#define WEFT_CHECK(expr, msg)                                                   \
    do {                                                                        \
        if (auto _weft_res = (expr); !_weft_res) {                              \
            return std::unexpected(::weft::Error((msg), _weft_res.error()));    \
        }                                                                       \
    } while (0)
