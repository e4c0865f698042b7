#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace arcspin {

//=============================================================================
// Error - message with an optional chained cause
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    // Full message including the cause chain: "outer: inner: root"
    std::string message() const {
        if (!_cause) return _message;
        return _message + ": " + _cause->message();
    }

    const std::string& what() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    std::string to_string() const { return "Error: " + message(); }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

//=============================================================================
// Ok / Err helpers
//=============================================================================
inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

// Chain the error held by `cause` under a new message.
template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) return std::unexpected(Error(std::move(message)));
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().message();
}

} // namespace arcspin
