#pragma once

#include "ErrorCodes.h"

#include <variant>
#include <string>
#include <stdexcept>
#include <functional>
#include <utility>

namespace CodeDrop {

/**
 * @brief Failure value carried through Result
 *
 * The component names the subsystem that raised it, so a message surfacing
 * in the CLI reads "[TransportManager] all backends failed (AllTransportsExhausted)".
 */
struct Error {
    ErrorCode code{ErrorCode::InternalError};
    std::string message;
    std::string component;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::string comp = "")
        : code(c), message(std::move(msg)), component(std::move(comp)) {}

    bool is(ErrorCode c) const { return code == c; }

    std::string toString() const {
        std::string out;
        if (!component.empty()) {
            out += "[" + component + "] ";
        }
        out += message;
        out += " (";
        out += errorCodeName(code);
        out += ")";
        return out;
    }
};

// Thrown when the wrong side of a Result is read
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Either a value or an Error
 *
 * @code
 * Result<uint16_t> parsePort(const std::string& s);
 *
 * auto port = parsePort(text);
 * if (port.isError()) return port.error();
 * connect(port.value());
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : state_(std::in_place_index<1>, error) {}
    Result(E&& error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool isOk() const { return state_.index() == 0; }
    bool isError() const { return state_.index() == 1; }
    explicit operator bool() const { return isOk(); }

    T& value() {
        requireValue();
        return std::get<0>(state_);
    }

    const T& value() const {
        requireValue();
        return std::get<0>(state_);
    }

    T takeValue() {
        requireValue();
        return std::move(std::get<0>(state_));
    }

    T valueOr(T fallback) const {
        return isOk() ? std::get<0>(state_) : std::move(fallback);
    }

    E& error() {
        requireError();
        return std::get<1>(state_);
    }

    const E& error() const {
        requireError();
        return std::get<1>(state_);
    }

    // Invokes the callback only on failure; chains
    Result& onError(const std::function<void(const E&)>& callback) {
        if (isError() && callback) callback(std::get<1>(state_));
        return *this;
    }

private:
    void requireValue() const {
        if (isError()) {
            throw BadResultAccess("value() on failed Result: " + std::get<1>(state_).toString());
        }
    }

    void requireError() const {
        if (isOk()) throw BadResultAccess("error() on successful Result");
    }

    std::variant<T, E> state_;
};

// Success carries nothing
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : failure_(error), failed_(true) {}
    Result(E&& error) : failure_(std::move(error)), failed_(true) {}

    bool isOk() const { return !failed_; }
    bool isError() const { return failed_; }
    explicit operator bool() const { return isOk(); }

    E& error() {
        requireError();
        return failure_;
    }

    const E& error() const {
        requireError();
        return failure_;
    }

    Result& onError(const std::function<void(const E&)>& callback) {
        if (failed_ && callback) callback(failure_);
        return *this;
    }

private:
    void requireError() const {
        if (!failed_) throw BadResultAccess("error() on successful Result");
    }

    E failure_{};
    bool failed_{false};
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

inline Error Err(ErrorCode code, std::string message, std::string component = "") {
    return Error(code, std::move(message), std::move(component));
}

} // namespace CodeDrop
