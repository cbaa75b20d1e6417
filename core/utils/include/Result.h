#pragma once

#include "ErrorCodes.h"
#include <variant>
#include <string>
#include <stdexcept>
#include <functional>
#include <utility>

namespace ChunkVault {

/**
 * @brief Error type for Result pattern
 */
struct Error {
    std::string message;
    int code{0};
    std::string component;

    Error() = default;
    Error(std::string msg, int c = 0, std::string comp = "")
        : message(std::move(msg)), code(c), component(std::move(comp)) {}
    Error(Core::ErrorCode c, std::string msg, std::string comp = "")
        : message(std::move(msg)), code(static_cast<int>(c)), component(std::move(comp)) {}

    Core::ErrorCode errorCode() const { return static_cast<Core::ErrorCode>(code); }
    bool is(Core::ErrorCode c) const { return code == static_cast<int>(c); }

    std::string toString() const {
        std::string result = message;
        if (!component.empty()) {
            result = "[" + component + "] " + result;
        }
        if (code != 0) {
            result += " (" + Core::ErrorInfo::getErrorCodeString(errorCode()) + ")";
        }
        return result;
    }
};

/**
 * @brief Result type for explicit error handling
 *
 * Usage:
 *   Result<std::string> push(const std::vector<uint8_t>& bytes) {
 *       if (bytes.empty()) return Error{Core::ErrorCode::REMOTE_REJECTED, "empty chunk"};
 *       return handle;
 *   }
 *
 *   auto handle = push(bytes);
 *   if (!handle) {
 *       logger.error(handle.error().toString(), "Uploader");
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    // Access value (throws if error)
    T& value() {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    // Access error (throws if ok)
    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    T valueOr(const T& defaultValue) const {
        return isOk() ? std::get<T>(data_) : defaultValue;
    }

    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        if (isOk()) {
            return Result<decltype(func(std::declval<T>())), E>(func(value()));
        }
        return Result<decltype(func(std::declval<T>())), E>(error());
    }

    Result& onError(std::function<void(const E&)> callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void (no value, only success/error)
template<typename E>
class Result<void, E> {
public:
    Result() : data_(OkType{}) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<OkType>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    Result& onError(std::function<void(const E&)> callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    struct OkType {};
    std::variant<OkType, E> data_;
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

inline Error Err(Core::ErrorCode code, std::string message, std::string component = "") {
    return Error(code, std::move(message), std::move(component));
}

} // namespace ChunkVault
