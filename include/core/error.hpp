#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace haproxyotel {

/**
 * @brief Error categories for the module
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    BOOTSTRAP_ERROR,
    HOST_ERROR
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Thrown by host adapters when a transaction accessor fails
 *
 * Propagates out of the hook invocation that triggered it; the host
 * reports it as a failure of that single callback.
 */
class HostError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown by register_module when the exporter cannot be built
 *
 * No hooks are registered once this has been raised.
 */
class RegistrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace haproxyotel
