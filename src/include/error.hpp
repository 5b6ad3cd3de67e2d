#pragma once

#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <crow/json.h>

namespace stagegate {

// Error categories. Format and Security are the two kinds a caller keys
// log severity and response detail off.
enum class ErrorCategory {
    Format,         // Syntactically invalid input, safe to echo to the caller
    Security,       // Traversal, symlink escape or unexpected filesystem state
    Io,             // Staging read/write failures after the guard accepted the path
    Configuration   // Startup configuration problems
};

struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;

    static Error Format(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Format, msg, details};
    }

    // Security errors carry no details: the message names the violated rule only
    static Error Security(const std::string& msg) {
        return Error{ErrorCategory::Security, msg, ""};
    }

    static Error Io(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Io, msg, details};
    }

    static Error Config(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Configuration, msg, details};
    }

    bool isSecurity() const { return category == ErrorCategory::Security; }
    bool isFormat() const { return category == ErrorCategory::Format; }

    // Convert error to JSON representation
    crow::json::wvalue toJson() const;

    // Get category name as string
    std::string getCategoryName() const;

    // Process exit code used by the command line front end
    int exitCode() const;
};

// Expected<T, E> is a sum type that can hold either a success value or an error
template<typename T, typename E = Error>
class Expected {
public:
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        destroy();
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected: " + error_.message);
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected: " + error_.message);
        return value_;
    }

    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    void destroy() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

template<typename T>
using Result = Expected<T, Error>;

} // namespace stagegate
