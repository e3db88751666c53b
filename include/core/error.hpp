#pragma once

#include <optional>
#include <string>

namespace tokenmeter {

/**
 * @brief Error categories surfaced to callers
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,
    IO_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::PARSE_ERROR:    return "parse error";
        case ErrorCategory::IO_ERROR:       return "I/O error";
    }
    return "unknown";
}

/**
 * @brief Value or categorized error. Failures travel by value, not by throw.
 */
template<typename T>
class Result {
public:
    template<typename U> friend class Result;

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

    // Re-type the error of another result, e.g. when a step's failure ends the caller
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category_, other.error_message_);
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

    // "I/O error: <message>"
    std::string describe() const {
        return std::string(error_category_to_string(error_category_)) + ": " + error_message_;
    }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace tokenmeter
