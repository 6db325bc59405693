#pragma once

#include <string>
#include <utility>
#include <variant>

namespace timeline_model {

struct ValidationError {
    std::string field;   // e.g. "zoomEffects[2].endTime"
    std::string message;

    std::string to_string() const { return field.empty() ? message : field + ": " + message; }
};

// Either a value or the reason it could not be produced.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ValidationError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(data_); }
    T& value() & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const ValidationError& error() const { return std::get<ValidationError>(data_); }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, ValidationError> data_;
};

} // namespace timeline_model
