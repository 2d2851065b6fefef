#pragma once

#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <cstddef>
#include <type_traits>

namespace sk::core {

/**
 * Result type for loaders that can fail
 * Holds either the loaded value or a human-readable error message
 */
template<typename T>
class Result {
public:
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : data_(std::in_place_index<0>, value) {}

    static Result failure(std::string error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    // Access value (only call if is_ok())
    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }

    // Access error message (only call if is_error())
    const std::string& error() const { return std::get<1>(data_); }

    std::optional<T> try_value() const {
        if (is_ok()) {
            return value();
        }
        return std::nullopt;
    }

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, std::string> data_;
};

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Result<T> Error(std::string message) {
    return Result<T>::failure(std::move(message));
}

} // namespace sk::core
