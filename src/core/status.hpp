#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace gbce {

/// Result of a fallible load (config file, trade file)
/// Domain rule violations are exceptions; Result is for input the caller
/// is expected to report and carry on from
template <typename T, typename E = std::string>
class Result {
public:
    /// Create a successful result
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /// Create an error result
    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Check if result is successful
    /// Uses index-based check to handle T==E case
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    /// Check if result is an error
    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    /// Get the value (throws if error) - rvalue version
    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace gbce
