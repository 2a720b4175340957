#pragma once

/// @file travel_error.hpp
/// @brief Error type used with Result<T, TravelError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "ftr/foundation/error_code.hpp"

namespace ftr::foundation {

/// Error code, human-readable message and optional type-erased context.
class TravelError {
public:
    TravelError() = default;

    explicit TravelError(ErrorCode code)
        : code_(code) {}

    TravelError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    TravelError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace ftr::foundation
