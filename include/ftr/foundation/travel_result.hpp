#pragma once

/// @file travel_result.hpp
/// @brief TravelResult<T>: success value or TravelError.

#include <utility>
#include <variant>

#include "ftr/foundation/travel_error.hpp"

namespace ftr::foundation {

/// Outcome of a travel-core operation that can fail.
///
/// No exception crosses the public API of the travel core; failures come
/// back as a TravelError carrying the subsystem-ranged ErrorCode.
///
/// Example:
/// @code
///   auto accepted = orchestrator.attemptTravel("Cierzo");
///   if (!accepted) {
///       FTR_LOG_WARN(LogCategory::Travel, std::string(accepted.error().message()));
///   }
/// @endcode
template <typename T>
class TravelResult {
public:
    static TravelResult ok(T value) { return TravelResult(std::move(value)); }
    static TravelResult err(TravelError error) { return TravelResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return !hasValue(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Undefined unless hasValue().
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Undefined unless hasError().
    [[nodiscard]] const TravelError& error() const& { return std::get<TravelError>(data_); }

private:
    explicit TravelResult(T value) : data_(std::move(value)) {}
    explicit TravelResult(TravelError error) : data_(std::move(error)) {}

    std::variant<T, TravelError> data_;
};

/// Operations that only succeed or fail.
template <>
class TravelResult<void> {
public:
    static TravelResult ok() { return TravelResult(); }
    static TravelResult err(TravelError error) { return TravelResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    [[nodiscard]] const TravelError& error() const& { return error_; }

private:
    TravelResult() = default;
    explicit TravelResult(TravelError error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    TravelError error_;
};

}  // namespace ftr::foundation
