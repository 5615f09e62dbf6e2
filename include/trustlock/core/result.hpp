#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace trustlock {

    enum class ErrorCode { InvalidInput, Conflict, LimitExceeded, NotFound, InvalidState, CryptoFailure };

    enum class CryptoFailureKind { AlgorithmUnavailable, KeyGenerationFailed, SigningFailed, EncodingFailed };

    const char *to_string(ErrorCode code) noexcept;
    const char *to_string(CryptoFailureKind kind) noexcept;

    struct Error {
        ErrorCode code{};
        std::string message;
        std::optional<CryptoFailureKind> crypto;

        // Set on Conflict: the device already holding the MAC address
        std::optional<std::string> existing_device_id;
        // Set on LimitExceeded: devices currently counted against the account
        std::optional<std::size_t> device_count;

        static Error invalid_input(std::string message) { return Error{ErrorCode::InvalidInput, std::move(message)}; }
        static Error not_found(std::string message) { return Error{ErrorCode::NotFound, std::move(message)}; }
        static Error invalid_state(std::string message) { return Error{ErrorCode::InvalidState, std::move(message)}; }

        static Error conflict(std::string message, std::optional<std::string> existing_device_id = std::nullopt) {
            Error error{ErrorCode::Conflict, std::move(message)};
            error.existing_device_id = std::move(existing_device_id);
            return error;
        }

        static Error limit_exceeded(std::string message, std::size_t device_count) {
            Error error{ErrorCode::LimitExceeded, std::move(message)};
            error.device_count = device_count;
            return error;
        }

        static Error crypto_failure(CryptoFailureKind kind, std::string message) {
            Error error{ErrorCode::CryptoFailure, std::move(message)};
            error.crypto = kind;
            return error;
        }
    };

    // Either a value or an Error, never both.
    template <typename T> class Result {
      public:
        static Result<T> ok(T value) { return Result<T>(std::in_place_index<0>, std::move(value)); }

        static Result<T> failure(Error error) { return Result<T>(std::in_place_index<1>, std::move(error)); }

        [[nodiscard]] bool success() const noexcept { return state_.index() == 0; }

        explicit operator bool() const noexcept { return success(); }

        [[nodiscard]] const T &value() const & {
            if (!success()) {
                throw std::logic_error("value() called on failed result: " + std::get<1>(state_).message);
            }
            return std::get<0>(state_);
        }

        [[nodiscard]] T &value() & {
            if (!success()) {
                throw std::logic_error("value() called on failed result: " + std::get<1>(state_).message);
            }
            return std::get<0>(state_);
        }

        [[nodiscard]] T &&value() && {
            if (!success()) {
                throw std::logic_error("value() called on failed result: " + std::get<1>(state_).message);
            }
            return std::get<0>(std::move(state_));
        }

        [[nodiscard]] const Error &error() const {
            if (success()) {
                throw std::logic_error("error() called on successful result");
            }
            return std::get<1>(state_);
        }

        [[nodiscard]] ErrorCode code() const { return error().code; }

      private:
        template <std::size_t I, typename U>
        Result(std::in_place_index_t<I> tag, U &&payload) : state_(tag, std::forward<U>(payload)) {}

        std::variant<T, Error> state_;
    };

    using BoolResult = Result<bool>;

} // namespace trustlock
