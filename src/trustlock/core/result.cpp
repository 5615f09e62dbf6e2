#include <trustlock/core/result.hpp>

namespace trustlock {

    const char *to_string(ErrorCode code) noexcept {
        switch (code) {
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::Conflict:
            return "Conflict";
        case ErrorCode::LimitExceeded:
            return "LimitExceeded";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::CryptoFailure:
            return "CryptoFailure";
        }
        return "Unknown";
    }

    const char *to_string(CryptoFailureKind kind) noexcept {
        switch (kind) {
        case CryptoFailureKind::AlgorithmUnavailable:
            return "algorithm unavailable";
        case CryptoFailureKind::KeyGenerationFailed:
            return "key generation failed";
        case CryptoFailureKind::SigningFailed:
            return "signing failed";
        case CryptoFailureKind::EncodingFailed:
            return "encoding failed";
        }
        return "unknown";
    }

} // namespace trustlock
