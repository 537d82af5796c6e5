#pragma once

#include <optional>
#include <string>
#include <utility>

namespace slotca {

    enum class ErrorCode {
        InvalidRequest,
        InvalidConfiguration,
        UnsupportedAlgorithm,
        UnsupportedKeySize,
        UnsupportedDigest,
        // Reserved: the extension policy filters, it never rejects.
        PolicyViolation,
        DeviceUnavailable,
        UserDeclined,
        DeviceError,
        InvalidState
    };

    // Assembler state a failure occurred in.
    enum class Stage { Draft, ExtensionsApplied, ToBeSignedEncoded, Signed, Finalized };

    inline const char *error_code_name(ErrorCode code) {
        switch (code) {
        case ErrorCode::InvalidRequest:
            return "InvalidRequest";
        case ErrorCode::InvalidConfiguration:
            return "InvalidConfiguration";
        case ErrorCode::UnsupportedAlgorithm:
            return "UnsupportedAlgorithm";
        case ErrorCode::UnsupportedKeySize:
            return "UnsupportedKeySize";
        case ErrorCode::UnsupportedDigest:
            return "UnsupportedDigest";
        case ErrorCode::PolicyViolation:
            return "PolicyViolation";
        case ErrorCode::DeviceUnavailable:
            return "DeviceUnavailable";
        case ErrorCode::UserDeclined:
            return "UserDeclined";
        case ErrorCode::DeviceError:
            return "DeviceError";
        case ErrorCode::InvalidState:
            return "InvalidState";
        }
        return "Unknown";
    }

    inline const char *stage_name(Stage stage) {
        switch (stage) {
        case Stage::Draft:
            return "Draft";
        case Stage::ExtensionsApplied:
            return "ExtensionsApplied";
        case Stage::ToBeSignedEncoded:
            return "ToBeSignedEncoded";
        case Stage::Signed:
            return "Signed";
        case Stage::Finalized:
            return "Finalized";
        }
        return "Unknown";
    }

    struct IssuanceError {
        ErrorCode code{ErrorCode::InvalidRequest};
        Stage stage{Stage::Draft};
        std::string message;

        [[nodiscard]] std::string to_string() const {
            return std::string(error_code_name(code)) + " at " + stage_name(stage) + ": " + message;
        }
    };

    template <typename T> struct IssuanceResult {
        bool success{};
        T value{};
        IssuanceError error{};

        static IssuanceResult<T> ok(T value) { return IssuanceResult<T>{true, std::move(value), {}}; }
        static IssuanceResult<T> failure(IssuanceError error) { return IssuanceResult<T>{false, {}, std::move(error)}; }
        static IssuanceResult<T> failure(ErrorCode code, Stage stage, std::string message) {
            return failure(IssuanceError{code, stage, std::move(message)});
        }
    };

} // namespace slotca
