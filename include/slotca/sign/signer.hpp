#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <slotca/cert/public_key.hpp>
#include <slotca/issuance_error.hpp>

namespace slotca::sign {

    using cert::KeyAlgorithm;

    // Names a private key held by the device. Never carries key material.
    struct SigningKeyHandle {
        KeyAlgorithm algorithm{KeyAlgorithm::Unknown};
        size_t key_size_bits{};
        uint8_t slot{};

        // Algorithm and size follow the public half: RSA modulus length or EC field size.
        static SigningKeyHandle from_public_key(const cert::PublicKeyInfo &key, uint8_t slot) {
            return SigningKeyHandle{key.algorithm, key.key_size_bits, slot};
        }

        [[nodiscard]] size_t key_size_bytes() const noexcept { return (key_size_bits + 7) / 8; }
    };

    struct SignResult {
        bool success{};
        std::vector<uint8_t> signature;
        std::optional<ErrorCode> code;
        std::string error_message;

        static SignResult ok(std::vector<uint8_t> signature) { return SignResult{true, std::move(signature), {}, {}}; }
        static SignResult failure(ErrorCode code, std::string message) {
            return SignResult{false, {}, code, std::move(message)};
        }
    };

    /**
     * Raw private-key operation of the device holding the CA key. The input is already
     * hashed and padded; the output is used as the signature value without inspection.
     *
     * sign() may block for as long as the device needs a touch or PIN confirmation. The
     * caller imposes no timeout. Failures are reported as DeviceUnavailable, UserDeclined
     * or DeviceError.
     */
    class Signer {
      public:
        virtual ~Signer() = default;

        virtual SignResult sign(const SigningKeyHandle &handle, const std::vector<uint8_t> &formatted) = 0;
    };

} // namespace slotca::sign
