#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <slotca/hash/digest.hpp>
#include <slotca/issuance_error.hpp>
#include <slotca/sign/signature_scheme.hpp>
#include <slotca/sign/signer.hpp>

namespace slotca::sign {

    struct FormatResult {
        bool success{};
        std::vector<uint8_t> data;
        std::optional<ErrorCode> code;
        std::string error_message;

        static FormatResult ok(std::vector<uint8_t> data) { return FormatResult{true, std::move(data), {}, {}}; }
        static FormatResult failure(ErrorCode code, std::string message) {
            return FormatResult{false, {}, code, std::move(message)};
        }
    };

    /**
     * Turns to-be-signed bytes into the exact buffer a raw private-key operation expects:
     *  - ECDSA: the digest, left-padded with zeros to the curve's byte width
     *  - RSA PKCS#1 v1.5: 00 01 FF..FF 00 DigestInfo, modulus-sized
     *  - RSA PSS: EMSA-PSS encoding with MGF1 and a fresh random salt, modulus-sized
     * The signer's output is never inspected here.
     */
    class DigestFormatter {
      public:
        static FormatResult format(const SigningKeyHandle &handle, const SignatureScheme &scheme,
                                   std::string_view digest_name, std::span<const uint8_t> tbs);
        static FormatResult format(const SigningKeyHandle &handle, const SignatureScheme &scheme,
                                   hash::Algorithm digest, std::span<const uint8_t> tbs);

        // Formatting of an already computed hash.
        static FormatResult format_ecdsa(const SigningKeyHandle &handle, const std::vector<uint8_t> &hashed);
        static FormatResult format_pkcs1(const SigningKeyHandle &handle, hash::Algorithm digest,
                                         const std::vector<uint8_t> &hashed);
        static FormatResult format_pss(const SigningKeyHandle &handle, hash::Algorithm digest,
                                       const std::vector<uint8_t> &hashed, const std::vector<uint8_t> &salt);
    };

    // DigestInfo ::= SEQUENCE { digestAlgorithm AlgorithmIdentifier, digest OCTET STRING }
    std::vector<uint8_t> digest_info(hash::Algorithm digest, const std::vector<uint8_t> &hashed);

    // RFC 8017 B.2.1
    std::vector<uint8_t> mgf1(hash::Algorithm digest, std::span<const uint8_t> seed, size_t length);

} // namespace slotca::sign
