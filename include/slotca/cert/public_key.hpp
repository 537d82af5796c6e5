#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <slotca/cert/asn1_common.hpp>

namespace slotca::cert {

    enum class KeyAlgorithm { Unknown = 0, Rsa, Ecdsa };

    struct PublicKeyInfo {
        KeyAlgorithm algorithm{KeyAlgorithm::Unknown};
        CurveId curve{CurveId::Unknown};
        // RSA modulus length or EC field size.
        size_t key_size_bits{};
        // Complete SubjectPublicKeyInfo, re-emitted verbatim into issued certificates.
        std::vector<uint8_t> spki_der;
        // Contents of the subjectPublicKey BIT STRING.
        std::vector<uint8_t> subject_public_key;

        [[nodiscard]] bool empty() const noexcept { return spki_der.empty(); }
    };

    struct PublicKeyResult {
        bool success{};
        PublicKeyInfo value{};
        size_t bytes_consumed{};
        std::string error{};

        static PublicKeyResult failure(std::string message) {
            return PublicKeyResult{false, {}, 0, std::move(message)};
        }
        static PublicKeyResult ok(PublicKeyInfo info, size_t consumed) {
            return PublicKeyResult{true, std::move(info), consumed, {}};
        }
    };

    const char *key_algorithm_name(KeyAlgorithm algorithm);

    // Reads a SubjectPublicKeyInfo. Only RSA and NIST P-curve ECDSA keys are recognised.
    PublicKeyResult parse_public_key_info(ByteSpan der);

    // Full SHA-256 over the subjectPublicKey bits (32 bytes, not the RFC 7093 160-bit truncation).
    std::vector<uint8_t> compute_subject_key_identifier(const PublicKeyInfo &key);

    // Base64 SHA-256 over the SubjectPublicKeyInfo DER.
    std::string public_key_fingerprint(const PublicKeyInfo &key);

} // namespace slotca::cert
