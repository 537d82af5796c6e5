#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <slotca/cert/public_key.hpp>
#include <slotca/hash/digest.hpp>

namespace slotca::sign {

    // RSASSA-PKCS1-v1_5
    struct RsaPkcs1 {};

    // RSASSA-PSS with MGF1 over the signature hash. Salt length defaults to the digest length.
    struct RsaPss {
        std::optional<size_t> salt_length;
    };

    // Fixed-width digest handed to a raw ECDSA operation.
    struct Ecdsa {};

    using SignatureScheme = std::variant<RsaPkcs1, RsaPss, Ecdsa>;

    enum class RsaPadding { Pkcs1, Pss };

    const char *scheme_name(const SignatureScheme &scheme);

    // Key type a scheme can be used with.
    cert::KeyAlgorithm scheme_key_algorithm(const SignatureScheme &scheme);

    // Scheme for a key type; RSA keys pick their padding, ECDSA keys ignore it.
    std::optional<SignatureScheme> scheme_for(cert::KeyAlgorithm algorithm, RsaPadding padding,
                                              std::optional<size_t> pss_salt_length = std::nullopt);

    size_t pss_salt_length(const RsaPss &scheme, hash::Algorithm digest);

    // signatureAlgorithm / TBSCertificate.signature value for the scheme and digest.
    std::vector<uint8_t> encode_algorithm_identifier(const SignatureScheme &scheme, hash::Algorithm digest);

} // namespace slotca::sign
