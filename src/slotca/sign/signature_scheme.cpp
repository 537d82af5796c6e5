#include <slotca/sign/signature_scheme.hpp>

#include <type_traits>

#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/oid_registry.hpp>

namespace slotca::sign {

    namespace {

        namespace der = cert::der;
        namespace oid = cert::oid;

        template <class> inline constexpr bool always_false = false;

        // AlgorithmIdentifier for a hash, with NULL parameters.
        std::vector<uint8_t> hash_algorithm_identifier(hash::Algorithm digest) {
            return der::encode_sequence(der::concat({der::encode_oid(cert::oid_for_hash(digest)), der::encode_null()}));
        }

        cert::Oid pkcs1_oid(hash::Algorithm digest) {
            switch (digest) {
            case hash::Algorithm::SHA384:
                return oid::make(oid::kSha384WithRsa);
            case hash::Algorithm::SHA512:
                return oid::make(oid::kSha512WithRsa);
            case hash::Algorithm::SHA256:
            default:
                return oid::make(oid::kSha256WithRsa);
            }
        }

        cert::Oid ecdsa_oid(hash::Algorithm digest) {
            switch (digest) {
            case hash::Algorithm::SHA384:
                return oid::make(oid::kEcdsaSha384);
            case hash::Algorithm::SHA512:
                return oid::make(oid::kEcdsaSha512);
            case hash::Algorithm::SHA256:
            default:
                return oid::make(oid::kEcdsaSha256);
            }
        }

        // RSASSA-PSS-params (RFC 4055). trailerField keeps its default.
        std::vector<uint8_t> pss_parameters(const RsaPss &scheme, hash::Algorithm digest) {
            auto hash_alg = hash_algorithm_identifier(digest);
            auto mgf = der::encode_sequence(der::concat({der::encode_oid(oid::make(oid::kMgf1)), hash_alg}));
            auto salt = der::encode_integer(static_cast<uint64_t>(pss_salt_length(scheme, digest)));
            return der::encode_sequence(
                der::concat({der::encode_explicit(0, hash_alg), der::encode_explicit(1, mgf),
                             der::encode_explicit(2, salt)}));
        }

    } // namespace

    const char *scheme_name(const SignatureScheme &scheme) {
        return std::visit(
            [](const auto &s) -> const char * {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, RsaPkcs1>) {
                    return "RSA-PKCS1";
                } else if constexpr (std::is_same_v<T, RsaPss>) {
                    return "RSA-PSS";
                } else if constexpr (std::is_same_v<T, Ecdsa>) {
                    return "ECDSA";
                } else {
                    static_assert(always_false<T>, "unhandled signature scheme");
                }
            },
            scheme);
    }

    cert::KeyAlgorithm scheme_key_algorithm(const SignatureScheme &scheme) {
        return std::holds_alternative<Ecdsa>(scheme) ? cert::KeyAlgorithm::Ecdsa : cert::KeyAlgorithm::Rsa;
    }

    std::optional<SignatureScheme> scheme_for(cert::KeyAlgorithm algorithm, RsaPadding padding,
                                              std::optional<size_t> pss_salt_length) {
        switch (algorithm) {
        case cert::KeyAlgorithm::Ecdsa:
            return SignatureScheme{Ecdsa{}};
        case cert::KeyAlgorithm::Rsa:
            if (padding == RsaPadding::Pkcs1) {
                return SignatureScheme{RsaPkcs1{}};
            }
            return SignatureScheme{RsaPss{pss_salt_length}};
        case cert::KeyAlgorithm::Unknown:
        default:
            return std::nullopt;
        }
    }

    size_t pss_salt_length(const RsaPss &scheme, hash::Algorithm digest) {
        return scheme.salt_length.value_or(hash::output_size(digest));
    }

    std::vector<uint8_t> encode_algorithm_identifier(const SignatureScheme &scheme, hash::Algorithm digest) {
        return std::visit(
            [digest](const auto &s) -> std::vector<uint8_t> {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, RsaPkcs1>) {
                    return der::encode_sequence(der::concat({der::encode_oid(pkcs1_oid(digest)), der::encode_null()}));
                } else if constexpr (std::is_same_v<T, RsaPss>) {
                    return der::encode_sequence(
                        der::concat({der::encode_oid(oid::make(oid::kRsaPss)), pss_parameters(s, digest)}));
                } else if constexpr (std::is_same_v<T, Ecdsa>) {
                    // RFC 5758: parameters absent
                    return der::encode_sequence(der::encode_oid(ecdsa_oid(digest)));
                } else {
                    static_assert(always_false<T>, "unhandled signature scheme");
                }
            },
            scheme);
    }

} // namespace slotca::sign
