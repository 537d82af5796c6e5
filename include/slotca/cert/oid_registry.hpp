#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <utility>

#include <slotca/cert/asn1_common.hpp>
#include <slotca/hash/digest.hpp>

namespace slotca::cert {

    /**
     * Object identifiers used while issuing certificates, with lookups from parsed OIDs
     * to the enums the rest of the core switches on.
     */

    namespace oid {

        template <size_t N> using Arcs = std::array<uint32_t, N>;

        // Public keys and curves
        inline constexpr Arcs<7> kRsaEncryption{1, 2, 840, 113549, 1, 1, 1};
        inline constexpr Arcs<6> kEcPublicKey{1, 2, 840, 10045, 2, 1};
        inline constexpr Arcs<7> kSecp256r1{1, 2, 840, 10045, 3, 1, 7};
        inline constexpr Arcs<5> kSecp384r1{1, 3, 132, 0, 34};
        inline constexpr Arcs<5> kSecp521r1{1, 3, 132, 0, 35};

        // Signature algorithms
        inline constexpr Arcs<7> kSha256WithRsa{1, 2, 840, 113549, 1, 1, 11};
        inline constexpr Arcs<7> kSha384WithRsa{1, 2, 840, 113549, 1, 1, 12};
        inline constexpr Arcs<7> kSha512WithRsa{1, 2, 840, 113549, 1, 1, 13};
        inline constexpr Arcs<7> kRsaPss{1, 2, 840, 113549, 1, 1, 10};
        inline constexpr Arcs<7> kMgf1{1, 2, 840, 113549, 1, 1, 8};
        inline constexpr Arcs<7> kEcdsaSha256{1, 2, 840, 10045, 4, 3, 2};
        inline constexpr Arcs<7> kEcdsaSha384{1, 2, 840, 10045, 4, 3, 3};
        inline constexpr Arcs<7> kEcdsaSha512{1, 2, 840, 10045, 4, 3, 4};

        // Digests
        inline constexpr Arcs<9> kSha256{2, 16, 840, 1, 101, 3, 4, 2, 1};
        inline constexpr Arcs<9> kSha384{2, 16, 840, 1, 101, 3, 4, 2, 2};
        inline constexpr Arcs<9> kSha512{2, 16, 840, 1, 101, 3, 4, 2, 3};

        // Certificate extensions
        inline constexpr Arcs<4> kBasicConstraints{2, 5, 29, 19};
        inline constexpr Arcs<4> kKeyUsage{2, 5, 29, 15};
        inline constexpr Arcs<4> kExtendedKeyUsage{2, 5, 29, 37};
        inline constexpr Arcs<4> kSubjectAltName{2, 5, 29, 17};
        inline constexpr Arcs<4> kAuthorityKeyId{2, 5, 29, 35};
        inline constexpr Arcs<4> kSubjectKeyId{2, 5, 29, 14};
        inline constexpr Arcs<4> kCertificatePolicies{2, 5, 29, 32};
        inline constexpr Arcs<4> kCrlDistributionPoints{2, 5, 29, 31};
        inline constexpr Arcs<9> kAuthorityInfoAccess{1, 3, 6, 1, 5, 5, 7, 1, 1};

        // Access methods, PKCS#9 attributes
        inline constexpr Arcs<9> kCaIssuers{1, 3, 6, 1, 5, 5, 7, 48, 2};
        inline constexpr Arcs<7> kExtensionRequest{1, 2, 840, 113549, 1, 9, 14};

        // Extended key usages
        inline constexpr Arcs<9> kEkuServerAuth{1, 3, 6, 1, 5, 5, 7, 3, 1};
        inline constexpr Arcs<9> kEkuClientAuth{1, 3, 6, 1, 5, 5, 7, 3, 2};
        inline constexpr Arcs<9> kEkuCodeSigning{1, 3, 6, 1, 5, 5, 7, 3, 3};
        inline constexpr Arcs<9> kEkuEmailProtection{1, 3, 6, 1, 5, 5, 7, 3, 4};
        inline constexpr Arcs<10> kEkuDocumentSigning{1, 3, 6, 1, 4, 1, 311, 10, 3, 12};

        template <size_t N> inline Oid make(const Arcs<N> &arcs) {
            return Oid{std::vector<uint32_t>(arcs.begin(), arcs.end())};
        }

        inline bool matches(const Oid &value, std::span<const uint32_t> arcs) {
            return value.nodes.size() == arcs.size() && std::equal(arcs.begin(), arcs.end(), value.nodes.begin());
        }

        template <typename Enum, size_t N>
        inline std::optional<Enum> lookup(const Oid &value,
                                          const std::array<std::pair<Enum, std::span<const uint32_t>>, N> &table) {
            for (const auto &[id, arcs] : table) {
                if (matches(value, arcs)) {
                    return id;
                }
            }
            return std::nullopt;
        }

        template <typename Enum, size_t N>
        inline std::optional<Oid> reverse(Enum id,
                                          const std::array<std::pair<Enum, std::span<const uint32_t>>, N> &table) {
            for (const auto &[entry, arcs] : table) {
                if (entry == id) {
                    return Oid{std::vector<uint32_t>(arcs.begin(), arcs.end())};
                }
            }
            return std::nullopt;
        }

        inline const std::array<std::pair<ExtensionId, std::span<const uint32_t>>, 9> kExtensionTable = {
            std::pair{ExtensionId::BasicConstraints, std::span<const uint32_t>(kBasicConstraints)},
            std::pair{ExtensionId::KeyUsage, std::span<const uint32_t>(kKeyUsage)},
            std::pair{ExtensionId::ExtendedKeyUsage, std::span<const uint32_t>(kExtendedKeyUsage)},
            std::pair{ExtensionId::SubjectAltName, std::span<const uint32_t>(kSubjectAltName)},
            std::pair{ExtensionId::AuthorityKeyIdentifier, std::span<const uint32_t>(kAuthorityKeyId)},
            std::pair{ExtensionId::SubjectKeyIdentifier, std::span<const uint32_t>(kSubjectKeyId)},
            std::pair{ExtensionId::CertificatePolicies, std::span<const uint32_t>(kCertificatePolicies)},
            std::pair{ExtensionId::CRLDistributionPoints, std::span<const uint32_t>(kCrlDistributionPoints)},
            std::pair{ExtensionId::AuthorityInfoAccess, std::span<const uint32_t>(kAuthorityInfoAccess)},
        };

        inline const std::array<std::pair<CurveId, std::span<const uint32_t>>, 3> kCurveTable = {
            std::pair{CurveId::Secp256r1, std::span<const uint32_t>(kSecp256r1)},
            std::pair{CurveId::Secp384r1, std::span<const uint32_t>(kSecp384r1)},
            std::pair{CurveId::Secp521r1, std::span<const uint32_t>(kSecp521r1)},
        };

        inline const std::array<std::pair<hash::Algorithm, std::span<const uint32_t>>, 3> kDigestTable = {
            std::pair{hash::Algorithm::SHA256, std::span<const uint32_t>(kSha256)},
            std::pair{hash::Algorithm::SHA384, std::span<const uint32_t>(kSha384)},
            std::pair{hash::Algorithm::SHA512, std::span<const uint32_t>(kSha512)},
        };

    } // namespace oid

    inline ExtensionId find_extension_by_oid(const Oid &value) {
        return oid::lookup(value, oid::kExtensionTable).value_or(ExtensionId::Unknown);
    }

    inline CurveId find_curve_by_oid(const Oid &value) {
        return oid::lookup(value, oid::kCurveTable).value_or(CurveId::Unknown);
    }

    inline std::optional<hash::Algorithm> find_hash_by_oid(const Oid &value) {
        return oid::lookup(value, oid::kDigestTable);
    }

    inline std::optional<Oid> oid_for_extension(ExtensionId id) { return oid::reverse(id, oid::kExtensionTable); }

    inline Oid oid_for_hash(hash::Algorithm algorithm) {
        // The digest table covers every Algorithm enumerator.
        return *oid::reverse(algorithm, oid::kDigestTable);
    }

    // Field size in bits for the supported NIST curves.
    inline size_t curve_bits(CurveId id) {
        switch (id) {
        case CurveId::Secp256r1:
            return 256;
        case CurveId::Secp384r1:
            return 384;
        case CurveId::Secp521r1:
            return 521;
        case CurveId::Unknown:
        default:
            return 0;
        }
    }

} // namespace slotca::cert
