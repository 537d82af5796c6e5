#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace slotca::cert {

    using ByteSpan = std::span<const uint8_t>;

    enum class ASN1Class : uint8_t { Universal = 0x00, Application = 0x40, ContextSpecific = 0x80, Private = 0xC0 };

    enum class ASN1Tag : uint8_t {
        Boolean = 0x01,
        Integer = 0x02,
        BitString = 0x03,
        OctetString = 0x04,
        Null = 0x05,
        ObjectIdentifier = 0x06,
        UTF8String = 0x0C,
        Sequence = 0x10,
        Set = 0x11,
        PrintableString = 0x13,
        T61String = 0x14,
        IA5String = 0x16,
        UTCTime = 0x17,
        GeneralizedTime = 0x18,
        BMPString = 0x1E
    };

    struct ASN1Identifier {
        ASN1Class tag_class{};
        bool constructed{};
        uint32_t tag_number{};
    };

    struct Oid {
        std::vector<uint32_t> nodes;

        [[nodiscard]] std::string to_string() const {
            std::string out;
            for (size_t i = 0; i < nodes.size(); ++i) {
                if (i != 0) {
                    out.push_back('.');
                }
                out += std::to_string(nodes[i]);
            }
            return out;
        }

        bool operator==(const Oid &other) const noexcept { return nodes == other.nodes; }
    };

    enum class CurveId { Unknown = 0, Secp256r1, Secp384r1, Secp521r1 };

    enum class ExtensionId {
        Unknown = 0,
        BasicConstraints,
        KeyUsage,
        ExtendedKeyUsage,
        SubjectAltName,
        AuthorityKeyIdentifier,
        SubjectKeyIdentifier,
        CertificatePolicies,
        CRLDistributionPoints,
        AuthorityInfoAccess
    };

    // One entry of an X.509 Extensions SEQUENCE, value still DER-encoded.
    struct RawExtension {
        Oid oid{};
        ExtensionId id{ExtensionId::Unknown};
        bool critical{};
        std::vector<uint8_t> value;
    };

} // namespace slotca::cert
