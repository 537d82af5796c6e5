#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <slotca/cert/asn1_reader.hpp>

namespace slotca::cert {

    // KeyUsage bits, most significant bit = digitalSignature (bit 0 of the BIT STRING).
    namespace key_usage {
        inline constexpr uint16_t DigitalSignature = 0x8000;
        inline constexpr uint16_t NonRepudiation = 0x4000;
        inline constexpr uint16_t KeyEncipherment = 0x2000;
        inline constexpr uint16_t DataEncipherment = 0x1000;
        inline constexpr uint16_t KeyAgreement = 0x0800;
        inline constexpr uint16_t KeyCertSign = 0x0400;
        inline constexpr uint16_t CRLSign = 0x0200;
        inline constexpr uint16_t EncipherOnly = 0x0100;
        inline constexpr uint16_t DecipherOnly = 0x0080;

        // "DigitalSignature, KeyEncipherment" style rendering for logs.
        std::string describe(uint16_t bits);
    } // namespace key_usage

    RawExtension make_extension(ExtensionId id, bool critical, std::vector<uint8_t> value);

    std::vector<uint8_t> encode_key_usage(uint16_t bits);
    std::optional<uint16_t> decode_key_usage(ByteSpan value);

    std::vector<uint8_t> encode_extended_key_usage(const std::vector<Oid> &purposes);
    std::optional<std::vector<Oid>> decode_extended_key_usage(ByteSpan value);

    std::vector<uint8_t> encode_basic_constraints(bool is_ca, std::optional<uint32_t> path_length);
    std::vector<uint8_t> encode_key_identifier(const std::vector<uint8_t> &key_id);
    std::optional<std::vector<uint8_t>> decode_key_identifier(ByteSpan value);

    // Extensions ::= SEQUENCE SIZE (1..MAX) OF Extension
    std::vector<uint8_t> encode_extension_list(const std::vector<RawExtension> &extensions);
    ASN1Result<std::vector<RawExtension>> parse_extension_list(ByteSpan input);

    const RawExtension *find_extension(const std::vector<RawExtension> &extensions, ExtensionId id);

} // namespace slotca::cert
