#include <slotca/cert/extensions.hpp>

#include <array>
#include <utility>

#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/oid_registry.hpp>

namespace slotca::cert {

    namespace {

        constexpr std::array<std::pair<uint16_t, const char *>, 9> kUsageNames{{
            {key_usage::DigitalSignature, "DigitalSignature"},
            {key_usage::NonRepudiation, "NonRepudiation"},
            {key_usage::KeyEncipherment, "KeyEncipherment"},
            {key_usage::DataEncipherment, "DataEncipherment"},
            {key_usage::KeyAgreement, "KeyAgreement"},
            {key_usage::KeyCertSign, "KeyCertSign"},
            {key_usage::CRLSign, "CRLSign"},
            {key_usage::EncipherOnly, "EncipherOnly"},
            {key_usage::DecipherOnly, "DecipherOnly"},
        }};

        std::vector<uint8_t> encode_extension(const RawExtension &extension) {
            std::vector<std::vector<uint8_t>> fields;
            fields.push_back(der::encode_oid(extension.oid));
            if (extension.critical) {
                fields.push_back(der::encode_boolean(true));
            }
            fields.push_back(der::encode_octet_string(extension.value));
            return der::encode_sequence(der::concat(fields));
        }

        ASN1Result<RawExtension> parse_extension(ByteSpan input) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<RawExtension>::failure("Extension: " + seq.error);
            }
            DerCursor cursor(seq.value);

            auto ext_oid = parse_oid(cursor.remaining());
            if (!ext_oid.success) {
                return ASN1Result<RawExtension>::failure("extnID: " + ext_oid.error);
            }
            cursor.advance(ext_oid.bytes_consumed);

            bool critical = false;
            auto next = parse_id_len(cursor.remaining());
            if (next.success && next.value.identifier.tag_class == ASN1Class::Universal &&
                next.value.identifier.tag_number == static_cast<uint32_t>(ASN1Tag::Boolean)) {
                auto flag = parse_boolean(cursor.remaining());
                if (!flag.success) {
                    return ASN1Result<RawExtension>::failure("critical: " + flag.error);
                }
                critical = flag.value;
                cursor.advance(flag.bytes_consumed);
            }

            auto value = parse_octet_string(cursor.remaining());
            if (!value.success) {
                return ASN1Result<RawExtension>::failure("extnValue: " + value.error);
            }
            cursor.advance(value.bytes_consumed);
            if (!cursor.empty()) {
                return ASN1Result<RawExtension>::failure("extra data inside extension");
            }

            RawExtension ext{};
            ext.id = find_extension_by_oid(ext_oid.value);
            ext.oid = std::move(ext_oid.value);
            ext.critical = critical;
            ext.value.assign(value.value.begin(), value.value.end());
            return ASN1Result<RawExtension>::ok(std::move(ext), seq.bytes_consumed);
        }

    } // namespace

    std::string key_usage::describe(uint16_t bits) {
        std::string out;
        for (const auto &[flag, name] : kUsageNames) {
            if ((bits & flag) == 0) {
                continue;
            }
            if (!out.empty()) {
                out += ", ";
            }
            out += name;
        }
        return out.empty() ? "None" : out;
    }

    RawExtension make_extension(ExtensionId id, bool critical, std::vector<uint8_t> value) {
        RawExtension ext{};
        ext.id = id;
        ext.oid = oid_for_extension(id).value_or(Oid{});
        ext.critical = critical;
        ext.value = std::move(value);
        return ext;
    }

    std::vector<uint8_t> encode_key_usage(uint16_t bits) {
        std::vector<uint8_t> buffer = {static_cast<uint8_t>(bits >> 8U), static_cast<uint8_t>(bits & 0xFFU)};
        while (!buffer.empty() && buffer.back() == 0) {
            buffer.pop_back();
        }
        uint8_t unused = 0;
        if (!buffer.empty()) {
            for (uint8_t last = buffer.back(); (last & 0x01U) == 0; last >>= 1U) {
                ++unused;
            }
        }
        return der::encode_bit_string(buffer, unused);
    }

    std::optional<uint16_t> decode_key_usage(ByteSpan value) {
        auto bits = parse_bit_string(value);
        if (!bits.success || bits.bytes_consumed != value.size() || bits.value.bytes.size() > 2) {
            return std::nullopt;
        }
        uint16_t result = 0;
        if (!bits.value.bytes.empty()) {
            result = static_cast<uint16_t>(bits.value.bytes[0] << 8U);
        }
        if (bits.value.bytes.size() == 2) {
            result |= bits.value.bytes[1];
        }
        if (!bits.value.bytes.empty()) {
            const size_t shift = (2 - bits.value.bytes.size()) * 8 + bits.value.unused_bits;
            result = static_cast<uint16_t>(result & (0xFFFFU << shift));
        }
        return result;
    }

    std::vector<uint8_t> encode_extended_key_usage(const std::vector<Oid> &purposes) {
        std::vector<std::vector<uint8_t>> encoded;
        encoded.reserve(purposes.size());
        for (const auto &purpose : purposes) {
            encoded.push_back(der::encode_oid(purpose));
        }
        return der::encode_sequence(der::concat(encoded));
    }

    std::optional<std::vector<Oid>> decode_extended_key_usage(ByteSpan value) {
        auto seq = parse_sequence(value);
        if (!seq.success) {
            return std::nullopt;
        }
        std::vector<Oid> purposes;
        DerCursor cursor(seq.value);
        while (!cursor.empty()) {
            auto purpose = parse_oid(cursor.remaining());
            if (!purpose.success) {
                return std::nullopt;
            }
            purposes.push_back(std::move(purpose.value));
            cursor.advance(purpose.bytes_consumed);
        }
        return purposes;
    }

    std::vector<uint8_t> encode_basic_constraints(bool is_ca, std::optional<uint32_t> path_length) {
        std::vector<std::vector<uint8_t>> fields;
        if (is_ca) {
            fields.push_back(der::encode_boolean(true));
        }
        if (path_length) {
            fields.push_back(der::encode_integer(static_cast<uint64_t>(*path_length)));
        }
        return der::encode_sequence(der::concat(fields));
    }

    std::vector<uint8_t> encode_key_identifier(const std::vector<uint8_t> &key_id) {
        return der::encode_octet_string(key_id);
    }

    std::optional<std::vector<uint8_t>> decode_key_identifier(ByteSpan value) {
        auto key_id = parse_octet_string(value);
        if (!key_id.success || key_id.value.empty()) {
            return std::nullopt;
        }
        return std::vector<uint8_t>(key_id.value.begin(), key_id.value.end());
    }

    std::vector<uint8_t> encode_extension_list(const std::vector<RawExtension> &extensions) {
        std::vector<std::vector<uint8_t>> encoded;
        encoded.reserve(extensions.size());
        for (const auto &ext : extensions) {
            encoded.push_back(encode_extension(ext));
        }
        return der::encode_sequence(der::concat(encoded));
    }

    ASN1Result<std::vector<RawExtension>> parse_extension_list(ByteSpan input) {
        auto seq = parse_sequence(input);
        if (!seq.success) {
            return ASN1Result<std::vector<RawExtension>>::failure("Extensions: " + seq.error);
        }
        std::vector<RawExtension> extensions;
        DerCursor cursor(seq.value);
        while (!cursor.empty()) {
            auto ext = parse_extension(cursor.remaining());
            if (!ext.success) {
                return ASN1Result<std::vector<RawExtension>>::failure(ext.error);
            }
            cursor.advance(ext.bytes_consumed);
            extensions.push_back(std::move(ext.value));
        }
        return ASN1Result<std::vector<RawExtension>>::ok(std::move(extensions), seq.bytes_consumed);
    }

    const RawExtension *find_extension(const std::vector<RawExtension> &extensions, ExtensionId id) {
        for (const auto &ext : extensions) {
            if (ext.id == id) {
                return &ext;
            }
        }
        return nullptr;
    }

} // namespace slotca::cert
