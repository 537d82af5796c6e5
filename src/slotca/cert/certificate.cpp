#include <slotca/cert/certificate.hpp>

#include <algorithm>

#include <slotca/cert/asn1_reader.hpp>
#include <slotca/cert/extensions.hpp>
#include <slotca/hash/digest.hpp>
#include <slotca/utils/sodium_utils.hpp>

namespace slotca::cert {

    namespace {

        std::vector<uint8_t> copy_bytes(ByteSpan span) { return std::vector<uint8_t>(span.begin(), span.end()); }

        ASN1Result<Validity> parse_validity(ByteSpan input) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<Validity>::failure("Validity: " + seq.error);
            }
            DerCursor cursor(seq.value);
            auto not_before = parse_time(cursor.remaining());
            if (!not_before.success) {
                return ASN1Result<Validity>::failure("notBefore: " + not_before.error);
            }
            cursor.advance(not_before.bytes_consumed);
            auto not_after = parse_time(cursor.remaining());
            if (!not_after.success) {
                return ASN1Result<Validity>::failure("notAfter: " + not_after.error);
            }
            cursor.advance(not_after.bytes_consumed);
            if (!cursor.empty()) {
                return ASN1Result<Validity>::failure("extra data in Validity");
            }
            return ASN1Result<Validity>::ok(Validity{not_before.value, not_after.value}, seq.bytes_consumed);
        }

        // Element length including its header, without interpreting the content.
        ASN1Result<ByteSpan> take_element(ByteSpan input) {
            auto header = parse_id_len(input);
            if (!header.success) {
                return ASN1Result<ByteSpan>::failure(header.error);
            }
            return ASN1Result<ByteSpan>::ok(input.first(header.bytes_consumed), header.bytes_consumed);
        }

        ASN1Result<TbsCertificate> parse_tbs(ByteSpan input) {
            auto seq = parse_sequence(input);
            if (!seq.success) {
                return ASN1Result<TbsCertificate>::failure("TBSCertificate: " + seq.error);
            }
            DerCursor cursor(seq.value);
            TbsCertificate tbs{};
            tbs.version = 1;

            auto version = parse_context_tagged(cursor.remaining());
            if (version.success && version.value.tag == 0) {
                auto number = parse_integer(version.value.content);
                if (!number.success || number.value.size() != 1 || number.value[0] > 2) {
                    return ASN1Result<TbsCertificate>::failure("invalid certificate version");
                }
                tbs.version = number.value[0] + 1;
                cursor.advance(version.bytes_consumed);
            }

            auto serial = parse_integer(cursor.remaining());
            if (!serial.success) {
                return ASN1Result<TbsCertificate>::failure("serialNumber: " + serial.error);
            }
            tbs.serial_number = copy_bytes(serial.value);
            cursor.advance(serial.bytes_consumed);

            auto signature = parse_sequence(cursor.remaining());
            if (!signature.success) {
                return ASN1Result<TbsCertificate>::failure("signature: " + signature.error);
            }
            cursor.advance(signature.bytes_consumed);

            auto issuer = DistinguishedName::from_der(cursor.remaining());
            if (!issuer.success) {
                return ASN1Result<TbsCertificate>::failure("issuer: " + issuer.error);
            }
            cursor.advance(issuer.value.der().size());
            tbs.issuer = std::move(issuer.value);

            auto validity = parse_validity(cursor.remaining());
            if (!validity.success) {
                return ASN1Result<TbsCertificate>::failure(validity.error);
            }
            tbs.validity = validity.value;
            cursor.advance(validity.bytes_consumed);

            auto subject = DistinguishedName::from_der(cursor.remaining());
            if (!subject.success) {
                return ASN1Result<TbsCertificate>::failure("subject: " + subject.error);
            }
            cursor.advance(subject.value.der().size());
            tbs.subject = std::move(subject.value);

            auto key = parse_public_key_info(cursor.remaining());
            if (!key.success) {
                return ASN1Result<TbsCertificate>::failure(key.error);
            }
            tbs.public_key = std::move(key.value);
            cursor.advance(key.bytes_consumed);

            // issuerUniqueID [1], subjectUniqueID [2], extensions [3]
            while (!cursor.empty()) {
                auto tagged = parse_context_tagged(cursor.remaining());
                if (!tagged.success) {
                    return ASN1Result<TbsCertificate>::failure("unexpected field in TBSCertificate");
                }
                if (tagged.value.tag == 3) {
                    auto extensions = parse_extension_list(tagged.value.content);
                    if (!extensions.success) {
                        return ASN1Result<TbsCertificate>::failure(extensions.error);
                    }
                    tbs.extensions = std::move(extensions.value);
                }
                cursor.advance(tagged.bytes_consumed);
            }

            return ASN1Result<TbsCertificate>::ok(std::move(tbs), seq.bytes_consumed);
        }

    } // namespace

    Certificate::Certificate(TbsCertificate tbs, std::vector<uint8_t> signature_algorithm,
                             std::vector<uint8_t> signature, std::vector<uint8_t> der, std::vector<uint8_t> tbs_der)
        : tbs_(std::move(tbs)), signature_algorithm_(std::move(signature_algorithm)), signature_(std::move(signature)),
          der_(std::move(der)), tbs_der_(std::move(tbs_der)) {}

    Certificate::Result Certificate::parse(ByteSpan der) {
        if (der.empty()) {
            return Result::failure("empty certificate buffer");
        }
        auto top = parse_sequence(der);
        if (!top.success) {
            return Result::failure("Certificate: " + top.error);
        }
        if (top.bytes_consumed != der.size()) {
            return Result::failure("extra data after certificate");
        }

        DerCursor cursor(top.value);
        auto tbs_raw = take_element(cursor.remaining());
        if (!tbs_raw.success) {
            return Result::failure(tbs_raw.error);
        }
        auto tbs = parse_tbs(tbs_raw.value);
        if (!tbs.success) {
            return Result::failure(tbs.error);
        }
        cursor.advance(tbs_raw.bytes_consumed);

        auto sig_alg = take_element(cursor.remaining());
        if (!sig_alg.success) {
            return Result::failure("signatureAlgorithm: " + sig_alg.error);
        }
        cursor.advance(sig_alg.bytes_consumed);

        auto sig_bits = parse_bit_string(cursor.remaining());
        if (!sig_bits.success) {
            return Result::failure("signatureValue: " + sig_bits.error);
        }
        cursor.advance(sig_bits.bytes_consumed);
        if (!cursor.empty()) {
            return Result::failure("extra data in Certificate");
        }

        return Result::ok(Certificate(std::move(tbs.value), copy_bytes(sig_alg.value), copy_bytes(sig_bits.value.bytes),
                                      copy_bytes(der), copy_bytes(tbs_raw.value)));
    }

    const RawExtension *Certificate::find_extension(ExtensionId id) const {
        return cert::find_extension(tbs_.extensions, id);
    }

    size_t Certificate::count_extensions(ExtensionId id) const {
        return static_cast<size_t>(std::count_if(tbs_.extensions.begin(), tbs_.extensions.end(),
                                                 [id](const RawExtension &ext) { return ext.id == id; }));
    }

    std::vector<uint8_t> Certificate::fingerprint() const { return hash::digest(hash::Algorithm::SHA256, der_).data; }

    std::string Certificate::fingerprint_hex() const { return utils::to_hex(fingerprint()); }

} // namespace slotca::cert
