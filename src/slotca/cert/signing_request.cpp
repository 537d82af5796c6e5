#include <slotca/cert/signing_request.hpp>

#include <iterator>

#include <slotca/cert/asn1_reader.hpp>
#include <slotca/cert/extensions.hpp>
#include <slotca/cert/oid_registry.hpp>

namespace slotca::cert {

    namespace {

        // attributes [0] IMPLICIT SET OF Attribute
        ASN1Result<std::vector<RawExtension>> parse_attributes(ByteSpan content) {
            std::vector<RawExtension> extensions;
            DerCursor cursor(content);
            while (!cursor.empty()) {
                auto attribute = parse_sequence(cursor.remaining());
                if (!attribute.success) {
                    return ASN1Result<std::vector<RawExtension>>::failure("Attribute: " + attribute.error);
                }
                cursor.advance(attribute.bytes_consumed);

                DerCursor attr_cursor(attribute.value);
                auto type = parse_oid(attr_cursor.remaining());
                if (!type.success) {
                    return ASN1Result<std::vector<RawExtension>>::failure("attribute type: " + type.error);
                }
                attr_cursor.advance(type.bytes_consumed);
                if (!oid::matches(type.value, oid::kExtensionRequest)) {
                    continue;
                }

                auto values = parse_set(attr_cursor.remaining());
                if (!values.success) {
                    return ASN1Result<std::vector<RawExtension>>::failure("extensionRequest values: " + values.error);
                }
                DerCursor value_cursor(values.value);
                while (!value_cursor.empty()) {
                    auto list = parse_extension_list(value_cursor.remaining());
                    if (!list.success) {
                        return ASN1Result<std::vector<RawExtension>>::failure(list.error);
                    }
                    value_cursor.advance(list.bytes_consumed);
                    extensions.insert(extensions.end(), std::make_move_iterator(list.value.begin()),
                                      std::make_move_iterator(list.value.end()));
                }
            }
            return ASN1Result<std::vector<RawExtension>>::ok(std::move(extensions), content.size());
        }

    } // namespace

    SigningRequestResult parse_signing_request(ByteSpan der) {
        if (der.empty()) {
            return SigningRequestResult::failure("empty CSR buffer");
        }
        auto request = parse_sequence(der);
        if (!request.success) {
            return SigningRequestResult::failure("CertificationRequest: " + request.error);
        }
        DerCursor cursor(request.value);

        auto info = parse_sequence(cursor.remaining());
        if (!info.success) {
            return SigningRequestResult::failure("CertificationRequestInfo: " + info.error);
        }
        DerCursor info_cursor(info.value);

        auto version = parse_integer(info_cursor.remaining());
        if (!version.success) {
            return SigningRequestResult::failure("version: " + version.error);
        }
        if (version.value.size() != 1 || version.value[0] != 0) {
            return SigningRequestResult::failure("unsupported CSR version");
        }
        info_cursor.advance(version.bytes_consumed);

        SigningRequest result{};
        auto subject = DistinguishedName::from_der(info_cursor.remaining());
        if (!subject.success) {
            return SigningRequestResult::failure("subject: " + subject.error);
        }
        info_cursor.advance(subject.value.der().size());
        result.subject = std::move(subject.value);

        auto key = parse_public_key_info(info_cursor.remaining());
        if (!key.success) {
            return SigningRequestResult::failure(key.error);
        }
        info_cursor.advance(key.bytes_consumed);
        result.public_key = std::move(key.value);

        if (!info_cursor.empty()) {
            auto attributes = parse_context_tagged(info_cursor.remaining());
            if (!attributes.success || attributes.value.tag != 0 || !attributes.value.constructed) {
                return SigningRequestResult::failure("expected [0] attributes");
            }
            auto extensions = parse_attributes(attributes.value.content);
            if (!extensions.success) {
                return SigningRequestResult::failure(extensions.error);
            }
            result.requested_extensions = std::move(extensions.value);
            info_cursor.advance(attributes.bytes_consumed);
        }
        if (!info_cursor.empty()) {
            return SigningRequestResult::failure("extra data in CertificationRequestInfo");
        }

        return SigningRequestResult::ok(std::move(result));
    }

} // namespace slotca::cert
