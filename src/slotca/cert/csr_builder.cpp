#include <slotca/cert/csr_builder.hpp>

#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

#include <slotca/cert/asn1_writer.hpp>
#include <slotca/cert/extensions.hpp>
#include <slotca/cert/oid_registry.hpp>
#include <slotca/hash/digest.hpp>
#include <slotca/sign/digest_formatter.hpp>

namespace slotca::cert {

    const char *request_template_name(RequestTemplate type) {
        switch (type) {
        case RequestTemplate::CodeSign:
            return "CodeSign";
        case RequestTemplate::DocSign:
            return "DocSign";
        }
        return "Unknown";
    }

    std::optional<RequestTemplate> request_template_from_name(std::string_view name) {
        std::string folded;
        for (const char c : name) {
            if (c != '-') {
                folded.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
        }
        if (folded == "code" || folded == "codesign") {
            return RequestTemplate::CodeSign;
        }
        if (folded == "doc" || folded == "docsign") {
            return RequestTemplate::DocSign;
        }
        return std::nullopt;
    }

    std::vector<RawExtension> template_extensions(RequestTemplate type) {
        const Oid purpose = type == RequestTemplate::CodeSign ? oid::make(oid::kEkuCodeSigning)
                                                              : oid::make(oid::kEkuDocumentSigning);
        return {
            make_extension(ExtensionId::KeyUsage, false, encode_key_usage(key_usage::DigitalSignature)),
            make_extension(ExtensionId::ExtendedKeyUsage, false, encode_extended_key_usage({purpose})),
        };
    }

    CsrBuilder &CsrBuilder::set_subject(const DistinguishedName &dn) {
        info_.subject = dn;
        subject_set_ = true;
        subject_error_.clear();
        return *this;
    }

    CsrBuilder &CsrBuilder::set_subject_from_string(std::string_view dn) {
        auto parsed = DistinguishedName::from_string(dn);
        if (!parsed.success) {
            subject_set_ = false;
            subject_error_ = parsed.error;
            return *this;
        }
        return set_subject(parsed.value);
    }

    CsrBuilder &CsrBuilder::set_subject_public_key(const PublicKeyInfo &key) {
        info_.public_key = key;
        key_set_ = true;
        return *this;
    }

    CsrBuilder &CsrBuilder::add_extension(const RawExtension &extension) {
        info_.requested_extensions.push_back(extension);
        return *this;
    }

    CsrBuilder &CsrBuilder::apply_template(RequestTemplate type) {
        for (auto &ext : template_extensions(type)) {
            info_.requested_extensions.push_back(std::move(ext));
        }
        return *this;
    }

    std::optional<std::string> CsrBuilder::validate_inputs() const {
        if (!subject_error_.empty()) {
            return "subject: " + subject_error_;
        }
        if (!subject_set_ || info_.subject.empty()) {
            return "subject not set";
        }
        if (!key_set_ || info_.public_key.empty() || info_.public_key.algorithm == KeyAlgorithm::Unknown) {
            return "subject public key not set";
        }
        return std::nullopt;
    }

    std::vector<uint8_t> CsrBuilder::encode_cri() const {
        std::vector<std::vector<uint8_t>> fields;
        fields.push_back(der::encode_integer(uint64_t{0}));
        fields.push_back(info_.subject.der());
        fields.push_back(info_.public_key.spki_der);
        std::vector<uint8_t> attributes;
        if (!info_.requested_extensions.empty()) {
            auto values = der::encode_set(encode_extension_list(info_.requested_extensions));
            auto request_oid = der::encode_oid(oid::make(oid::kExtensionRequest));
            attributes = der::encode_sequence(der::concat({request_oid, values}));
        }
        fields.push_back(der::encode_implicit(0, attributes, true));
        return der::encode_sequence(der::concat(fields));
    }

    IssuanceResult<CertificationRequest> CsrBuilder::build(const sign::SigningKeyHandle &handle,
                                                           const sign::SignatureScheme &scheme,
                                                           std::string_view digest_name, sign::Signer &signer) const {
        using Result = IssuanceResult<CertificationRequest>;
        if (auto err = validate_inputs()) {
            return Result::failure(ErrorCode::InvalidRequest, Stage::Draft, *err);
        }
        if (handle.algorithm != info_.public_key.algorithm || handle.key_size_bits != info_.public_key.key_size_bits) {
            return Result::failure(ErrorCode::InvalidConfiguration, Stage::Draft,
                                   "signing key in slot does not match the request public key");
        }
        auto digest = hash::algorithm_from_name(digest_name);
        if (!digest) {
            return Result::failure(ErrorCode::UnsupportedDigest, Stage::Draft,
                                   "unsupported digest algorithm '" + std::string(digest_name) + "'");
        }

        auto cri = encode_cri();
        auto formatted = sign::DigestFormatter::format(handle, scheme, *digest, cri);
        if (!formatted.success) {
            return Result::failure(formatted.code.value_or(ErrorCode::UnsupportedAlgorithm), Stage::Signed,
                                   formatted.error_message);
        }

        spdlog::info("[CsrBuilder] Requesting signature from slot {:#04x}", handle.slot);
        auto signed_bytes = signer.sign(handle, formatted.data);
        if (!signed_bytes.success) {
            return Result::failure(signed_bytes.code.value_or(ErrorCode::DeviceError), Stage::Signed,
                                   signed_bytes.error_message);
        }
        if (signed_bytes.signature.empty()) {
            return Result::failure(ErrorCode::DeviceError, Stage::Signed, "signer returned an empty signature");
        }

        CertificationRequest csr{};
        csr.info = info_;
        csr.cri_der = std::move(cri);
        csr.signature_algorithm = sign::encode_algorithm_identifier(scheme, *digest);
        csr.signature = std::move(signed_bytes.signature);
        csr.der = der::encode_sequence(
            der::concat({csr.cri_der, csr.signature_algorithm, der::encode_bit_string(csr.signature)}));

        spdlog::info("[CsrBuilder] Certification request for {} with {} extensions, {} bytes",
                     csr.info.subject.to_string(), csr.info.requested_extensions.size(), csr.der.size());
        return Result::ok(std::move(csr));
    }

} // namespace slotca::cert
