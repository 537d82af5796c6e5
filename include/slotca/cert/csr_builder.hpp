#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <slotca/cert/distinguished_name.hpp>
#include <slotca/cert/public_key.hpp>
#include <slotca/cert/signing_request.hpp>
#include <slotca/issuance_error.hpp>
#include <slotca/sign/signature_scheme.hpp>
#include <slotca/sign/signer.hpp>

namespace slotca::cert {

    enum class RequestTemplate { CodeSign, DocSign };

    const char *request_template_name(RequestTemplate type);

    // "code", "codesign", "doc" or "docsign", case and hyphens ignored.
    std::optional<RequestTemplate> request_template_from_name(std::string_view name);

    // KeyUsage DigitalSignature and the template's purpose as EKU, both non-critical.
    std::vector<RawExtension> template_extensions(RequestTemplate type);

    struct CertificationRequest {
        SigningRequest info;
        std::vector<uint8_t> cri_der;
        std::vector<uint8_t> signature_algorithm;
        std::vector<uint8_t> signature;
        std::vector<uint8_t> der;
    };

    /**
     * Builds a PKCS#10 request whose proof-of-possession signature comes from the device.
     * The CertificationRequestInfo always carries the attributes field; extensions added
     * here go into a single extensionRequest attribute, in insertion order.
     *
     * build() reports bad inputs at Stage::Draft and formatter or device failures at
     * Stage::Signed.
     */
    class CsrBuilder {
      public:
        CsrBuilder &set_subject(const DistinguishedName &dn);
        CsrBuilder &set_subject_from_string(std::string_view dn);
        CsrBuilder &set_subject_public_key(const PublicKeyInfo &key);
        CsrBuilder &add_extension(const RawExtension &extension);
        CsrBuilder &apply_template(RequestTemplate type);

        IssuanceResult<CertificationRequest> build(const sign::SigningKeyHandle &handle,
                                                   const sign::SignatureScheme &scheme, std::string_view digest_name,
                                                   sign::Signer &signer) const;

      private:
        std::optional<std::string> validate_inputs() const;
        std::vector<uint8_t> encode_cri() const;

        SigningRequest info_{};
        bool subject_set_{false};
        bool key_set_{false};
        std::string subject_error_;
    };

} // namespace slotca::cert
