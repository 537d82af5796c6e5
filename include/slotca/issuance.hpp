#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <slotca/cert/authority_linkage.hpp>
#include <slotca/cert/certificate.hpp>
#include <slotca/cert/csr_builder.hpp>
#include <slotca/cert/extension_policy.hpp>
#include <slotca/cert/issuer_context.hpp>
#include <slotca/cert/signing_request.hpp>
#include <slotca/issuance_error.hpp>
#include <slotca/sign/signature_scheme.hpp>
#include <slotca/sign/signer.hpp>

namespace slotca {

    inline constexpr uint32_t kDefaultLeafValidityDays = 30;
    inline constexpr uint32_t kDefaultCaValidityDays = 365;

    // Settings for signing a CSR with the CA key.
    struct IssuanceConfig {
        cert::ExtensionPolicy policy = cert::ExtensionPolicy::defaults();
        cert::LinkageConfig linkage{};
        uint32_t validity_days{kDefaultLeafValidityDays};
        std::string digest{"SHA256"};
        sign::RsaPadding rsa_padding{sign::RsaPadding::Pss};
        std::optional<size_t> pss_salt_length;

        [[nodiscard]] std::optional<IssuanceError> validate() const;
    };

    // Settings for a self-signed CA certificate.
    struct CaConfig {
        uint32_t validity_days{kDefaultCaValidityDays};
        std::string digest{"SHA256"};
        sign::RsaPadding rsa_padding{sign::RsaPadding::Pss};
        std::optional<size_t> pss_salt_length;
        std::optional<uint32_t> path_length;

        [[nodiscard]] std::optional<IssuanceError> validate() const;
    };

    /**
     * Signs a CSR with the CA key in handle.slot. The CSR's extensions pass through the
     * configured policy; AKI, AIA and CRLDP come from the issuer and the configuration.
     * The handle must name the issuer's key.
     */
    IssuanceResult<cert::Certificate> issue_certificate(const cert::SigningRequest &request,
                                                        const cert::IssuerContext &issuer,
                                                        const IssuanceConfig &config,
                                                        const sign::SigningKeyHandle &handle, sign::Signer &signer);

    // Same, from a DER CSR and the DER CA certificate.
    IssuanceResult<cert::Certificate> issue_certificate(cert::ByteSpan csr_der, cert::ByteSpan issuer_der,
                                                        const IssuanceConfig &config,
                                                        const sign::SigningKeyHandle &handle, sign::Signer &signer);

    /**
     * Self-signed CA certificate for the key in handle.slot:
     * KeyUsage KeyCertSign | CRLSign | DigitalSignature (critical), BasicConstraints CA
     * (critical), a SHA-256 SKI and an AKI carrying the same identifier.
     */
    IssuanceResult<cert::Certificate> create_self_signed_ca(const cert::DistinguishedName &subject,
                                                            const cert::PublicKeyInfo &public_key,
                                                            const CaConfig &config,
                                                            const sign::SigningKeyHandle &handle,
                                                            sign::Signer &signer);

    /**
     * New PKCS#10 request for the key in handle.slot, following a usage template. Signed
     * with SHA-256; RSA keys use PSS. The handle must name the key being certified.
     */
    IssuanceResult<cert::CertificationRequest> create_signing_request(const cert::DistinguishedName &subject,
                                                                      const cert::PublicKeyInfo &public_key,
                                                                      cert::RequestTemplate type,
                                                                      const sign::SigningKeyHandle &handle,
                                                                      sign::Signer &signer);

} // namespace slotca
