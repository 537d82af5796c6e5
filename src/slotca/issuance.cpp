#include <slotca/issuance.hpp>

#include <chrono>
#include <string>

#include <spdlog/spdlog.h>

#include <slotca/cert/certificate_assembler.hpp>
#include <slotca/cert/extensions.hpp>
#include <slotca/hash/digest.hpp>

namespace slotca {

    namespace {

        using CertificateResult = IssuanceResult<cert::Certificate>;

        CertificateResult reject(IssuanceError error) {
            spdlog::error("[Issuance] {}", error.to_string());
            return CertificateResult::failure(std::move(error));
        }

        std::optional<IssuanceError> check_common(uint32_t validity_days, const std::string &digest) {
            if (validity_days == 0) {
                return IssuanceError{ErrorCode::InvalidConfiguration, Stage::Draft, "validity_days must be positive"};
            }
            if (validity_days > cert::max_validity_days(std::chrono::system_clock::now())) {
                return IssuanceError{ErrorCode::InvalidConfiguration, Stage::Draft,
                                     "validity_days of " + std::to_string(validity_days) + " is out of range"};
            }
            if (!hash::algorithm_from_name(digest)) {
                return IssuanceError{ErrorCode::UnsupportedDigest, Stage::Draft,
                                     "unsupported digest algorithm '" + digest + "'"};
            }
            return std::nullopt;
        }

        std::optional<IssuanceError> check_handle(const sign::SigningKeyHandle &handle,
                                                  const cert::PublicKeyInfo &expected, const char *owner) {
            if (handle.algorithm == cert::KeyAlgorithm::Unknown) {
                return IssuanceError{ErrorCode::UnsupportedAlgorithm, Stage::Draft, "signing key algorithm unknown"};
            }
            if (handle.algorithm != expected.algorithm || handle.key_size_bits != expected.key_size_bits) {
                return IssuanceError{ErrorCode::InvalidConfiguration, Stage::Draft,
                                     std::string("signing key in slot does not match the ") + owner + " public key"};
            }
            return std::nullopt;
        }

        // Runs the draft from Draft to Finalized; the draft aborts itself on the first failure.
        CertificateResult run_draft(cert::CertificateDraft &draft, cert::ExtensionSet extensions,
                                    const sign::SigningKeyHandle &handle, const sign::SignatureScheme &scheme,
                                    const std::string &digest, sign::Signer &signer) {
            if (auto err = draft.apply_extensions(std::move(extensions))) {
                return CertificateResult::failure(*err);
            }
            if (auto err = draft.encode_to_be_signed(handle, scheme, digest)) {
                return CertificateResult::failure(*err);
            }
            if (auto err = draft.sign(signer, handle)) {
                return CertificateResult::failure(*err);
            }
            return draft.finalize();
        }

    } // namespace

    std::optional<IssuanceError> IssuanceConfig::validate() const {
        if (auto err = check_common(validity_days, digest)) {
            return err;
        }
        if (auto problem = policy.validate()) {
            return IssuanceError{ErrorCode::InvalidConfiguration, Stage::Draft, *problem};
        }
        if (linkage.authority_access_url && linkage.authority_access_url->empty()) {
            return IssuanceError{ErrorCode::InvalidConfiguration, Stage::Draft, "authority access URL is empty"};
        }
        if (linkage.crl_distribution_url && linkage.crl_distribution_url->empty()) {
            return IssuanceError{ErrorCode::InvalidConfiguration, Stage::Draft, "CRL distribution URL is empty"};
        }
        return std::nullopt;
    }

    std::optional<IssuanceError> CaConfig::validate() const { return check_common(validity_days, digest); }

    IssuanceResult<cert::Certificate> issue_certificate(const cert::SigningRequest &request,
                                                        const cert::IssuerContext &issuer,
                                                        const IssuanceConfig &config,
                                                        const sign::SigningKeyHandle &handle, sign::Signer &signer) {
        if (auto err = config.validate()) {
            return reject(std::move(*err));
        }
        if (request.subject.empty()) {
            return reject({ErrorCode::InvalidRequest, Stage::Draft, "signing request has no subject"});
        }
        if (request.public_key.empty()) {
            return reject({ErrorCode::InvalidRequest, Stage::Draft, "signing request has no public key"});
        }
        if (auto err = check_handle(handle, issuer.public_key, "issuer")) {
            return reject(std::move(*err));
        }
        auto scheme = sign::scheme_for(handle.algorithm, config.rsa_padding, config.pss_salt_length);
        if (!scheme) {
            return reject({ErrorCode::UnsupportedAlgorithm, Stage::Draft, "no signature scheme for signing key"});
        }

        spdlog::info("[Issuance] Signing request for {}", request.subject.to_string());
        spdlog::info("[Issuance] Requester public key sha256 {}", cert::public_key_fingerprint(request.public_key));

        auto filtered = cert::filter_extensions(request.requested_extensions, config.policy);
        auto linkage = cert::build_authority_linkage(issuer, config.linkage);

        auto draft = cert::CertificateDraft::create(request.subject, request.public_key, issuer.subject,
                                                    config.validity_days);
        if (!draft.success) {
            return reject(std::move(draft.error));
        }
        return run_draft(draft.value, cert::ExtensionSet::merge(filtered, linkage), handle, *scheme, config.digest,
                         signer);
    }

    IssuanceResult<cert::Certificate> issue_certificate(cert::ByteSpan csr_der, cert::ByteSpan issuer_der,
                                                        const IssuanceConfig &config,
                                                        const sign::SigningKeyHandle &handle, sign::Signer &signer) {
        auto request = cert::parse_signing_request(csr_der);
        if (!request.success) {
            return reject({ErrorCode::InvalidRequest, Stage::Draft, "CSR: " + request.error});
        }
        auto issuer = cert::IssuerContext::from_certificate(issuer_der);
        if (!issuer.success) {
            return reject({ErrorCode::InvalidConfiguration, Stage::Draft, issuer.error});
        }
        return issue_certificate(request.value, issuer.value, config, handle, signer);
    }

    IssuanceResult<cert::Certificate> create_self_signed_ca(const cert::DistinguishedName &subject,
                                                            const cert::PublicKeyInfo &public_key,
                                                            const CaConfig &config,
                                                            const sign::SigningKeyHandle &handle,
                                                            sign::Signer &signer) {
        if (auto err = config.validate()) {
            return reject(std::move(*err));
        }
        if (subject.empty()) {
            return reject({ErrorCode::InvalidRequest, Stage::Draft, "CA subject is empty"});
        }
        if (public_key.empty()) {
            return reject({ErrorCode::InvalidRequest, Stage::Draft, "CA public key missing"});
        }
        if (auto err = check_handle(handle, public_key, "CA")) {
            return reject(std::move(*err));
        }
        auto scheme = sign::scheme_for(handle.algorithm, config.rsa_padding, config.pss_salt_length);
        if (!scheme) {
            return reject({ErrorCode::UnsupportedAlgorithm, Stage::Draft, "no signature scheme for signing key"});
        }

        spdlog::warn("[Issuance] Creating self-signed CA certificate in slot {:#04x} for {}, valid {} days",
                     handle.slot, subject.to_string(), config.validity_days);
        spdlog::info("[Issuance] Public key sha256 {}", cert::public_key_fingerprint(public_key));

        const uint16_t usage =
            cert::key_usage::KeyCertSign | cert::key_usage::CRLSign | cert::key_usage::DigitalSignature;
        spdlog::info("[Issuance] Key usage: {}", cert::key_usage::describe(usage));
        const auto key_id = cert::compute_subject_key_identifier(public_key);

        cert::ExtensionSet extensions{};
        extensions.key_usage = cert::make_extension(cert::ExtensionId::KeyUsage, true, cert::encode_key_usage(usage));
        extensions.authority_key_identifier = cert::make_extension(cert::ExtensionId::AuthorityKeyIdentifier, false,
                                                                   cert::encode_authority_key_identifier(key_id));
        extensions.basic_constraints = cert::make_extension(cert::ExtensionId::BasicConstraints, true,
                                                            cert::encode_basic_constraints(true, config.path_length));
        extensions.subject_key_identifier = cert::make_extension(cert::ExtensionId::SubjectKeyIdentifier, false,
                                                                 cert::encode_key_identifier(key_id));

        auto draft = cert::CertificateDraft::create(subject, public_key, subject, config.validity_days);
        if (!draft.success) {
            return reject(std::move(draft.error));
        }
        return run_draft(draft.value, std::move(extensions), handle, *scheme, config.digest, signer);
    }

    IssuanceResult<cert::CertificationRequest> create_signing_request(const cert::DistinguishedName &subject,
                                                                      const cert::PublicKeyInfo &public_key,
                                                                      cert::RequestTemplate type,
                                                                      const sign::SigningKeyHandle &handle,
                                                                      sign::Signer &signer) {
        using RequestResult = IssuanceResult<cert::CertificationRequest>;
        auto refuse = [](IssuanceError error) {
            spdlog::error("[Issuance] {}", error.to_string());
            return RequestResult::failure(std::move(error));
        };

        if (auto err = check_handle(handle, public_key, "request")) {
            return refuse(std::move(*err));
        }
        auto scheme = sign::scheme_for(handle.algorithm, sign::RsaPadding::Pss);
        if (!scheme) {
            return refuse({ErrorCode::UnsupportedAlgorithm, Stage::Draft, "no signature scheme for signing key"});
        }

        spdlog::info("[Issuance] Creating certificate request with usage: {}", cert::request_template_name(type));
        spdlog::info("[Issuance] Public key sha256 {}", cert::public_key_fingerprint(public_key));
        spdlog::info("[Issuance] Key usage: {}", cert::key_usage::describe(cert::key_usage::DigitalSignature));

        cert::CsrBuilder builder;
        builder.set_subject(subject).set_subject_public_key(public_key).apply_template(type);
        auto built = builder.build(handle, *scheme, "SHA256", signer);
        if (!built.success) {
            return refuse(std::move(built.error));
        }
        return built;
    }

} // namespace slotca
