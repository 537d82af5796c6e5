#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <slotca/cert/authority_linkage.hpp>
#include <slotca/cert/certificate.hpp>
#include <slotca/cert/extension_policy.hpp>
#include <slotca/hash/digest.hpp>
#include <slotca/issuance_error.hpp>
#include <slotca/sign/signature_scheme.hpp>
#include <slotca/sign/signer.hpp>

namespace slotca::cert {

    enum class DraftState { Draft, ExtensionsApplied, ToBeSignedEncoded, Signed, Finalized, Aborted };

    const char *draft_state_name(DraftState state);

    // Extensions of one certificate, one slot each, emitted in member order.
    struct ExtensionSet {
        std::optional<RawExtension> key_usage;
        std::optional<RawExtension> extended_key_usage;
        std::optional<RawExtension> authority_key_identifier;
        std::optional<RawExtension> authority_info_access;
        std::optional<RawExtension> crl_distribution_points;
        std::optional<RawExtension> basic_constraints;
        std::optional<RawExtension> subject_key_identifier;

        static ExtensionSet merge(const FilteredExtensions &filtered, const AuthorityLinkage &linkage);

        [[nodiscard]] std::vector<RawExtension> ordered() const;
    };

    /**
     * One issuance in progress:
     *
     *   Draft -> ExtensionsApplied -> ToBeSignedEncoded -> Signed -> Finalized
     *
     * Subject, key, issuer, serial and validity are fixed by create(). Each step only runs
     * from the state before it. A failing or out-of-order step moves the draft to Aborted,
     * drops everything built so far and returns the error with the step that failed.
     * Finalized and Aborted are terminal.
     */
    class CertificateDraft {
      public:
        static IssuanceResult<CertificateDraft> create(DistinguishedName subject, PublicKeyInfo public_key,
                                                      DistinguishedName issuer, uint32_t validity_days,
                                                      std::chrono::system_clock::time_point now =
                                                          std::chrono::system_clock::now());

        std::optional<IssuanceError> apply_extensions(ExtensionSet extensions);
        std::optional<IssuanceError> encode_to_be_signed(const sign::SigningKeyHandle &handle,
                                                         const sign::SignatureScheme &scheme,
                                                         std::string_view digest_name);
        std::optional<IssuanceError> sign(sign::Signer &signer, const sign::SigningKeyHandle &handle);
        IssuanceResult<Certificate> finalize();

        void abort(IssuanceError error);

        [[nodiscard]] DraftState state() const noexcept { return state_; }
        [[nodiscard]] const std::optional<IssuanceError> &abort_reason() const noexcept { return abort_reason_; }

        [[nodiscard]] const std::vector<uint8_t> &serial_number() const noexcept { return tbs_.serial_number; }
        [[nodiscard]] const Validity &validity() const noexcept { return tbs_.validity; }
        [[nodiscard]] const DistinguishedName &subject() const noexcept { return tbs_.subject; }
        [[nodiscard]] const DistinguishedName &issuer() const noexcept { return tbs_.issuer; }
        [[nodiscard]] const std::vector<RawExtension> &extensions() const noexcept { return tbs_.extensions; }
        [[nodiscard]] const std::vector<uint8_t> &tbs_der() const noexcept { return tbs_der_; }

        CertificateDraft() = default;

      private:
        std::optional<IssuanceError> expect_state(DraftState expected, Stage step);
        IssuanceError fail(ErrorCode code, Stage step, std::string message);

        DraftState state_{DraftState::Draft};
        std::optional<IssuanceError> abort_reason_;
        TbsCertificate tbs_;
        std::optional<sign::SignatureScheme> scheme_;
        hash::Algorithm digest_{hash::Algorithm::SHA256};
        std::vector<uint8_t> signature_algorithm_;
        std::vector<uint8_t> tbs_der_;
        std::vector<uint8_t> signature_;
    };

    // 16 CSPRNG bytes with the top bit cleared so the INTEGER stays positive.
    std::vector<uint8_t> generate_serial_number();

    // Longest validity starting at `now` whose notAfter stays within both the clock's range and
    // the GeneralizedTime limit of 9999-12-31T23:59:59Z.
    uint32_t max_validity_days(std::chrono::system_clock::time_point now);

} // namespace slotca::cert
